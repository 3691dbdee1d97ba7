#include "category.hpp"

#include <algorithm>
#include <cctype>

namespace sorter {

int category_id(category c)
{
    return static_cast<int>(c);
}

std::string category_slug(category c)
{
    switch (c) {
        case category::can:    return "can";
        case category::bottle: return "bottle";
        case category::garbage: break;
    }
    return "garbage";
}

bool category_from_id(int id, category& out)
{
    switch (id) {
        case 1: out = category::can; return true;
        case 2: out = category::bottle; return true;
        case 3: out = category::garbage; return true;
        default: return false;
    }
}

category category_from_label(const std::string& label)
{
    std::string lowered(label);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered.find("can") != std::string::npos) {
        return category::can;
    }
    if (lowered.find("bottle") != std::string::npos) {
        return category::bottle;
    }
    return category::garbage;
}

std::string to_string(agreement a)
{
    switch (a) {
        case agreement::both_agreed:        return "both_agreed";
        case agreement::retry_agreed:       return "retry_agreed";
        case agreement::tie_break:          return "tie_break";
        case agreement::single_source_only: return "single_source_only";
        case agreement::both_failed:        return "both_failed";
    }
    return "unknown";
}

} // namespace sorter
