#include "device_state.hpp"

#include <regex>

namespace sorter {

bool parse_state_line(const std::string& line, bool& is_moving, bool& is_triggered)
{
    static const std::regex pattern(R"(^\s*\(?\s*([01])\s*(?:,|\s)\s*([01])\s*\)?\s*$)");

    std::smatch match;
    if (!std::regex_match(line, match, pattern)) {
        return false;
    }

    is_moving = match[1].str() == "1";
    is_triggered = match[2].str() == "1";
    return true;
}

} // namespace sorter
