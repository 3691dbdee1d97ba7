#include "prediction_search.hpp"

namespace sorter {

namespace {

const char* const kLabelKeys[] = {"class", "label", "class_name"};

std::optional<prediction> as_prediction(const nlohmann::json& object)
{
    auto conf = object.find("confidence");
    if (conf == object.end() || !conf->is_number()) {
        return std::nullopt;
    }
    for (const char* key : kLabelKeys) {
        auto label = object.find(key);
        if (label != object.end() && label->is_string()) {
            return prediction{label->get<std::string>(), conf->get<double>()};
        }
    }
    return std::nullopt;
}

void visit(const nlohmann::json& node, std::optional<prediction>& best)
{
    if (node.is_object()) {
        std::optional<prediction> here = as_prediction(node);
        if (here && (!best || here->confidence > best->confidence)) {
            best = here;
        }
        for (const auto& child : node) {
            visit(child, best);
        }
    } else if (node.is_array()) {
        for (const auto& child : node) {
            visit(child, best);
        }
    }
    // leaves carry nothing
}

} // namespace

std::optional<prediction> find_best_prediction(const nlohmann::json& node)
{
    std::optional<prediction> best;
    visit(node, best);
    return best;
}

} // namespace sorter
