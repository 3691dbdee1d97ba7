#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sorter {

struct prediction {
    std::string label;
    double confidence = 0.0;
};

/**
 * @brief Highest-confidence prediction anywhere in a detection response
 *
 * Depth-first walk over arrays and objects. An object is a prediction when
 * it has a string label ("class", "label" or "class_name") and a numeric
 * "confidence". Ties keep the first one found.
 */
std::optional<prediction> find_best_prediction(const nlohmann::json& node);

} // namespace sorter
