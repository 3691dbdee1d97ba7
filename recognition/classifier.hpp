#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../common/category.hpp"

namespace sorter {

/**
 * @brief Answer of a single classifier call
 */
struct classifier_verdict {
    category kind = category::garbage;
    std::string label;
    std::optional<double> confidence;
    nlohmann::json raw;     // service response, forwarded to the backend
};

/**
 * @brief One vision classification service
 */
class iclassifier {
public:
    virtual ~iclassifier() = default;

    /**
     * @brief Classify a JPEG image
     *
     * @throws classification_service_error (or any std::exception) on failure
     */
    virtual classifier_verdict classify(const std::vector<uint8_t>& jpeg) = 0;

    virtual std::string name() const = 0;
};

} // namespace sorter
