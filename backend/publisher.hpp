#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../common/category.hpp"

namespace sorter {

struct publication {
    category kind = category::garbage;
    std::optional<double> confidence;
    nlohmann::json raw_payload = nlohmann::json::object();
};

/**
 * @brief Records classifications in the backend
 */
class ipublisher {
public:
    virtual ~ipublisher() = default;

    /**
     * @return false when there is no active session to record into
     * @throws publish_error when the backend could not be reached or refused the item
     */
    virtual bool publish(const publication& item) = 0;
};

} // namespace sorter
