#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "classifier.hpp"
#include "../cameras/buffer.hpp"
#include "../common/category.hpp"

namespace sorter {

struct classification_result {
    category kind = category::garbage;
    agreement how = agreement::both_failed;
    int attempts = 0;
    // detection confidence, only when the detection label decided the result
    std::optional<double> confidence;
    nlohmann::json raw_payload;
};

using frame_supplier = std::function<std::shared_ptr<const buffer>()>;
using frame_encoder = std::function<std::vector<uint8_t>(const buffer&)>;

/**
 * @brief Cross-checks two classifiers on the same frame
 *
 * Agreement wins immediately and a lone success is trusted. Disagreement
 * or a double failure triggers one retry on a fresh frame. A retry that
 * still disagrees resolves to the secondary classifier, and a retry where
 * both fail resolves to garbage.
 */
class recognition_validator {
public:
    /**
     * @param primary classifier A (detection)
     * @param secondary classifier B (vision-language), wins tie breaks
     * @param encoder frame to JPEG conversion
     * @param retry_enabled allow the single retry
     */
    recognition_validator(iclassifier& primary, iclassifier& secondary,
                          frame_encoder encoder, bool retry_enabled = true);

    /**
     * @param frame captured frame
     * @param supplier source of a fresh frame for the retry, may return nullptr
     */
    classification_result classify(const std::shared_ptr<const buffer>& frame, const frame_supplier& supplier);

private:
    struct attempt {
        std::optional<classifier_verdict> primary;
        std::optional<classifier_verdict> secondary;
        nlohmann::json log;
    };

    attempt run_attempt(const std::shared_ptr<const buffer>& frame);
    std::optional<classifier_verdict> call(iclassifier& classifier, const std::vector<uint8_t>& jpeg,
                                           nlohmann::json& log);
    classification_result finish(category kind, agreement how, const attempt& deciding,
                                 const std::vector<attempt>& attempts) const;

    iclassifier& m_primary;
    iclassifier& m_secondary;
    frame_encoder m_encoder;
    bool m_retry_enabled;
};

} // namespace sorter
