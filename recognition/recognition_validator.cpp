#include "recognition_validator.hpp"

#include <spdlog/spdlog.h>

#include "../common/errors.hpp"

namespace sorter {

recognition_validator::recognition_validator(iclassifier& primary, iclassifier& secondary,
                                             frame_encoder encoder, bool retry_enabled)
    : m_primary(primary),
      m_secondary(secondary),
      m_encoder(std::move(encoder)),
      m_retry_enabled(retry_enabled)
{
}

std::optional<classifier_verdict> recognition_validator::call(iclassifier& classifier,
                                                              const std::vector<uint8_t>& jpeg,
                                                              nlohmann::json& log)
{
    try {
        classifier_verdict verdict = classifier.classify(jpeg);
        log[classifier.name()] = {
            {"category_id", category_id(verdict.kind)},
            {"label", verdict.label},
            {"response", verdict.raw},
        };
        return verdict;
    } catch (const std::exception& e) {
        spdlog::warn("Classifier {} failed: {}", classifier.name(), e.what());
        log[classifier.name()] = {{"error", e.what()}};
        return std::nullopt;
    }
}

recognition_validator::attempt recognition_validator::run_attempt(const std::shared_ptr<const buffer>& frame)
{
    attempt result;
    result.log = nlohmann::json::object();

    std::vector<uint8_t> jpeg;
    try {
        if (!frame) {
            throw sorter_error("no frame to classify");
        }
        jpeg = m_encoder(*frame);
    } catch (const std::exception& e) {
        spdlog::warn("Frame encoding failed: {}", e.what());
        result.log["error"] = e.what();
        return result;
    }

    result.primary = call(m_primary, jpeg, result.log);
    result.secondary = call(m_secondary, jpeg, result.log);
    return result;
}

classification_result recognition_validator::finish(category kind, agreement how, const attempt& deciding,
                                                    const std::vector<attempt>& attempts) const
{
    classification_result result;
    result.kind = kind;
    result.how = how;
    result.attempts = static_cast<int>(attempts.size());
    if (deciding.primary && deciding.primary->kind == kind) {
        result.confidence = deciding.primary->confidence;
    }

    nlohmann::json history = nlohmann::json::array();
    for (const auto& a : attempts) {
        history.push_back(a.log);
    }
    result.raw_payload = {
        {"recognized_category_id", category_id(kind)},
        {"agreement", to_string(how)},
        {"attempts", history},
    };

    spdlog::info("Classified as {} ({}, {} attempt{})", category_slug(kind), to_string(how),
                 result.attempts, result.attempts == 1 ? "" : "s");
    return result;
}

classification_result recognition_validator::classify(const std::shared_ptr<const buffer>& frame,
                                                      const frame_supplier& supplier)
{
    std::vector<attempt> attempts;
    attempts.reserve(2);
    attempts.push_back(run_attempt(frame));
    const attempt& first = attempts.back();

    if (first.primary && first.secondary && first.primary->kind == first.secondary->kind) {
        return finish(first.primary->kind, agreement::both_agreed, first, attempts);
    }
    if (first.primary && !first.secondary) {
        return finish(first.primary->kind, agreement::single_source_only, first, attempts);
    }
    if (!first.primary && first.secondary) {
        return finish(first.secondary->kind, agreement::single_source_only, first, attempts);
    }

    if (!m_retry_enabled) {
        if (first.secondary) {
            return finish(first.secondary->kind, agreement::tie_break, first, attempts);
        }
        return finish(category::garbage, agreement::both_failed, first, attempts);
    }

    spdlog::info("Classifiers {}, retrying on a fresh frame", first.primary ? "disagree" : "both failed");

    std::shared_ptr<const buffer> retry_frame;
    if (supplier) {
        retry_frame = supplier();
    }
    if (!retry_frame) {
        retry_frame = frame;
    }

    attempts.push_back(run_attempt(retry_frame));
    const attempt& second = attempts.back();

    if (second.primary && second.secondary) {
        if (second.primary->kind == second.secondary->kind) {
            return finish(second.primary->kind, agreement::retry_agreed, second, attempts);
        }
        return finish(second.secondary->kind, agreement::tie_break, second, attempts);
    }
    if (second.primary) {
        return finish(second.primary->kind, agreement::single_source_only, second, attempts);
    }
    if (second.secondary) {
        return finish(second.secondary->kind, agreement::single_source_only, second, attempts);
    }
    return finish(category::garbage, agreement::both_failed, second, attempts);
}

} // namespace sorter
