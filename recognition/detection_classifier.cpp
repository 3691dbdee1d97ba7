#include "detection_classifier.hpp"

#include <spdlog/spdlog.h>

#include "prediction_search.hpp"
#include "../common/errors.hpp"
#include "../net/encoding.hpp"

namespace sorter {

detection_classifier::detection_classifier(ihttp_client& http, detection_classifier_options options)
    : m_http(http), m_options(std::move(options))
{
}

http_request detection_classifier::build_request(const std::vector<uint8_t>& jpeg) const
{
    http_request request;
    request.method = "POST";

    if (m_options.mode == detection_mode::model) {
        request.url = m_options.endpoint + "?api_key=" + url_escape(m_options.api_key);
        request.headers.push_back("Content-Type: application/x-www-form-urlencoded");
        request.body = base64_encode(jpeg);
    } else {
        nlohmann::json body = {
            {"api_key", m_options.api_key},
            {"inputs", {{"image", {{"type", "base64"}, {"value", base64_encode(jpeg)}}}}},
        };
        request.url = m_options.endpoint;
        request.headers.push_back("Content-Type: application/json");
        request.body = body.dump();
    }
    return request;
}

classifier_verdict detection_classifier::classify(const std::vector<uint8_t>& jpeg)
{
    http_response response;
    try {
        response = m_http.send(build_request(jpeg));
    } catch (const http_error& e) {
        throw classification_service_error(std::string("detection request failed: ") + e.what());
    }

    if (!response.ok()) {
        throw classification_service_error("detection service returned HTTP " + std::to_string(response.status)
                                           + ": " + response.body.substr(0, 200));
    }

    nlohmann::json reply = nlohmann::json::parse(response.body, nullptr, false);
    if (reply.is_discarded()) {
        throw classification_service_error("detection service returned invalid JSON");
    }

    std::optional<prediction> best = find_best_prediction(reply);
    if (!best) {
        throw classification_service_error("detection service returned no predictions");
    }

    classifier_verdict verdict;
    verdict.kind = category_from_label(best->label);
    verdict.label = best->label;
    verdict.confidence = best->confidence;
    verdict.raw = {{"label", best->label}, {"confidence", best->confidence}};

    spdlog::debug("[detection] {} ({:.3f}) -> {}", best->label, best->confidence, category_slug(verdict.kind));
    return verdict;
}

} // namespace sorter
