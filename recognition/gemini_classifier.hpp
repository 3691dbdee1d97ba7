#pragma once

#include <string>

#include "classifier.hpp"
#include "../net/http_client.hpp"

namespace sorter {

struct gemini_classifier_options {
    std::string api_key;
    std::string model = "gemini-flash-latest";
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta";
};

/**
 * @brief Prompted vision-language classifier (Gemini generateContent)
 *
 * The reply is constrained by a response schema and must contain
 * recognized_category (string) and recognized_category_id (1..3).
 */
class gemini_classifier : public iclassifier {
public:
    gemini_classifier(ihttp_client& http, gemini_classifier_options options);

    classifier_verdict classify(const std::vector<uint8_t>& jpeg) override;

    std::string name() const override { return "gemini"; }

    /**
     * @brief Validate the generated JSON text and turn it into a verdict
     *
     * @throws classification_service_error when empty or off-schema
     */
    static classifier_verdict parse_reply_text(const std::string& text);

private:
    nlohmann::json build_body(const std::vector<uint8_t>& jpeg) const;

    ihttp_client& m_http;
    gemini_classifier_options m_options;
};

} // namespace sorter
