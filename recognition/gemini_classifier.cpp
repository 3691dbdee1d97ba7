#include "gemini_classifier.hpp"

#include <cstdint>

#include <spdlog/spdlog.h>

#include "../common/errors.hpp"
#include "../net/encoding.hpp"

namespace sorter {

namespace {

const char kSystemInstruction[] =
    "You are an image recognition software, designed to recognize the objects presented "
    "to be placed in the following categories. Of the below 3 categories, return a category ID "
    "and category name of the recognized object.\n"
    "Categories:\n"
    "1 - Cans\n"
    "2 - Bottles\n"
    "3 - Garbage\n"
    "Only recognize and categorize the primary object presented. "
    "If the primary object is not cans or bottles, it is garbage.";

const char kUserPrompt[] = "Please identify the primary object in this image and classify it.";

std::string trim(const std::string& text)
{
    const char* blanks = " \t\r\n";
    size_t begin = text.find_first_not_of(blanks);
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = text.find_last_not_of(blanks);
    return text.substr(begin, end - begin + 1);
}

} // namespace

gemini_classifier::gemini_classifier(ihttp_client& http, gemini_classifier_options options)
    : m_http(http), m_options(std::move(options))
{
}

nlohmann::json gemini_classifier::build_body(const std::vector<uint8_t>& jpeg) const
{
    nlohmann::json schema = {
        {"type", "OBJECT"},
        {"required", {"recognized_category", "recognized_category_id"}},
        {"properties", {
            {"recognized_category", {{"type", "STRING"}}},
            {"recognized_category_id", {{"type", "INTEGER"}}},
        }},
    };

    return {
        {"system_instruction", {{"parts", {{{"text", kSystemInstruction}}}}}},
        {"contents", {{
            {"role", "user"},
            {"parts", {
                {{"text", kUserPrompt}},
                {{"inline_data", {{"mime_type", "image/jpeg"}, {"data", base64_encode(jpeg)}}}},
            }},
        }}},
        {"generationConfig", {
            {"responseMimeType", "application/json"},
            {"responseSchema", schema},
            {"thinkingConfig", {{"thinkingBudget", 0}}},
        }},
    };
}

classifier_verdict gemini_classifier::classify(const std::vector<uint8_t>& jpeg)
{
    http_request request;
    request.method = "POST";
    request.url = m_options.base_url + "/models/" + m_options.model + ":generateContent";
    request.headers.push_back("Content-Type: application/json");
    request.headers.push_back("x-goog-api-key: " + m_options.api_key);
    request.body = build_body(jpeg).dump();

    http_response response;
    try {
        response = m_http.send(request);
    } catch (const http_error& e) {
        throw classification_service_error(std::string("gemini request failed: ") + e.what());
    }

    if (!response.ok()) {
        throw classification_service_error("gemini returned HTTP " + std::to_string(response.status)
                                           + ": " + response.body.substr(0, 200));
    }

    nlohmann::json reply = nlohmann::json::parse(response.body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw classification_service_error("gemini returned invalid JSON envelope");
    }

    // candidates[0].content.parts[*].text
    std::string text;
    auto candidates = reply.find("candidates");
    if (candidates != reply.end() && candidates->is_array() && !candidates->empty()
        && (*candidates)[0].is_object()) {
        const nlohmann::json& first = (*candidates)[0];
        auto content = first.find("content");
        if (content != first.end() && content->is_object()) {
            auto parts = content->find("parts");
            if (parts != content->end() && parts->is_array()) {
                for (const auto& part : *parts) {
                    if (part.is_object() && part.contains("text") && part["text"].is_string()) {
                        text += part["text"].get<std::string>();
                    }
                }
            }
        }
    }

    return parse_reply_text(text);
}

classifier_verdict gemini_classifier::parse_reply_text(const std::string& text)
{
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        throw classification_service_error("gemini response was empty");
    }

    nlohmann::json parsed = nlohmann::json::parse(trimmed, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw classification_service_error("gemini response is not a JSON object: " + trimmed.substr(0, 200));
    }

    auto name = parsed.find("recognized_category");
    auto id = parsed.find("recognized_category_id");
    if (name == parsed.end() || !name->is_string()) {
        throw classification_service_error("gemini response lacks recognized_category");
    }
    if (id == parsed.end() || !id->is_number_integer()) {
        throw classification_service_error("gemini response lacks an integer recognized_category_id");
    }

    int64_t raw_id = id->get<int64_t>();
    classifier_verdict verdict;
    if (raw_id < 1 || raw_id > 3 || !category_from_id(static_cast<int>(raw_id), verdict.kind)) {
        throw classification_service_error("gemini returned unknown category id " + id->dump());
    }
    verdict.label = name->get<std::string>();
    verdict.raw = parsed;

    spdlog::debug("[gemini] {} -> {}", verdict.label, category_slug(verdict.kind));
    return verdict;
}

} // namespace sorter
