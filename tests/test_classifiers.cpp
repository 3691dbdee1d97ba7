#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "fakes.hpp"
#include "recognition/detection_classifier.hpp"
#include "recognition/gemini_classifier.hpp"

using namespace sorter;
using namespace sorter::fakes;
using nlohmann::json;

namespace {

const std::vector<uint8_t> kJpeg = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 0xFF, 0xD9};

std::string gemini_reply(const std::string& text)
{
    json reply = {
        {"candidates", {{
            {"content", {{"role", "model"}, {"parts", {{{"text", text}}}}}},
            {"finishReason", "STOP"},
        }}},
    };
    return reply.dump();
}

bool has_header(const http_request& request, const std::string& header)
{
    for (const auto& h : request.headers) {
        if (h == header) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(DetectionClassifierTest, ModelModePostsBase64FormBody)
{
    fake_http_client http;
    http.on("detect.example", 200, R"({"predictions":[{"class":"Soda Can","confidence":0.93}]})");

    detection_classifier classifier(http, {"https://detect.example/trash/3", "k&y", detection_mode::model});
    classifier_verdict verdict = classifier.classify(kJpeg);

    EXPECT_EQ(verdict.kind, category::can);
    EXPECT_EQ(verdict.label, "Soda Can");
    ASSERT_TRUE(verdict.confidence.has_value());
    EXPECT_DOUBLE_EQ(*verdict.confidence, 0.93);

    ASSERT_EQ(http.requests.size(), 1u);
    const http_request& request = http.requests[0];
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.url, "https://detect.example/trash/3?api_key=k%26y");
    EXPECT_EQ(request.body, "/9j/4AAQ/9k=");
    EXPECT_TRUE(has_header(request, "Content-Type: application/x-www-form-urlencoded"));
}

TEST(DetectionClassifierTest, WorkflowModePostsJsonBody)
{
    fake_http_client http;
    http.on("workflow", 200, R"({"outputs":[{"predictions":{"predictions":[{"class":"PET bottle","confidence":0.7}]}}]})");

    detection_classifier classifier(http, {"https://detect.example/workflow", "secret", detection_mode::workflow});
    classifier_verdict verdict = classifier.classify(kJpeg);
    EXPECT_EQ(verdict.kind, category::bottle);

    json body = json::parse(http.requests.at(0).body);
    EXPECT_EQ(body["api_key"], "secret");
    EXPECT_EQ(body["inputs"]["image"]["type"], "base64");
    EXPECT_EQ(body["inputs"]["image"]["value"], "/9j/4AAQ/9k=");
    EXPECT_EQ(http.requests[0].url, "https://detect.example/workflow");
}

TEST(DetectionClassifierTest, UnknownLabelIsGarbage)
{
    fake_http_client http;
    http.on("detect", 200, R"({"predictions":[{"class":"banana peel","confidence":0.99}]})");

    detection_classifier classifier(http, {"https://detect.example/m/1", "k", detection_mode::model});
    EXPECT_EQ(classifier.classify(kJpeg).kind, category::garbage);
}

TEST(DetectionClassifierTest, FailuresBecomeServiceErrors)
{
    detection_classifier_options options{"https://detect.example/m/1", "k", detection_mode::model};

    fake_http_client empty;
    empty.on("detect", 200, R"({"predictions":[]})");
    EXPECT_THROW(detection_classifier(empty, options).classify(kJpeg), classification_service_error);

    fake_http_client denied;
    denied.on("detect", 403, "forbidden");
    EXPECT_THROW(detection_classifier(denied, options).classify(kJpeg), classification_service_error);

    fake_http_client broken;
    broken.on("detect", 200, "<html>");
    EXPECT_THROW(detection_classifier(broken, options).classify(kJpeg), classification_service_error);

    fake_http_client offline;
    offline.fail("detect");
    EXPECT_THROW(detection_classifier(offline, options).classify(kJpeg), classification_service_error);
}

TEST(GeminiClassifierTest, SendsSchemaConstrainedRequest)
{
    fake_http_client http;
    http.on(":generateContent", 200, gemini_reply(R"({"recognized_category":"Bottles","recognized_category_id":2})"));

    gemini_classifier_options options;
    options.api_key = "g-key";
    gemini_classifier classifier(http, options);
    classifier_verdict verdict = classifier.classify(kJpeg);

    EXPECT_EQ(verdict.kind, category::bottle);
    EXPECT_EQ(verdict.label, "Bottles");
    EXPECT_FALSE(verdict.confidence.has_value());

    const http_request& request = http.requests.at(0);
    EXPECT_EQ(request.url,
              "https://generativelanguage.googleapis.com/v1beta/models/gemini-flash-latest:generateContent");
    EXPECT_TRUE(has_header(request, "x-goog-api-key: g-key"));

    json body = json::parse(request.body);
    EXPECT_EQ(body["generationConfig"]["responseMimeType"], "application/json");
    EXPECT_EQ(body["generationConfig"]["responseSchema"]["properties"]["recognized_category_id"]["type"], "INTEGER");
    EXPECT_EQ(body["contents"][0]["parts"][1]["inline_data"]["mime_type"], "image/jpeg");
    EXPECT_EQ(body["contents"][0]["parts"][1]["inline_data"]["data"], "/9j/4AAQ/9k=");
}

TEST(GeminiClassifierTest, EnvelopeWithoutTextFails)
{
    fake_http_client http;
    http.on("generateContent", 200, R"({"candidates":[{"finishReason":"SAFETY"}]})");
    gemini_classifier classifier(http, gemini_classifier_options());
    EXPECT_THROW(classifier.classify(kJpeg), classification_service_error);
}

TEST(GeminiClassifierTest, HttpErrorFails)
{
    fake_http_client http;
    http.on("generateContent", 429, R"({"error":{"status":"RESOURCE_EXHAUSTED"}})");
    gemini_classifier classifier(http, gemini_classifier_options());
    EXPECT_THROW(classifier.classify(kJpeg), classification_service_error);
}

TEST(GeminiReplyTest, AcceptsWellFormedReply)
{
    classifier_verdict verdict =
        gemini_classifier::parse_reply_text("  {\"recognized_category\": \"Garbage\", \"recognized_category_id\": 3}\n");
    EXPECT_EQ(verdict.kind, category::garbage);
    EXPECT_EQ(verdict.raw["recognized_category_id"], 3);
}

TEST(GeminiReplyTest, RejectsOffSchemaReplies)
{
    const char* const bad[] = {
        "",
        "   ",
        "Cans",
        "[1]",
        R"({"recognized_category":"Cans"})",
        R"({"recognized_category_id":1})",
        R"({"recognized_category":"Cans","recognized_category_id":"1"})",
        R"({"recognized_category":"Cans","recognized_category_id":1.5})",
        R"({"recognized_category":"Cans","recognized_category_id":0})",
        R"({"recognized_category":"Cans","recognized_category_id":4})",
        R"({"recognized_category":"Cans","recognized_category_id":-1})",
        R"({"recognized_category":"Cans","recognized_category_id":4294967297})",
        R"({"recognized_category":"Cans","recognized_category_id":18446744073709551615})",
        R"({"recognized_category":7,"recognized_category_id":1})",
    };
    for (const char* text : bad) {
        EXPECT_THROW(gemini_classifier::parse_reply_text(text), classification_service_error) << text;
    }
}
