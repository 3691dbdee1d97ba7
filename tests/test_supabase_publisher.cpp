#include <gtest/gtest.h>

#include "backend/supabase_publisher.hpp"
#include "common/errors.hpp"
#include "fakes.hpp"

using namespace sorter;
using namespace sorter::fakes;
using nlohmann::json;

namespace {

backend_options test_options()
{
    return backend_options{"https://project.example/", "service-key", "kiosk 1"};
}

publication sample_item(std::optional<double> confidence)
{
    publication item;
    item.kind = category::bottle;
    item.confidence = confidence;
    item.raw_payload = {{"recognized_category_id", 2}, {"source", "edge-device"}};
    return item;
}

} // namespace

TEST(SupabasePublisherTest, ResolvesSessionThroughDeviceLabel)
{
    fake_http_client http;
    http.on("/rest/v1/edge_devices", 200, R"([{"id":"dev-1"}])");
    http.on("/rest/v1/sessions", 200, R"([{"id":"sess-9"}])");

    supabase_publisher publisher(http, test_options());
    EXPECT_EQ(publisher.active_session_id(), std::optional<std::string>("sess-9"));

    ASSERT_EQ(http.requests.size(), 2u);
    EXPECT_EQ(http.requests[0].method, "GET");
    EXPECT_EQ(http.requests[0].url,
              "https://project.example/rest/v1/edge_devices?select=id&limit=1&label=eq.kiosk%201");
    EXPECT_NE(http.requests[1].url.find("status=eq.active"), std::string::npos);
    EXPECT_NE(http.requests[1].url.find("order=started_at.desc"), std::string::npos);
    EXPECT_NE(http.requests[1].url.find("edge_device_id=eq.dev-1"), std::string::npos);
}

TEST(SupabasePublisherTest, PostsRecordItem)
{
    fake_http_client http;
    http.on("/rest/v1/edge_devices", 200, R"([{"id":"dev-1"}])");
    http.on("/rest/v1/sessions", 200, R"([{"id":"sess-9"}])");
    http.on("/functions/v1/record-item", 200, R"({"ok":true})");

    supabase_publisher publisher(http, test_options());
    EXPECT_TRUE(publisher.publish(sample_item(0.77)));

    ASSERT_EQ(http.requests.size(), 3u);
    const http_request& post = http.requests[2];
    EXPECT_EQ(post.method, "POST");
    EXPECT_EQ(post.url, "https://project.example/functions/v1/record-item");

    bool bearer = false;
    for (const auto& header : post.headers) {
        bearer = bearer || header == "Authorization: Bearer service-key";
    }
    EXPECT_TRUE(bearer);

    json body = json::parse(post.body);
    EXPECT_EQ(body["sessionId"], "sess-9");
    EXPECT_EQ(body["categorySlug"], "bottle");
    EXPECT_DOUBLE_EQ(body["confidence"].get<double>(), 0.77);
    EXPECT_EQ(body["rawPayload"]["source"], "edge-device");
    EXPECT_EQ(body["clientRef"].get<std::string>().size(), 36u);
}

TEST(SupabasePublisherTest, MissingConfidenceIsNull)
{
    fake_http_client http;
    http.on("/rest/v1/edge_devices", 200, R"([{"id":"dev-1"}])");
    http.on("/rest/v1/sessions", 200, R"([{"id":"sess-9"}])");
    http.on("/functions/v1/record-item", 201, "{}");

    supabase_publisher publisher(http, test_options());
    EXPECT_TRUE(publisher.publish(sample_item(std::nullopt)));
    EXPECT_TRUE(json::parse(http.requests.back().body)["confidence"].is_null());
}

TEST(SupabasePublisherTest, SkipsWithoutDeviceOrSession)
{
    fake_http_client no_device;
    no_device.on("/rest/v1/edge_devices", 200, "[]");
    supabase_publisher first(no_device, test_options());
    EXPECT_FALSE(first.publish(sample_item(0.5)));
    EXPECT_EQ(no_device.requests.size(), 1u);

    fake_http_client no_session;
    no_session.on("/rest/v1/edge_devices", 200, R"([{"id":"dev-1"}])");
    no_session.on("/rest/v1/sessions", 200, "[]");
    supabase_publisher second(no_session, test_options());
    EXPECT_FALSE(second.publish(sample_item(0.5)));
    EXPECT_EQ(no_session.requests.size(), 2u);
}

TEST(SupabasePublisherTest, FailuresRaisePublishError)
{
    fake_http_client lookup_down;
    lookup_down.fail("/rest/v1/edge_devices");
    EXPECT_THROW(supabase_publisher(lookup_down, test_options()).publish(sample_item(0.5)), publish_error);

    fake_http_client rejected;
    rejected.on("/rest/v1/edge_devices", 200, R"([{"id":"dev-1"}])");
    rejected.on("/rest/v1/sessions", 200, R"([{"id":"sess-9"}])");
    rejected.on("/functions/v1/record-item", 500, "boom");
    EXPECT_THROW(supabase_publisher(rejected, test_options()).publish(sample_item(0.5)), publish_error);

    fake_http_client garbled;
    garbled.on("/rest/v1/edge_devices", 200, R"({"id":"dev-1"})");
    EXPECT_THROW(supabase_publisher(garbled, test_options()).publish(sample_item(0.5)), publish_error);
}

TEST(SupabasePublisherTest, ClientRefsAreUnique)
{
    EXPECT_NE(supabase_publisher::new_client_ref(), supabase_publisher::new_client_ref());
}
