#include "supabase_publisher.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include "../common/errors.hpp"
#include "../net/encoding.hpp"

namespace sorter {

supabase_publisher::supabase_publisher(ihttp_client& http, backend_options options)
    : m_http(http), m_options(std::move(options))
{
    while (!m_options.base_url.empty() && m_options.base_url.back() == '/') {
        m_options.base_url.pop_back();
    }
}

std::string supabase_publisher::new_client_ref()
{
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

void supabase_publisher::add_auth_headers(http_request& request) const
{
    request.headers.push_back("apikey: " + m_options.service_key);
    request.headers.push_back("Authorization: Bearer " + m_options.service_key);
}

nlohmann::json supabase_publisher::get_rows(const std::string& path_and_query)
{
    http_request request;
    request.url = m_options.base_url + path_and_query;
    request.headers.push_back("Accept: application/json");
    add_auth_headers(request);

    http_response response;
    try {
        response = m_http.send(request);
    } catch (const http_error& e) {
        throw publish_error(std::string("session lookup failed: ") + e.what());
    }
    if (!response.ok()) {
        throw publish_error("session lookup returned HTTP " + std::to_string(response.status)
                            + ": " + response.body.substr(0, 200));
    }

    nlohmann::json rows = nlohmann::json::parse(response.body, nullptr, false);
    if (rows.is_discarded() || !rows.is_array()) {
        throw publish_error("session lookup returned unexpected payload");
    }
    return rows;
}

std::optional<std::string> supabase_publisher::active_session_id()
{
    nlohmann::json devices = get_rows("/rest/v1/edge_devices?select=id&limit=1&label=eq."
                                      + url_escape(m_options.device_label));
    if (devices.empty() || !devices[0].contains("id") || !devices[0]["id"].is_string()) {
        spdlog::warn("No edge device registered with label '{}'", m_options.device_label);
        return std::nullopt;
    }
    std::string device_id = devices[0]["id"].get<std::string>();

    nlohmann::json sessions = get_rows("/rest/v1/sessions?select=id&status=eq.active"
                                       "&order=started_at.desc&limit=1&edge_device_id=eq."
                                       + url_escape(device_id));
    if (sessions.empty() || !sessions[0].contains("id") || !sessions[0]["id"].is_string()) {
        return std::nullopt;
    }
    return sessions[0]["id"].get<std::string>();
}

bool supabase_publisher::publish(const publication& item)
{
    std::optional<std::string> session_id = active_session_id();
    if (!session_id) {
        spdlog::info("No active session for '{}', skipping publish", m_options.device_label);
        return false;
    }

    nlohmann::json body = {
        {"sessionId", *session_id},
        {"categorySlug", category_slug(item.kind)},
        {"confidence", nullptr},
        {"rawPayload", item.raw_payload},
        {"clientRef", new_client_ref()},
    };
    if (item.confidence) {
        body["confidence"] = *item.confidence;
    }

    http_request request;
    request.method = "POST";
    request.url = m_options.base_url + "/functions/v1/record-item";
    request.headers.push_back("Content-Type: application/json");
    add_auth_headers(request);
    request.body = body.dump();

    http_response response;
    try {
        response = m_http.send(request);
    } catch (const http_error& e) {
        throw publish_error(std::string("record-item failed: ") + e.what());
    }
    if (!response.ok()) {
        throw publish_error("record-item returned HTTP " + std::to_string(response.status)
                            + ": " + response.body.substr(0, 200));
    }

    spdlog::info("Published {} to session {}", category_slug(item.kind), *session_id);
    return true;
}

} // namespace sorter
