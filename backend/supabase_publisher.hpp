#pragma once

#include <optional>
#include <string>

#include "publisher.hpp"
#include "../net/http_client.hpp"

namespace sorter {

struct backend_options {
    std::string base_url;      // project URL, e.g. https://xyz.supabase.co
    std::string service_key;
    std::string device_label;  // edge_devices.label of this sorter
};

/**
 * @brief Publishes to the Supabase "record-item" edge function
 *
 * Every publish first resolves the newest active session attached to this
 * device's label; without one the item is skipped.
 */
class supabase_publisher : public ipublisher {
public:
    supabase_publisher(ihttp_client& http, backend_options options);

    bool publish(const publication& item) override;

    /**
     * @throws publish_error on transport or HTTP failure
     */
    std::optional<std::string> active_session_id();

    // fresh idempotency key for record-item
    static std::string new_client_ref();

private:
    nlohmann::json get_rows(const std::string& path_and_query);
    void add_auth_headers(http_request& request) const;

    ihttp_client& m_http;
    backend_options m_options;
};

} // namespace sorter
