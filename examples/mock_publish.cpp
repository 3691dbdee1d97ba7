// Publishes mock classifications to the active session, one per Enter key.
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

#include "../backend/supabase_publisher.hpp"
#include "../common/errors.hpp"
#include "../common/clock.hpp"
#include "../config/app_config.hpp"
#include "../net/http_client.hpp"

using namespace sorter;

int main(int argc, char* argv[])
{
    app_config config;
    try {
        if (argc > 1) {
            apply_config_file(config, argv[1]);
        }
        apply_environment(config, [](const char* name) { return std::getenv(name); });
    } catch (const configuration_error& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }
    if (config.backend_url.empty() || config.backend_key.empty()) {
        std::cerr << "SUPABASE_URL and SUPABASE_SERVICE_ROLE_KEY must be set" << std::endl;
        return 2;
    }

    curl_http_client http(std::chrono::seconds(config.http_timeout_s));
    backend_options options;
    options.base_url = config.backend_url;
    options.service_key = config.backend_key;
    options.device_label = config.device_label;
    supabase_publisher publisher(http, options);

    try {
        auto session = publisher.active_session_id();
        if (session) {
            spdlog::info("Active session detected: {}", *session);
        } else {
            spdlog::warn("No active session detected. Start a session in the dashboard before pushing events.");
        }
    } catch (const publish_error& e) {
        spdlog::error("Session lookup failed: {}", e.what());
    }

    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> pick(1, 3);

    std::cout << "Press Enter to publish a mock classification, 'q' to quit." << std::endl;
    std::string input;
    int sequence = 1;
    while (std::getline(std::cin, input)) {
        if (input == "q" || input == "quit" || input == "exit") {
            break;
        }

        category kind = category::garbage;
        if (!category_from_id(pick(rng), kind)) {
            continue;
        }

        publication item;
        item.kind = kind;
        item.raw_payload = {
            {"recognized_category_id", category_id(kind)},
            {"source", "edge-test-script"},
            {"mock_sequence", sequence},
            {"generated_at_us", now_us()},
        };

        try {
            if (publisher.publish(item)) {
                spdlog::info("Published mock classification #{} ({})", sequence, category_slug(kind));
            } else {
                spdlog::warn("Nothing published, no active session");
            }
        } catch (const publish_error& e) {
            spdlog::error("Publish failed: {}", e.what());
        }
        ++sequence;
    }
    return 0;
}
