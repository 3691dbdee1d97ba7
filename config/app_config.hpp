#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace sorter {

/**
 * @brief Process configuration, built once at startup and passed down
 *
 * Layers, later wins: defaults, JSON file, environment, command line.
 */
struct app_config {
    // camera
    std::string camera = "/dev/video0";   // device node or numeric index
    unsigned int width = 640;
    unsigned int height = 480;
    int fps = 30;
    unsigned int pixel_format = 0;         // V4L2 fourcc, 0 keeps the driver default

    // serial
    std::string serial_port;               // empty = auto-detect
    int baud = 9600;

    // cycle
    int poll_interval_ms = 50;
    size_t max_cycles = 0;
    bool retry_enabled = true;
    int http_timeout_s = 30;

    // classifier A
    std::string detection_url;
    std::string detection_api_key;
    std::string detection_mode = "model"; // "model" or "workflow"

    // classifier B
    std::string gemini_api_key;
    std::string gemini_model = "gemini-flash-latest";

    // backend
    std::string backend_url;
    std::string backend_key;
    std::string device_label = "demo_kiosk";

    // logging
    int verbose = 0;
    std::string log_file = "logs/recycle_sorter.log";
};

using env_lookup = std::function<const char*(const char*)>;

/**
 * @brief Overlay values from a JSON object file, keys match the field names
 *
 * @throws configuration_error when the file is missing, malformed or has wrong types
 */
void apply_config_file(app_config& config, const std::string& path);

/**
 * @brief Overlay credentials and device overrides from the environment
 */
void apply_environment(app_config& config, const env_lookup& lookup);

/**
 * @brief "MJPG"/"MJPEG" or "YUYV" to a V4L2 fourcc
 *
 * @throws configuration_error for anything else
 */
unsigned int parse_pixel_format(const std::string& name);

/**
 * @brief Camera identifier to device node: "/dev/videoN" stays, "N" becomes "/dev/videoN"
 *
 * @throws configuration_error when it is neither a path nor a non-negative index
 */
std::string camera_device_path(const std::string& camera);

/**
 * @brief Reject configurations the sorter cannot start with
 *
 * @throws configuration_error listing every missing credential
 */
void validate(const app_config& config);

} // namespace sorter
