#include "app_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

#include <linux/videodev2.h>
#include <nlohmann/json.hpp>

#include "../common/errors.hpp"
#include "../serial/posix_serial_port.hpp"

namespace sorter {

namespace {

template <typename T>
void read_field(const nlohmann::json& object, const char* key, T& target)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw configuration_error(std::string("Config field '") + key + "' has the wrong type: " + e.what());
    }
}

void read_env(const env_lookup& lookup, const char* name, std::string& target)
{
    const char* value = lookup(name);
    if (value && *value) {
        target = value;
    }
}

bool all_digits(const std::string& text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

} // namespace

void apply_config_file(app_config& config, const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw configuration_error("Cannot open config file " + path);
    }

    nlohmann::json root = nlohmann::json::parse(in, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw configuration_error("Config file " + path + " is not a JSON object");
    }

    read_field(root, "camera", config.camera);
    read_field(root, "width", config.width);
    read_field(root, "height", config.height);
    read_field(root, "fps", config.fps);
    if (root.contains("pixel_format") && root["pixel_format"].is_string()) {
        config.pixel_format = parse_pixel_format(root["pixel_format"].get<std::string>());
    }
    read_field(root, "serial_port", config.serial_port);
    read_field(root, "baud", config.baud);
    read_field(root, "poll_interval_ms", config.poll_interval_ms);
    read_field(root, "max_cycles", config.max_cycles);
    read_field(root, "retry_enabled", config.retry_enabled);
    read_field(root, "http_timeout_s", config.http_timeout_s);
    read_field(root, "detection_url", config.detection_url);
    read_field(root, "detection_api_key", config.detection_api_key);
    read_field(root, "detection_mode", config.detection_mode);
    read_field(root, "gemini_api_key", config.gemini_api_key);
    read_field(root, "gemini_model", config.gemini_model);
    read_field(root, "backend_url", config.backend_url);
    read_field(root, "backend_key", config.backend_key);
    read_field(root, "device_label", config.device_label);
    read_field(root, "verbose", config.verbose);
    read_field(root, "log_file", config.log_file);
}

void apply_environment(app_config& config, const env_lookup& lookup)
{
    read_env(lookup, "SORTER_CAMERA", config.camera);
    read_env(lookup, "SORTER_SERIAL_PORT", config.serial_port);
    read_env(lookup, "ROBOFLOW_MODEL_URL", config.detection_url);
    read_env(lookup, "ROBOFLOW_API_KEY", config.detection_api_key);
    read_env(lookup, "ROBOFLOW_MODE", config.detection_mode);
    read_env(lookup, "GEMINI_API_KEY", config.gemini_api_key);
    read_env(lookup, "GEMINI_MODEL", config.gemini_model);
    read_env(lookup, "SUPABASE_URL", config.backend_url);
    read_env(lookup, "SUPABASE_SERVICE_ROLE_KEY", config.backend_key);
    read_env(lookup, "EDGE_DEVICE_LABEL", config.device_label);
}

unsigned int parse_pixel_format(const std::string& name)
{
    if (name == "MJPG" || name == "MJPEG") {
        return V4L2_PIX_FMT_MJPEG;
    }
    if (name == "YUYV") {
        return V4L2_PIX_FMT_YUYV;
    }
    throw configuration_error("Unsupported pixel format: " + name);
}

std::string camera_device_path(const std::string& camera)
{
    if (all_digits(camera)) {
        return "/dev/video" + camera;
    }
    if (camera.rfind("/dev/", 0) == 0 && camera.size() > 5) {
        return camera;
    }
    throw configuration_error("Camera '" + camera + "' is neither a device path nor an index");
}

void validate(const app_config& config)
{
    std::vector<std::string> missing;
    if (config.detection_url.empty())     missing.push_back("ROBOFLOW_MODEL_URL");
    if (config.detection_api_key.empty()) missing.push_back("ROBOFLOW_API_KEY");
    if (config.gemini_api_key.empty())    missing.push_back("GEMINI_API_KEY");
    if (config.backend_url.empty())       missing.push_back("SUPABASE_URL");
    if (config.backend_key.empty())       missing.push_back("SUPABASE_SERVICE_ROLE_KEY");

    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            names += names.empty() ? name : ", " + name;
        }
        throw configuration_error("Missing configuration: " + names);
    }

    camera_device_path(config.camera);

    if (config.detection_mode != "model" && config.detection_mode != "workflow") {
        throw configuration_error("Unknown detection mode '" + config.detection_mode + "'");
    }
    if (!is_supported_baud(config.baud)) {
        throw configuration_error("Unsupported baud rate " + std::to_string(config.baud)
                                  + " (use 9600, 19200, 38400, 57600, 115200 or 230400)");
    }
    if (config.device_label.empty()) {
        throw configuration_error("Device label must not be empty");
    }
    if (config.poll_interval_ms <= 0 || config.http_timeout_s <= 0) {
        throw configuration_error("Poll interval and HTTP timeout must be positive");
    }
}

} // namespace sorter
