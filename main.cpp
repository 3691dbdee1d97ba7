#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

#include <spdlog/spdlog.h>
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"

#include "backend/supabase_publisher.hpp"
#include "cameras/frame_source.hpp"
#include "cameras/jpeg_encoder.hpp"
#include "cameras/v4l2_camera_device.hpp"
#include "common/errors.hpp"
#include "config/app_config.hpp"
#include "controller/cycle_controller.hpp"
#include "net/http_client.hpp"
#include "recognition/detection_classifier.hpp"
#include "recognition/gemini_classifier.hpp"
#include "recognition/recognition_validator.hpp"
#include "serial/posix_serial_port.hpp"
#include "serial/serial_channel.hpp"

using namespace sorter;

namespace {

std::atomic<bool> g_stop(false);

void on_signal(int)
{
    g_stop = true;
}

} // namespace

// console and file logging, verbosity from -v
static void init_logger(int verbose, const std::string& log_file) {
    if (verbose == 0) {
        spdlog::set_level(spdlog::level::info);
    } else if (verbose == 1) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::trace);
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{console_sink};
    try {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
    } catch (const spdlog::spdlog_ex& e) {
        fprintf(stderr, "Cannot open log file %s: %s\n", log_file.c_str(), e.what());
    }

    auto logger = std::make_shared<spdlog::logger>("sorter", sinks.begin(), sinks.end());
    logger->set_level(spdlog::get_level());
    spdlog::set_default_logger(logger);
}

static void print_usage(const char* prog) {
    printf("Usage: %s [-c config.json] [-d camera] [-G <W>x<H>x<FPS>] [-f MJPG|YUYV]\n"
           "          [-p serial_port] [-b baud] [-x cycles] [-n] [-l log_file] [-v level]\n"
           "  -d  camera device path or index (default /dev/video0)\n"
           "  -p  serial port, auto-detected when omitted\n"
           "  -x  stop after this many sort cycles (default unbounded)\n"
           "  -n  disable the classifier retry\n"
           "Credentials come from GEMINI_API_KEY, ROBOFLOW_API_KEY, ROBOFLOW_MODEL_URL,\n"
           "SUPABASE_URL and SUPABASE_SERVICE_ROLE_KEY.\n"
           "Example: %s -d /dev/video0 -G 1280x720x30 -f MJPG -v 1\n",
           prog, prog);
}

static std::string find_config_path(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0) {
            return argv[i + 1];
        }
    }
    return std::string();
}

static void parse_args(int argc, char* argv[], app_config& config) {
    int opt;
    while ((opt = getopt(argc, argv, "c:d:G:f:p:b:x:nl:v:h")) != -1) {
        switch (opt) {
            case 'c':
                // already applied
                break;
            case 'd':
                config.camera = optarg;
                break;
            case 'G':
                if (sscanf(optarg, "%ux%ux%d", &config.width, &config.height, &config.fps) != 3) {
                    throw configuration_error("Invalid size format. Use: WxHxFPS");
                }
                break;
            case 'f':
                config.pixel_format = parse_pixel_format(optarg);
                break;
            case 'p':
                config.serial_port = optarg;
                break;
            case 'b':
                config.baud = std::atoi(optarg);
                break;
            case 'x':
                config.max_cycles = static_cast<size_t>(std::strtoul(optarg, nullptr, 10));
                break;
            case 'n':
                config.retry_enabled = false;
                break;
            case 'l':
                config.log_file = optarg;
                break;
            case 'v':
                config.verbose = std::atoi(optarg);
                break;
            case 'h':
                print_usage(argv[0]);
                exit(0);
            case '?':
            default:
                print_usage(argv[0]);
                exit(1);
        }
    }
}

int main(int argc, char* argv[]) {
    app_config config;
    try {
        std::string config_path = find_config_path(argc, argv);
        if (!config_path.empty()) {
            apply_config_file(config, config_path);
        }
        apply_environment(config, [](const char* name) { return std::getenv(name); });
        parse_args(argc, argv, config);
        validate(config);
    } catch (const configuration_error& e) {
        fprintf(stderr, "Configuration error: %s\n", e.what());
        return 2;
    }

    init_logger(config.verbose, config.log_file);
    spdlog::info("Starting recycle sorter (device label '{}')", config.device_label);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    curl_http_client http(std::chrono::seconds(config.http_timeout_s));

    detection_classifier_options detection_opts;
    detection_opts.endpoint = config.detection_url;
    detection_opts.api_key = config.detection_api_key;
    detection_opts.mode = config.detection_mode == "workflow" ? detection_mode::workflow : detection_mode::model;
    detection_classifier detection(http, detection_opts);

    gemini_classifier_options gemini_opts;
    gemini_opts.api_key = config.gemini_api_key;
    gemini_opts.model = config.gemini_model;
    gemini_classifier gemini(http, gemini_opts);

    recognition_validator validator(detection, gemini,
                                    [](const buffer& frame) { return encode_jpeg(frame); },
                                    config.retry_enabled);

    backend_options backend_opts;
    backend_opts.base_url = config.backend_url;
    backend_opts.service_key = config.backend_key;
    backend_opts.device_label = config.device_label;
    supabase_publisher publisher(http, backend_opts);

    std::string camera_path = camera_device_path(config.camera);
    frame_source frames([&config, camera_path]() -> std::unique_ptr<icamera_device> {
        return std::make_unique<v4l2_camera_device>(camera_path, config.width, config.height,
                                                    config.pixel_format, config.fps);
    }, g_stop);

    serial_channel_options serial_opts;
    serial_opts.port_override = config.serial_port;
    serial_opts.baud = config.baud;
    serial_channel serial(serial_opts,
                          [] { return enumerate_serial_ports(); },
                          [](const std::string& path, int baud) -> std::unique_ptr<iserial_port> {
                              return std::make_unique<posix_serial_port>(path, baud);
                          },
                          g_stop);

    try {
        frames.start();
        serial.connect();
    } catch (const connection_lost_error& e) {
        spdlog::critical("Startup failed: {}", e.what());
        frames.stop();
        serial.stop();
        return 1;
    }

    cycle_options cycle_opts;
    cycle_opts.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    cycle_opts.max_cycles = config.max_cycles;
    cycle_controller controller(serial, frames, validator, publisher, g_stop, cycle_opts);

    size_t cycles = controller.run();

    g_stop = true;
    serial.stop();
    frames.stop();

    spdlog::info("Exiting after {} sort cycles", cycles);
    return 0;
}
