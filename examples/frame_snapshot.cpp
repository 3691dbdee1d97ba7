// Opens the camera through the frame source and saves a few JPEG snapshots.
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "../cameras/frame_source.hpp"
#include "../cameras/jpeg_encoder.hpp"
#include "../cameras/v4l2_camera_device.hpp"
#include "../common/errors.hpp"
#include "../config/app_config.hpp"

using namespace sorter;

static void show_usage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [-w WIDTH] [-h HEIGHT] [-f MJPG|YUYV] [-n COUNT] [-o DIR] [device]" << std::endl;
    std::cout << "Example: " << program_name << " -w 1280 -h 720 -f MJPG /dev/video0" << std::endl;
}

int main(int argc, char* argv[])
{
    std::string camera = "/dev/video0";
    unsigned int width = 640;
    unsigned int height = 480;
    unsigned int format = 0;
    int count = 5;
    std::string output_dir = "output";

    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--help") == 0) {
                show_usage(argv[0]);
                return 0;
            } else if (strcmp(argv[i], "-w") == 0 && i + 1 < argc) {
                width = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (strcmp(argv[i], "-h") == 0 && i + 1 < argc) {
                height = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
                format = parse_pixel_format(argv[++i]);
            } else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
                count = std::stoi(argv[++i]);
            } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
                output_dir = argv[++i];
            } else if (argv[i][0] != '-') {
                camera = argv[i];
            }
        }
        camera = camera_device_path(camera);
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << std::endl;
        show_usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        spdlog::error("Cannot create output directory {}: {}", output_dir, ec.message());
        return 1;
    }

    std::atomic<bool> stop(false);
    frame_source frames([&]() -> std::unique_ptr<icamera_device> {
        return std::make_unique<v4l2_camera_device>(camera, width, height, format, 30);
    }, stop);

    try {
        frames.start();
    } catch (const camera_unavailable_error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    uint64_t last_sequence = 0;
    int saved = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10 + count);
    while (saved < count && std::chrono::steady_clock::now() < deadline) {
        auto frame = frames.get_latest_frame();
        if (!frame || frame->sequence() == last_sequence) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            continue;
        }
        last_sequence = frame->sequence();

        try {
            std::vector<uint8_t> jpeg = encode_jpeg(*frame);
            char filename[64];
            snprintf(filename, sizeof(filename), "frame_%04d.jpg", saved);
            std::filesystem::path path = std::filesystem::path(output_dir) / filename;
            std::ofstream out(path, std::ios::binary);
            out.write(reinterpret_cast<const char*>(jpeg.data()), static_cast<std::streamsize>(jpeg.size()));
            if (!out) {
                spdlog::error("Failed to write {}", path.string());
            } else {
                spdlog::info("Frame {} ({}x{}) saved as {}", frame->sequence(), frame->width(), frame->height(), path.string());
                ++saved;
            }
        } catch (const sorter_error& e) {
            spdlog::error("Failed to encode frame {}: {}", frame->sequence(), e.what());
        }
    }

    frames.stop();
    return saved == count ? 0 : 1;
}
