#include "port_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

#include "../common/errors.hpp"

namespace fs = std::filesystem;

namespace sorter {

namespace {

// USB-serial chips and boards commonly found on the sorter controller
const char* const kPortHints[] = {
    "ch340", "ch341", "wch", "1a86",
    "cp210", "silicon labs", "10c4",
    "ftdi", "0403",
    "arduino", "2341",
    "usb-serial", "usb serial",
};

std::string lowercase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

std::string read_attribute(const fs::path& path)
{
    std::ifstream in(path);
    std::string value;
    if (in) {
        std::getline(in, value);
    }
    return value;
}

// nearest ancestor that looks like a USB device (has idVendor)
fs::path find_usb_device(fs::path dir)
{
    std::error_code ec;
    for (int depth = 0; depth < 6 && !dir.empty() && dir != dir.root_path(); ++depth) {
        if (fs::exists(dir / "idVendor", ec)) {
            return dir;
        }
        dir = dir.parent_path();
    }
    return fs::path();
}

} // namespace

std::vector<port_descriptor> enumerate_serial_ports(const std::string& sysfs_root)
{
    std::vector<port_descriptor> ports;
    std::error_code ec;

    fs::directory_iterator it(sysfs_root, ec);
    if (ec) {
        spdlog::warn("Cannot list {}: {}", sysfs_root, ec.message());
        return ports;
    }

    for (const auto& entry : it) {
        fs::path device_link = entry.path() / "device";
        if (!fs::exists(device_link, ec)) {
            continue;
        }

        port_descriptor port;
        port.device_path = "/dev/" + entry.path().filename().string();

        fs::path device_dir = fs::canonical(device_link, ec);
        fs::path usb_dir = ec ? fs::path() : find_usb_device(device_dir);
        if (!usb_dir.empty()) {
            std::string product = read_attribute(usb_dir / "product");
            std::string vid = read_attribute(usb_dir / "idVendor");
            std::string pid = read_attribute(usb_dir / "idProduct");
            port.manufacturer = read_attribute(usb_dir / "manufacturer");
            port.description = product.empty() ? "USB serial" : product;
            port.description += " USB VID:PID=" + vid + ":" + pid;
        } else {
            std::string driver = fs::read_symlink(device_link / "driver", ec).filename().string();
            port.description = ec ? "n/a" : driver;
        }

        ports.push_back(port);
    }

    std::sort(ports.begin(), ports.end(),
              [](const port_descriptor& a, const port_descriptor& b) { return a.device_path < b.device_path; });
    return ports;
}

int score_port(const port_descriptor& port)
{
    std::string haystack = lowercase(port.description + " " + port.manufacturer);
    int score = 0;
    for (const char* hint : kPortHints) {
        if (haystack.find(hint) != std::string::npos) {
            ++score;
        }
    }
    return score;
}

std::string resolve_port(const std::vector<port_descriptor>& ports, const std::string& override_path)
{
    if (!override_path.empty()) {
        spdlog::debug("Using serial port override {}", override_path);
        return override_path;
    }

    if (ports.empty()) {
        throw no_port_found_error("No serial ports found");
    }

    const port_descriptor* best = nullptr;
    int best_score = 0;
    for (const auto& port : ports) {
        int score = score_port(port);
        spdlog::trace("Port {} ({}, {}) scored {}", port.device_path, port.description, port.manufacturer, score);
        if (score > best_score) {
            best = &port;
            best_score = score;
        }
    }

    if (!best) {
        spdlog::warn("No serial port matched a known adapter, falling back to {}", ports.front().device_path);
        return ports.front().device_path;
    }

    spdlog::info("Selected serial port {} ({})", best->device_path, best->description);
    return best->device_path;
}

} // namespace sorter
