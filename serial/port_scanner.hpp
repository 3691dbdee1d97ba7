#pragma once

#include <string>
#include <vector>

namespace sorter {

struct port_descriptor {
    std::string device_path;
    std::string description;
    std::string manufacturer;
};

/**
 * @brief List serial ports backed by real hardware, sorted by device path
 *
 * Walks /sys/class/tty and keeps entries with a device link. For USB
 * adapters the description carries the product string and "VID:PID".
 *
 * @param sysfs_root root of the tty class directory, overridable for tests
 */
std::vector<port_descriptor> enumerate_serial_ports(const std::string& sysfs_root = "/sys/class/tty");

/**
 * @brief Number of vendor/keyword hints found in a port's description and manufacturer
 */
int score_port(const port_descriptor& port);

/**
 * @brief Choose the device path to open
 *
 * An explicit override wins. Otherwise the highest scoring port is used,
 * falling back to the first port when nothing scores.
 *
 * @throws no_port_found_error when no override is given and the list is empty
 */
std::string resolve_port(const std::vector<port_descriptor>& ports, const std::string& override_path);

} // namespace sorter
