#pragma once

#include <stdexcept>
#include <string>

namespace sorter {

/**
 * @brief Root of every error raised by the sorter
 */
class sorter_error : public std::runtime_error {
public:
    explicit sorter_error(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Missing credentials or unparsable device identifiers, fatal at startup
 */
class configuration_error : public sorter_error {
public:
    explicit configuration_error(const std::string& what) : sorter_error(what) {}
};

/**
 * @brief Read hiccup on a serial or camera device, retried locally
 */
class transient_io_error : public sorter_error {
public:
    explicit transient_io_error(const std::string& what) : sorter_error(what) {}
};

/**
 * @brief A device handle became unusable and has to be reopened
 */
class connection_lost_error : public sorter_error {
public:
    explicit connection_lost_error(const std::string& what) : sorter_error(what) {}
};

class no_port_found_error : public connection_lost_error {
public:
    explicit no_port_found_error(const std::string& what) : connection_lost_error(what) {}
};

class camera_unavailable_error : public connection_lost_error {
public:
    explicit camera_unavailable_error(const std::string& what) : connection_lost_error(what) {}
};

class write_failed_error : public connection_lost_error {
public:
    explicit write_failed_error(const std::string& what) : connection_lost_error(what) {}
};

/**
 * @brief A single classifier call failed (transport, timeout, bad response)
 */
class classification_service_error : public sorter_error {
public:
    explicit classification_service_error(const std::string& what) : sorter_error(what) {}
};

class publish_error : public sorter_error {
public:
    explicit publish_error(const std::string& what) : sorter_error(what) {}
};

} // namespace sorter
