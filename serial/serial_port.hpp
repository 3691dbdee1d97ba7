#pragma once

#include <chrono>
#include <string>

namespace sorter {

/**
 * @brief Line-oriented serial connection
 *
 * I/O failures are reported as connection_lost_error; the owner drops the
 * instance and opens a new one.
 */
class iserial_port {
public:
    virtual ~iserial_port() = default;

    /**
     * @brief Read one line, without its terminator
     *
     * @param timeout how long to wait for a complete line
     * @param line receives the line
     * @return false on timeout
     */
    virtual bool read_line(std::chrono::milliseconds timeout, std::string& line) = 0;

    virtual void write_line(const std::string& text) = 0;

    virtual void discard_input() = 0;
    virtual void discard_output() = 0;

    // block until written bytes have left the driver
    virtual void flush() = 0;

    virtual std::string path() const = 0;
};

} // namespace sorter
