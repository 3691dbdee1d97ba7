#pragma once

#include <string>

#include "serial_port.hpp"

namespace sorter {

// rates the termios port can be configured for
bool is_supported_baud(int baud);

/**
 * @brief termios serial port, 8N1 raw mode
 */
class posix_serial_port : public iserial_port {
public:
    /**
     * @throws connection_lost_error when the device cannot be opened or configured,
     *         or the baud rate is not supported
     */
    posix_serial_port(const std::string& path, int baud);
    ~posix_serial_port() override;

    posix_serial_port(const posix_serial_port&) = delete;
    posix_serial_port& operator=(const posix_serial_port&) = delete;

    bool read_line(std::chrono::milliseconds timeout, std::string& line) override;
    void write_line(const std::string& text) override;
    void discard_input() override;
    void discard_output() override;
    void flush() override;
    std::string path() const override { return m_path; }

private:
    bool take_line(std::string& line);

    std::string m_path;
    int m_fd;
    std::string m_pending;   // bytes received after the last complete line
};

} // namespace sorter
