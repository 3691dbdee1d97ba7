#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "device_state.hpp"
#include "port_scanner.hpp"
#include "serial_port.hpp"

namespace sorter {

struct serial_channel_options {
    std::string port_override;
    int baud = 9600;
    // the board resets when the port opens
    std::chrono::milliseconds settle_delay{2000};
    std::chrono::milliseconds read_timeout{100};
    std::chrono::milliseconds error_backoff{50};
};

using port_enumerator = std::function<std::vector<port_descriptor>()>;
using port_opener = std::function<std::unique_ptr<iserial_port>(const std::string& path, int baud)>;

/**
 * @brief Serial link to the sorter microcontroller
 *
 * A background reader keeps the latest device state in a cache. Commands
 * are written under a separate lock so sends never wait on the reader.
 * After any I/O failure the connection is dropped and reopened on next use.
 */
class serial_channel {
public:
    serial_channel(serial_channel_options options,
                   port_enumerator enumerate,
                   port_opener open,
                   const std::atomic<bool>& shutdown);
    ~serial_channel();

    serial_channel(const serial_channel&) = delete;
    serial_channel& operator=(const serial_channel&) = delete;

    /**
     * @brief Resolve and open the port, then start the reader
     *
     * @throws no_port_found_error when there is nothing to open
     * @throws connection_lost_error when the port cannot be opened
     */
    void connect();

    void stop();

    /**
     * @brief Cached state, (false, false) until the first valid line
     */
    device_state get_latest_state() const;

    /**
     * @brief Send a command value terminated by a newline
     *
     * @throws write_failed_error, the connection is discarded first
     */
    void send_command(int value);

    bool connected() const;

    uint64_t connection_count() const { return m_connections; }

private:
    std::shared_ptr<iserial_port> ensure_connection();
    std::shared_ptr<iserial_port> open_connection();
    void invalidate(const std::shared_ptr<iserial_port>& port);
    void reader_loop();
    void handle_line(const std::string& line);

    serial_channel_options m_options;
    port_enumerator m_enumerate;
    port_opener m_open;
    const std::atomic<bool>& m_shutdown;

    mutable std::mutex m_conn_mutex;
    std::shared_ptr<iserial_port> m_port;

    mutable std::mutex m_state_mutex;
    device_state m_state;

    std::mutex m_write_mutex;

    std::thread m_reader;
    std::atomic<bool> m_halt;
    std::atomic<uint64_t> m_connections;
};

} // namespace sorter
