#include "serial_channel.hpp"

#include <spdlog/spdlog.h>

#include "../common/clock.hpp"
#include "../common/errors.hpp"

namespace sorter {

serial_channel::serial_channel(serial_channel_options options,
                               port_enumerator enumerate,
                               port_opener open,
                               const std::atomic<bool>& shutdown)
    : m_options(std::move(options)),
      m_enumerate(std::move(enumerate)),
      m_open(std::move(open)),
      m_shutdown(shutdown),
      m_halt(false),
      m_connections(0)
{
}

serial_channel::~serial_channel()
{
    stop();
}

void serial_channel::connect()
{
    {
        std::lock_guard<std::mutex> lock(m_conn_mutex);
        if (!m_port) {
            m_port = open_connection();
        }
    }

    if (!m_reader.joinable()) {
        m_halt = false;
        m_reader = std::thread(&serial_channel::reader_loop, this);
    }
}

void serial_channel::stop()
{
    m_halt = true;
    if (m_reader.joinable()) {
        m_reader.join();
    }
    std::lock_guard<std::mutex> lock(m_conn_mutex);
    m_port.reset();
}

bool serial_channel::connected() const
{
    std::lock_guard<std::mutex> lock(m_conn_mutex);
    return static_cast<bool>(m_port);
}

// caller holds m_conn_mutex
std::shared_ptr<iserial_port> serial_channel::open_connection()
{
    std::vector<port_descriptor> ports;
    if (m_options.port_override.empty()) {
        ports = m_enumerate();
    }
    std::string path = resolve_port(ports, m_options.port_override);

    std::shared_ptr<iserial_port> port = m_open(path, m_options.baud);
    if (!port) {
        throw connection_lost_error("Could not open serial port " + path);
    }

    if (m_options.settle_delay.count() > 0) {
        std::this_thread::sleep_for(m_options.settle_delay);
    }
    port->discard_input();

    ++m_connections;
    spdlog::info("Serial port {} open at {} baud", path, m_options.baud);
    return port;
}

std::shared_ptr<iserial_port> serial_channel::ensure_connection()
{
    std::lock_guard<std::mutex> lock(m_conn_mutex);
    if (!m_port) {
        spdlog::debug("Reconnecting serial port");
        m_port = open_connection();
    }
    return m_port;
}

void serial_channel::invalidate(const std::shared_ptr<iserial_port>& port)
{
    std::lock_guard<std::mutex> lock(m_conn_mutex);
    // another thread may already have replaced it
    if (m_port == port) {
        m_port.reset();
    }
}

device_state serial_channel::get_latest_state() const
{
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_state;
}

void serial_channel::handle_line(const std::string& line)
{
    bool moving = false;
    bool triggered = false;
    if (!parse_state_line(line, moving, triggered)) {
        spdlog::trace("Ignoring serial line '{}'", line);
        return;
    }

    device_state next;
    next.is_moving = moving;
    next.is_triggered = triggered;
    next.raw_line = line;
    next.observed_at = now_us();

    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_state = std::move(next);
}

void serial_channel::reader_loop()
{
    spdlog::debug("Serial reader running");

    // only the first error of a run is a warning, repeats go to debug
    uint64_t consecutive_errors = 0;

    while (!m_halt && !m_shutdown) {
        std::shared_ptr<iserial_port> port;
        try {
            port = ensure_connection();
            std::string line;
            bool got_line = port->read_line(m_options.read_timeout, line);
            if (consecutive_errors > 0) {
                spdlog::info("Serial link recovered after {} errors", consecutive_errors);
                consecutive_errors = 0;
            }
            if (got_line && !line.empty()) {
                handle_line(line);
            }
        } catch (const std::exception& e) {
            if (++consecutive_errors == 1) {
                spdlog::warn("Serial read error: {}", e.what());
            } else {
                spdlog::debug("Serial read error (#{}): {}", consecutive_errors, e.what());
            }
            if (port) {
                invalidate(port);
            }
            std::this_thread::sleep_for(m_options.error_backoff);
        }
    }

    spdlog::debug("Serial reader exiting");
}

void serial_channel::send_command(int value)
{
    std::lock_guard<std::mutex> lock(m_write_mutex);

    std::shared_ptr<iserial_port> port;
    try {
        port = ensure_connection();
        port->discard_output();
        port->write_line(std::to_string(value));
        port->flush();
    } catch (const std::exception& e) {
        if (port) {
            invalidate(port);
        }
        throw write_failed_error(std::string("Failed to send command ") + std::to_string(value) + ": " + e.what());
    }

    spdlog::debug("Sent command {}", value);
}

} // namespace sorter
