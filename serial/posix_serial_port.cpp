#include "posix_serial_port.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>

#include "../common/errors.hpp"

namespace sorter {

namespace {

bool to_speed(int baud, speed_t& speed)
{
    switch (baud) {
        case 9600:   speed = B9600; return true;
        case 19200:  speed = B19200; return true;
        case 38400:  speed = B38400; return true;
        case 57600:  speed = B57600; return true;
        case 115200: speed = B115200; return true;
        case 230400: speed = B230400; return true;
        default:     return false;
    }
}

std::string errno_text()
{
    return std::strerror(errno);
}

} // namespace

bool is_supported_baud(int baud)
{
    speed_t speed;
    return to_speed(baud, speed);
}

posix_serial_port::posix_serial_port(const std::string& path, int baud)
    : m_path(path), m_fd(-1)
{
    speed_t speed;
    if (!to_speed(baud, speed)) {
        throw connection_lost_error("Unsupported baud rate " + std::to_string(baud) + " for " + path);
    }

    m_fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (m_fd < 0) {
        throw connection_lost_error("Failed to open serial port " + path + ": " + errno_text());
    }

    termios tty{};
    if (tcgetattr(m_fd, &tty) != 0) {
        std::string reason = errno_text();
        ::close(m_fd);
        throw connection_lost_error("Failed to get serial attributes of " + path + ": " + reason);
    }

    cfsetospeed(&tty, speed);
    cfsetispeed(&tty, speed);

    tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
    tty.c_cflag &= ~(PARENB | CSTOPB);
    tty.c_cflag |= CLOCAL | CREAD;
    tty.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON | IXOFF | IXANY);
    tty.c_lflag = 0;
    tty.c_oflag = 0;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if (tcsetattr(m_fd, TCSANOW, &tty) != 0) {
        std::string reason = errno_text();
        ::close(m_fd);
        throw connection_lost_error("Failed to set serial attributes of " + path + ": " + reason);
    }
}

posix_serial_port::~posix_serial_port()
{
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

bool posix_serial_port::take_line(std::string& line)
{
    size_t pos = m_pending.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    line = m_pending.substr(0, pos);
    m_pending.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool posix_serial_port::read_line(std::chrono::milliseconds timeout, std::string& line)
{
    if (take_line(line)) {
        return true;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char chunk[256];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }

        fd_set fdset;
        FD_ZERO(&fdset);
        FD_SET(m_fd, &fdset);
        timeval tv;
        tv.tv_sec = static_cast<long>(remaining.count() / 1000000);
        tv.tv_usec = static_cast<long>(remaining.count() % 1000000);

        int ret = select(m_fd + 1, &fdset, nullptr, nullptr, &tv);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw connection_lost_error("select() failed on " + m_path + ": " + errno_text());
        }
        if (ret == 0) {
            return false;
        }

        ssize_t n = ::read(m_fd, chunk, sizeof(chunk));
        if (n > 0) {
            m_pending.append(chunk, static_cast<size_t>(n));
            if (take_line(line)) {
                return true;
            }
            continue;
        }
        if (n == 0) {
            // readable but no data: the device went away
            throw connection_lost_error("Serial port " + m_path + " closed");
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            continue;
        }
        throw connection_lost_error("Read failed on " + m_path + ": " + errno_text());
    }
}

void posix_serial_port::write_line(const std::string& text)
{
    std::string out = text + "\n";
    size_t offset = 0;
    while (offset < out.size()) {
        ssize_t n = ::write(m_fd, out.data() + offset, out.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
            continue;
        }
        throw connection_lost_error("Write failed on " + m_path + ": " + errno_text());
    }
}

void posix_serial_port::discard_input()
{
    m_pending.clear();
    if (tcflush(m_fd, TCIFLUSH) != 0) {
        throw connection_lost_error("tcflush(TCIFLUSH) failed on " + m_path + ": " + errno_text());
    }
}

void posix_serial_port::discard_output()
{
    if (tcflush(m_fd, TCOFLUSH) != 0) {
        throw connection_lost_error("tcflush(TCOFLUSH) failed on " + m_path + ": " + errno_text());
    }
}

void posix_serial_port::flush()
{
    if (tcdrain(m_fd) != 0) {
        throw connection_lost_error("tcdrain failed on " + m_path + ": " + errno_text());
    }
}

} // namespace sorter
