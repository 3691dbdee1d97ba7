#include "v4l2_camera_device.hpp"

#include <spdlog/spdlog.h>

#include "../common/clock.hpp"
#include "../common/errors.hpp"

namespace sorter {

namespace {

struct io_backend {
    V4l2IoType type;
    const char* name;
};

// preference order when opening a device
const io_backend kBackends[] = {
    {IOTYPE_MMAP, "mmap"},
    {IOTYPE_READWRITE, "read/write"},
};

} // namespace

v4l2_camera_device::v4l2_camera_device(const std::string& device_path,
                                       unsigned int width,
                                       unsigned int height,
                                       unsigned int format,
                                       int fps)
    : m_device_path(device_path),
      m_width(width),
      m_height(height),
      m_format(format),
      m_fps(fps),
      m_sequence(0),
      m_capture(nullptr)
{
}

v4l2_camera_device::~v4l2_camera_device()
{
    release();
}

bool v4l2_camera_device::initialize()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    for (const auto& backend : kBackends) {
        try {
            V4L2DeviceParameters params(m_device_path.c_str(), m_format, m_width, m_height, m_fps, backend.type);
            m_capture.reset(V4l2Capture::create(params));
        } catch (const std::exception& e) {
            spdlog::warn("Exception opening {} with {} backend: {}", m_device_path, backend.name, e.what());
            m_capture.reset();
        }

        if (m_capture) {
            spdlog::info("Camera {} opened ({} backend) format: {} size: {}x{}",
                         m_device_path, backend.name, m_capture->getFormat(),
                         m_capture->getWidth(), m_capture->getHeight());
            return true;
        }
        spdlog::debug("Camera {} refused {} backend", m_device_path, backend.name);
    }

    spdlog::error("Cannot open camera {} with any backend", m_device_path);
    return false;
}

std::shared_ptr<buffer> v4l2_camera_device::get_frame()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_capture) {
        return nullptr;
    }

    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 200000;
    if (m_capture->isReadable(&tv) != 1) {
        spdlog::trace("Timeout waiting for frame on {}", m_device_path);
        return nullptr;
    }

    size_t buffer_size = m_capture->getBufferSize();
    if (buffer_size == 0) {
        spdlog::warn("Invalid buffer size for device {}", m_device_path);
        return nullptr;
    }

    auto frame = std::make_shared<buffer>(buffer_size);
    size_t bytes_read = m_capture->read(static_cast<char*>(frame->data()), buffer_size);
    if (bytes_read == 0) {
        throw transient_io_error("Failed to read frame from device " + m_device_path);
    }

    frame->resize(bytes_read);
    frame->set_timestamp(now_us());
    frame->set_sequence(++m_sequence);
    frame->set_geometry(m_capture->getWidth(), m_capture->getHeight(), m_capture->getFormat());
    return frame;
}

void v4l2_camera_device::release()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_capture) {
        spdlog::debug("Releasing camera {}", m_device_path);
        m_capture.reset();
    }
}

std::string v4l2_camera_device::describe() const
{
    return m_device_path;
}

} // namespace sorter
