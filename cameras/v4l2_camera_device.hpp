#pragma once

#include <string>
#include <memory>
#include <mutex>

#include "camera_device.hpp"
#include "V4l2Capture.h"

namespace sorter {

/**
 * @brief V4L2 camera device
 *
 * Built on libv4l2cpp's V4l2Capture. initialize() tries memory-mapped
 * streaming first and falls back to read/write I/O.
 */
class v4l2_camera_device : public icamera_device {
public:
    /**
     * @param device_path device node, e.g. "/dev/video0"
     * @param width requested width
     * @param height requested height
     * @param format V4L2 pixel format, 0 keeps the driver default
     * @param fps requested frame rate, 0 keeps the driver default
     */
    v4l2_camera_device(const std::string& device_path,
                       unsigned int width,
                       unsigned int height,
                       unsigned int format,
                       int fps);

    ~v4l2_camera_device() override;

    bool initialize() override;
    std::shared_ptr<buffer> get_frame() override;
    void release() override;
    std::string describe() const override;

private:
    std::string m_device_path;
    unsigned int m_width;
    unsigned int m_height;
    unsigned int m_format;
    int m_fps;
    uint64_t m_sequence;

    std::unique_ptr<V4l2Capture> m_capture;
    std::mutex m_mutex;
};

} // namespace sorter
