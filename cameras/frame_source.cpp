#include "frame_source.hpp"

#include <spdlog/spdlog.h>

#include "../common/errors.hpp"

namespace sorter {

frame_source::frame_source(camera_factory factory, const std::atomic<bool>& shutdown,
                           frame_source_options options)
    : m_factory(std::move(factory)),
      m_shutdown(shutdown),
      m_options(options),
      m_halt(false),
      m_running(false),
      m_loop_done(true),
      m_frames_captured(0),
      m_reopen_attempts(0)
{
}

frame_source::~frame_source()
{
    stop();
}

void frame_source::start()
{
    if (m_running) {
        return;
    }

    std::unique_ptr<icamera_device> device = m_factory();
    if (!device || !device->initialize()) {
        std::string name = device ? device->describe() : std::string("<none>");
        throw camera_unavailable_error("Unable to open camera " + name);
    }
    spdlog::info("Frame source started on {}", device->describe());

    {
        std::lock_guard<std::mutex> lock(m_device_mutex);
        m_device = std::move(device);
    }
    {
        std::lock_guard<std::mutex> lock(m_done_mutex);
        m_loop_done = false;
    }
    m_halt = false;
    m_running = true;
    m_thread = std::thread(&frame_source::capture_loop, this);
}

void frame_source::stop()
{
    m_halt = true;

    if (m_thread.joinable()) {
        std::unique_lock<std::mutex> lock(m_done_mutex);
        if (!m_done_cv.wait_for(lock, m_options.stop_timeout, [this] { return m_loop_done; })) {
            spdlog::warn("Capture loop did not stop within {} ms, releasing camera anyway",
                         m_options.stop_timeout.count());
        }
    }

    std::shared_ptr<icamera_device> device;
    {
        std::lock_guard<std::mutex> lock(m_device_mutex);
        device = std::move(m_device);
    }
    if (device) {
        device->release();
    }

    // an in-flight grab returns once the device is released
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = false;
}

std::shared_ptr<const buffer> frame_source::get_latest_frame(bool copy) const
{
    std::shared_ptr<const buffer> frame;
    {
        std::lock_guard<std::mutex> lock(m_frame_mutex);
        frame = m_latest;
    }
    if (frame && copy) {
        return frame->clone();
    }
    return frame;
}

std::shared_ptr<icamera_device> frame_source::current_device() const
{
    std::lock_guard<std::mutex> lock(m_device_mutex);
    return m_device;
}

void frame_source::capture_loop()
{
    spdlog::debug("Capture loop running");

    int failures = 0;
    bool reopened_before = false;
    std::chrono::steady_clock::time_point last_reopen;

    while (!m_halt && !m_shutdown) {
        std::shared_ptr<icamera_device> device = current_device();
        std::shared_ptr<buffer> frame;
        if (device) {
            try {
                frame = device->get_frame();
            } catch (const transient_io_error& e) {
                spdlog::debug("{}", e.what());
            } catch (const std::exception& e) {
                spdlog::warn("Frame grab raised: {}", e.what());
            }
        }

        if (frame) {
            {
                std::lock_guard<std::mutex> lock(m_frame_mutex);
                m_latest = std::move(frame);
            }
            ++m_frames_captured;
            failures = 0;
            continue;
        }

        ++failures;
        if (failures >= m_options.failure_threshold) {
            auto now = std::chrono::steady_clock::now();
            if (!reopened_before || now - last_reopen >= m_options.reopen_cooldown) {
                spdlog::warn("{} consecutive capture failures, reopening camera", failures);
                reopen_device();
                reopened_before = true;
                last_reopen = now;
                failures = 0;
            }
        }
        std::this_thread::sleep_for(m_options.failure_backoff);
    }

    spdlog::debug("Capture loop exiting");
    {
        std::lock_guard<std::mutex> lock(m_done_mutex);
        m_loop_done = true;
    }
    m_done_cv.notify_all();
}

void frame_source::reopen_device()
{
    ++m_reopen_attempts;

    std::shared_ptr<icamera_device> old;
    {
        std::lock_guard<std::mutex> lock(m_device_mutex);
        old = std::move(m_device);
    }
    if (old) {
        old->release();
    }

    std::shared_ptr<icamera_device> fresh;
    try {
        fresh = m_factory();
    } catch (const std::exception& e) {
        spdlog::error("Camera factory failed during reopen: {}", e.what());
    }

    if (!fresh || !fresh->initialize()) {
        spdlog::error("Camera reopen failed, will retry after cooldown");
        return;
    }

    spdlog::info("Camera {} reopened", fresh->describe());
    std::lock_guard<std::mutex> lock(m_device_mutex);
    m_device = std::move(fresh);
}

} // namespace sorter
