#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "buffer.hpp"
#include "camera_device.hpp"

namespace sorter {

struct frame_source_options {
    // consecutive failed grabs before a reopen is considered
    int failure_threshold = 60;
    // minimum time between two reopen attempts
    std::chrono::milliseconds reopen_cooldown{3000};
    // pause after a failed grab, keeps the threshold near two seconds at 30 fps
    std::chrono::milliseconds failure_backoff{30};
    // how long stop() waits for the loop before releasing the device
    std::chrono::milliseconds stop_timeout{2000};
};

using camera_factory = std::function<std::unique_ptr<icamera_device>()>;

/**
 * @brief Background frame capture with a latest-frame cache
 *
 * A single capture thread owns the device and replaces the cached frame
 * pointer on every successful grab. Readers copy the pointer under a short
 * lock and never wait on the device.
 */
class frame_source {
public:
    /**
     * @param factory builds a fresh, unopened device for start() and every reopen
     * @param shutdown process-wide stop flag, checked once per loop iteration
     * @param options loop tuning
     */
    frame_source(camera_factory factory, const std::atomic<bool>& shutdown,
                 frame_source_options options = frame_source_options());
    ~frame_source();

    frame_source(const frame_source&) = delete;
    frame_source& operator=(const frame_source&) = delete;

    /**
     * @brief Open the device and spawn the capture thread
     *
     * @throws camera_unavailable_error when no backend can open the device
     */
    void start();

    /**
     * @brief Signal the loop, wait up to stop_timeout, release the device, join
     *
     * Release happens even when the loop missed the timeout; the join then
     * lasts until the in-flight grab returns, which the device contract
     * bounds (see icamera_device::get_frame).
     */
    void stop();

    /**
     * @brief Latest captured frame, nullptr until the first capture succeeds
     *
     * @param copy true returns an independent deep copy, false the shared
     *        buffer (never written again, but kept alive only by the caller)
     */
    std::shared_ptr<const buffer> get_latest_frame(bool copy = false) const;

    bool running() const { return m_running; }

    uint64_t frames_captured() const { return m_frames_captured; }

    uint64_t reopen_attempts() const { return m_reopen_attempts; }

private:
    void capture_loop();
    void reopen_device();
    std::shared_ptr<icamera_device> current_device() const;

    camera_factory m_factory;
    const std::atomic<bool>& m_shutdown;
    frame_source_options m_options;

    mutable std::mutex m_device_mutex;
    std::shared_ptr<icamera_device> m_device;

    mutable std::mutex m_frame_mutex;
    std::shared_ptr<const buffer> m_latest;

    std::thread m_thread;
    std::atomic<bool> m_halt;
    std::atomic<bool> m_running;
    std::mutex m_done_mutex;
    std::condition_variable m_done_cv;
    bool m_loop_done;

    std::atomic<uint64_t> m_frames_captured;
    std::atomic<uint64_t> m_reopen_attempts;
};

} // namespace sorter
