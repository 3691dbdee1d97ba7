#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "../backend/publisher.hpp"
#include "../cameras/frame_source.hpp"
#include "../recognition/recognition_validator.hpp"
#include "../serial/serial_channel.hpp"

namespace sorter {

enum class cycle_state {
    wait_first_frame,
    wait_trigger,
    capture,
    classify,
    publish,
    command,
    wait_settle,
    stopped,
};

std::string to_string(cycle_state state);

struct cycle_options {
    std::chrono::milliseconds poll_interval{50};
    // 0 runs until stopped
    size_t max_cycles = 0;
};

/**
 * @brief Trigger -> capture -> classify -> publish -> command -> settle loop
 *
 * Only reads the serial and frame caches while waiting, so a stop request
 * is noticed within one poll interval. Publish and command failures are
 * logged and the cycle carries on.
 */
class cycle_controller {
public:
    cycle_controller(serial_channel& serial,
                     frame_source& frames,
                     recognition_validator& validator,
                     ipublisher& publisher,
                     const std::atomic<bool>& shutdown,
                     cycle_options options = cycle_options());

    /**
     * @brief Run cycles in the calling thread
     *
     * @return number of completed cycles
     */
    size_t run();

    void request_stop() { m_stop_requested = true; }

    cycle_state state() const { return m_state; }

    size_t cycles_completed() const { return m_cycles; }

private:
    bool should_stop() const;
    void enter(cycle_state next);
    bool wait_first_frame();
    bool wait_trigger();
    bool wait_settle();
    void run_cycle(std::shared_ptr<const buffer>& held_frame);

    serial_channel& m_serial;
    frame_source& m_frames;
    recognition_validator& m_validator;
    ipublisher& m_publisher;
    const std::atomic<bool>& m_shutdown;
    cycle_options m_options;

    std::atomic<bool> m_stop_requested;
    std::atomic<cycle_state> m_state;
    std::atomic<size_t> m_cycles;
};

} // namespace sorter
