#include "cycle_controller.hpp"

#include <thread>

#include <spdlog/spdlog.h>

namespace sorter {

std::string to_string(cycle_state state)
{
    switch (state) {
        case cycle_state::wait_first_frame: return "wait_first_frame";
        case cycle_state::wait_trigger:     return "wait_trigger";
        case cycle_state::capture:          return "capture";
        case cycle_state::classify:         return "classify";
        case cycle_state::publish:          return "publish";
        case cycle_state::command:          return "command";
        case cycle_state::wait_settle:      return "wait_settle";
        case cycle_state::stopped:          return "stopped";
    }
    return "unknown";
}

cycle_controller::cycle_controller(serial_channel& serial,
                                   frame_source& frames,
                                   recognition_validator& validator,
                                   ipublisher& publisher,
                                   const std::atomic<bool>& shutdown,
                                   cycle_options options)
    : m_serial(serial),
      m_frames(frames),
      m_validator(validator),
      m_publisher(publisher),
      m_shutdown(shutdown),
      m_options(options),
      m_stop_requested(false),
      m_state(cycle_state::wait_first_frame),
      m_cycles(0)
{
}

bool cycle_controller::should_stop() const
{
    return m_stop_requested || m_shutdown;
}

void cycle_controller::enter(cycle_state next)
{
    spdlog::debug("State {} -> {}", to_string(m_state.load()), to_string(next));
    m_state = next;
}

bool cycle_controller::wait_first_frame()
{
    enter(cycle_state::wait_first_frame);
    spdlog::info("Waiting for the first camera frame");
    while (!should_stop()) {
        if (m_frames.get_latest_frame()) {
            return true;
        }
        std::this_thread::sleep_for(m_options.poll_interval);
    }
    return false;
}

bool cycle_controller::wait_trigger()
{
    enter(cycle_state::wait_trigger);
    while (!should_stop()) {
        if (m_serial.get_latest_state().is_triggered) {
            return true;
        }
        std::this_thread::sleep_for(m_options.poll_interval);
    }
    return false;
}

// Reads the cached state right after the command, so a board that has not
// started moving yet settles at once; a still-latched trigger then starts
// another cycle on the same object.
bool cycle_controller::wait_settle()
{
    enter(cycle_state::wait_settle);
    while (!should_stop()) {
        if (!m_serial.get_latest_state().is_moving) {
            return true;
        }
        std::this_thread::sleep_for(m_options.poll_interval);
    }
    return false;
}

void cycle_controller::run_cycle(std::shared_ptr<const buffer>& held_frame)
{
    enter(cycle_state::capture);
    std::shared_ptr<const buffer> fresh = m_frames.get_latest_frame(true);
    if (fresh) {
        held_frame = fresh;
    } else {
        spdlog::warn("No fresh frame at trigger, using the previous one");
    }

    enter(cycle_state::classify);
    frame_source& frames = m_frames;
    classification_result result = m_validator.classify(held_frame, [&frames] {
        return frames.get_latest_frame(true);
    });

    enter(cycle_state::publish);
    publication item;
    item.kind = result.kind;
    item.confidence = result.confidence;
    item.raw_payload = result.raw_payload;
    item.raw_payload["source"] = "edge-device";
    if (held_frame) {
        item.raw_payload["captured_at_us"] = held_frame->timestamp();
    }
    try {
        m_publisher.publish(item);
    } catch (const std::exception& e) {
        spdlog::error("Publish failed: {}", e.what());
    }

    enter(cycle_state::command);
    try {
        m_serial.send_command(category_id(result.kind));
        spdlog::info("Commanded sorter to route {} ({})", category_slug(result.kind), category_id(result.kind));
    } catch (const std::exception& e) {
        spdlog::error("Command failed: {}", e.what());
    }
}

size_t cycle_controller::run()
{
    std::shared_ptr<const buffer> held_frame;

    if (wait_first_frame()) {
        held_frame = m_frames.get_latest_frame(true);

        while (!should_stop()) {
            if (!wait_trigger()) {
                break;
            }
            spdlog::info("Trigger detected");
            run_cycle(held_frame);
            if (!wait_settle()) {
                break;
            }

            ++m_cycles;
            spdlog::debug("Cycle {} complete", m_cycles.load());
            if (m_options.max_cycles > 0 && m_cycles >= m_options.max_cycles) {
                spdlog::info("Reached {} cycles, stopping", m_options.max_cycles);
                break;
            }
        }
    }

    enter(cycle_state::stopped);
    return m_cycles;
}

} // namespace sorter
