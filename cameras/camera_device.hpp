#pragma once

#include <memory>
#include <string>
#include "buffer.hpp"

namespace sorter {

/**
 * @brief Capture device seen by the frame source
 *
 * One instance wraps one opened handle. Reopening means constructing a new
 * instance through the factory, never re-initializing an existing one.
 */
class icamera_device {
public:
    virtual ~icamera_device() = default;

    // open the device, false when no backend could open it
    virtual bool initialize() = 0;

    // grab one frame, nullptr on timeout, transient_io_error on a failed read;
    // must return within a bounded wait, and promptly once release() is called
    virtual std::shared_ptr<buffer> get_frame() = 0;

    // release the handle, safe to call twice
    virtual void release() = 0;

    virtual std::string describe() const = 0;
};

} // namespace sorter
