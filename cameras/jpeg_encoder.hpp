#pragma once

#include <cstdint>
#include <vector>

#include "buffer.hpp"

namespace sorter {

/**
 * @brief Encode a captured frame as JPEG
 *
 * MJPEG payloads are already JPEG and are returned unchanged. YUYV frames are
 * converted to BGR and encoded with OpenCV.
 *
 * @throws sorter_error for empty frames, unsupported formats or encoder failures
 */
std::vector<uint8_t> encode_jpeg(const buffer& frame, int quality = 90);

} // namespace sorter
