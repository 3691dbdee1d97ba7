#pragma once

#include <vector>
#include <cstdint>
#include <cstring>
#include <memory>

namespace sorter {

/**
 * @brief Frame buffer
 *
 * Holds the raw bytes of one captured image together with its geometry,
 * V4L2 pixel format, capture timestamp and sequence number.
 */
class buffer {
public:
    buffer() : m_timestamp(0), m_sequence(0), m_width(0), m_height(0), m_pixel_format(0) {}

    /**
     * @brief Preallocate a buffer of the given size
     *
     * @param size buffer size in bytes
     * @param timestamp capture timestamp in microseconds
     * @param sequence frame sequence number
     */
    explicit buffer(size_t size, int64_t timestamp = 0, uint64_t sequence = 0)
        : m_timestamp(timestamp), m_sequence(sequence),
          m_width(0), m_height(0), m_pixel_format(0), m_data(size, 0) {}

    void* data() { return m_data.data(); }
    const void* data() const { return m_data.data(); }

    size_t size() const { return m_data.size(); }

    void resize(size_t new_size) { m_data.resize(new_size); }

    void clear() { m_data.clear(); }

    uint8_t& operator[](size_t index) { return m_data[index]; }
    const uint8_t& operator[](size_t index) const { return m_data[index]; }

    // no implicit copies, use clone()
    buffer(const buffer&) = delete;
    buffer& operator=(const buffer&) = delete;

    buffer(buffer&&) = default;
    buffer& operator=(buffer&&) = default;

    /**
     * @brief Deep copy of bytes and metadata
     *
     * @return std::shared_ptr<buffer> independent buffer
     */
    std::shared_ptr<buffer> clone() const
    {
        auto copy = std::make_shared<buffer>(m_data.size(), m_timestamp, m_sequence);
        if (!m_data.empty()) {
            std::memcpy(copy->data(), m_data.data(), m_data.size());
        }
        copy->set_geometry(m_width, m_height, m_pixel_format);
        return copy;
    }

    /**
     * @brief Capture timestamp in microseconds
     */
    int64_t timestamp() const { return m_timestamp; }
    void set_timestamp(int64_t timestamp) { m_timestamp = timestamp; }

    uint64_t sequence() const { return m_sequence; }
    void set_sequence(uint64_t sequence) { m_sequence = sequence; }

    unsigned int width() const { return m_width; }
    unsigned int height() const { return m_height; }

    /**
     * @brief V4L2 fourcc of the payload (V4L2_PIX_FMT_MJPEG, V4L2_PIX_FMT_YUYV, ...)
     */
    unsigned int pixel_format() const { return m_pixel_format; }

    void set_geometry(unsigned int width, unsigned int height, unsigned int pixel_format)
    {
        m_width = width;
        m_height = height;
        m_pixel_format = pixel_format;
    }

protected:
    int64_t m_timestamp;           // microseconds
    uint64_t m_sequence;

private:
    unsigned int m_width;
    unsigned int m_height;
    unsigned int m_pixel_format;
    std::vector<uint8_t> m_data;
};

} // namespace sorter
