#include "jpeg_encoder.hpp"

#include <linux/videodev2.h>
#include <opencv2/opencv.hpp>

#include "../common/errors.hpp"

namespace sorter {

std::vector<uint8_t> encode_jpeg(const buffer& frame, int quality)
{
    if (frame.size() == 0) {
        throw sorter_error("Cannot encode an empty frame");
    }

    const auto* bytes = static_cast<const uint8_t*>(frame.data());

    switch (frame.pixel_format()) {
        case V4L2_PIX_FMT_MJPEG:
        case V4L2_PIX_FMT_JPEG:
            return std::vector<uint8_t>(bytes, bytes + frame.size());
        case V4L2_PIX_FMT_YUYV:
        {
            int width = static_cast<int>(frame.width());
            int height = static_cast<int>(frame.height());
            if (static_cast<size_t>(width) * static_cast<size_t>(height) * 2 > frame.size()) {
                throw sorter_error("YUYV frame smaller than its geometry");
            }
            cv::Mat yuyv(height, width, CV_8UC2, const_cast<uint8_t*>(bytes));
            cv::Mat bgr;
            std::vector<uint8_t> jpeg;
            try {
                cv::cvtColor(yuyv, bgr, cv::COLOR_YUV2BGR_YUYV);
                if (!cv::imencode(".jpg", bgr, jpeg, {cv::IMWRITE_JPEG_QUALITY, quality})) {
                    throw sorter_error("OpenCV refused to encode frame");
                }
            } catch (const cv::Exception& e) {
                throw sorter_error(std::string("OpenCV error: ") + e.what());
            }
            return jpeg;
        }
        default:
            throw sorter_error("Unsupported pixel format: " + std::to_string(frame.pixel_format()));
    }
}

} // namespace sorter
