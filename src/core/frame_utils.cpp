#include "core/frame_utils.hpp"

#include <opencv2/imgproc.hpp>

namespace flowstab {

bool isSupportedFrameImage(const cv::Mat& image) {
    if (image.empty() || image.depth() != CV_8U) {
        return false;
    }
    const int channels = image.channels();
    return channels == 1 || channels == 3 || channels == 4;
}

cv::Mat toGray(const cv::Mat& image) {
    if (image.channels() == 1) {
        return image;
    }
    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    }
    return gray;
}

Frame deriveFrame(const BufferMeta& meta, const cv::Mat& image) {
    Frame out;
    out.meta = meta;
    out.image = image;
    return out;
}

}  // namespace flowstab
