#pragma once

#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace flowstab {

bool isSupportedFrameImage(const cv::Mat& image);

// Single-channel view of a gray, BGR or BGRA image. Gray input is returned as is.
cv::Mat toGray(const cv::Mat& image);

// A new frame carrying `meta` unchanged.
Frame deriveFrame(const BufferMeta& meta, const cv::Mat& image);

}  // namespace flowstab
