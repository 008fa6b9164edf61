#include "core/ignore_box.hpp"

#include <algorithm>

namespace flowstab {

IgnoreBox IgnoreBox::fromBounds(int min_x, int max_x, int min_y, int max_y) {
    IgnoreBox box;
    if (min_x == kIgnoreBoxDisabled || max_x == kIgnoreBoxDisabled ||
        min_y == kIgnoreBoxDisabled || max_y == kIgnoreBoxDisabled) {
        return box;
    }
    box.bounds_ = Bounds{min_x, max_x, min_y, max_y};
    return box;
}

bool IgnoreBox::contains(const cv::Point2f& p) const {
    if (!bounds_) {
        return false;
    }
    return p.x >= static_cast<float>(bounds_->min_x) && p.x <= static_cast<float>(bounds_->max_x) &&
           p.y >= static_cast<float>(bounds_->min_y) && p.y <= static_cast<float>(bounds_->max_y);
}

IgnoreMask::IgnoreMask(IgnoreBox box)
    : box_(box) {}

const cv::Mat& IgnoreMask::maskFor(const cv::Size& frame_size) {
    if (!box_.enabled() || !mask_.empty()) {
        return mask_;
    }

    mask_ = cv::Mat(frame_size, CV_8UC1, cv::Scalar(1));

    // The box may extend past the frame; only the overlapping part is zeroed.
    const int x0 = std::max(0, box_.minX());
    const int y0 = std::max(0, box_.minY());
    const int x1 = std::min(frame_size.width - 1, box_.maxX());
    const int y1 = std::min(frame_size.height - 1, box_.maxY());
    if (x1 >= x0 && y1 >= y0) {
        mask_(cv::Rect(x0, y0, x1 - x0 + 1, y1 - y0 + 1)).setTo(cv::Scalar(0));
    }
    return mask_;
}

}  // namespace flowstab
