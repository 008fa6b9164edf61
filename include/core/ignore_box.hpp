#pragma once

#include <optional>

#include <opencv2/core.hpp>

namespace flowstab {

constexpr int kIgnoreBoxDisabled = -1;

// Inclusive rectangle in which features are not trusted (on-screen overlays,
// a moving subject, a timestamp burnt into the picture).
class IgnoreBox {
public:
    IgnoreBox() = default;

    // Any bound equal to kIgnoreBoxDisabled yields a disabled box.
    static IgnoreBox fromBounds(int min_x, int max_x, int min_y, int max_y);

    bool enabled() const { return bounds_.has_value(); }
    bool contains(const cv::Point2f& p) const;

    int minX() const { return enabled() ? bounds_->min_x : kIgnoreBoxDisabled; }
    int maxX() const { return enabled() ? bounds_->max_x : kIgnoreBoxDisabled; }
    int minY() const { return enabled() ? bounds_->min_y : kIgnoreBoxDisabled; }
    int maxY() const { return enabled() ? bounds_->max_y : kIgnoreBoxDisabled; }

private:
    struct Bounds {
        int min_x;
        int max_x;
        int min_y;
        int max_y;
    };

    std::optional<Bounds> bounds_;
};

// Detection mask derived from an IgnoreBox: 1 everywhere, 0 inside the box.
// Built on first use for the stream's frame size, then reused.
class IgnoreMask {
public:
    explicit IgnoreMask(IgnoreBox box = {});

    const IgnoreBox& box() const { return box_; }

    // Empty Mat when no box is configured.
    const cv::Mat& maskFor(const cv::Size& frame_size);
    bool built() const { return !mask_.empty(); }

private:
    IgnoreBox box_;
    cv::Mat mask_;
};

}  // namespace flowstab
