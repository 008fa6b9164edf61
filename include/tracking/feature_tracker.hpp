#pragma once

#include <memory>

#include "core/config.hpp"
#include "tracking/flow_finder.hpp"

namespace flowstab {

// Shi-Tomasi corners refined to sub-pixel accuracy, followed into the next
// frame with pyramidal Lucas-Kanade.
class FeatureTracker : public FlowFinder {
public:
    FeatureTracker(TrackerConfig config, std::shared_ptr<VisionPrimitives> primitives);

    MotionRecord findFlow(
        const cv::Mat& prev_gray,
        const cv::Mat& cur_gray,
        int64_t timestamp_ns,
        const std::vector<cv::Point2f>* anchor = nullptr) override;

    const IgnoreBox& ignoreBox() const override { return mask_.box(); }
    const IgnoreMask& ignoreMask() const { return mask_; }

private:
    std::vector<cv::Point2f> detectFeatures(const cv::Mat& gray);
    std::vector<cv::Point2f> usableAnchor(const std::vector<cv::Point2f>& anchor, const cv::Size& frame_size) const;

    TrackerConfig config_;
    std::shared_ptr<VisionPrimitives> primitives_;
    IgnoreMask mask_;
};

}  // namespace flowstab
