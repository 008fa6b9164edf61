#pragma once

#include <memory>

#include "core/config.hpp"
#include "tracking/flow_finder.hpp"

namespace flowstab {

// Re-detects ORB features in both frames and pairs them by descriptor.
// Survives large inter-frame motion at the cost of precision.
class FeatureMatcher : public FlowFinder {
public:
    FeatureMatcher(TrackerConfig config, std::shared_ptr<VisionPrimitives> primitives);

    MotionRecord findFlow(
        const cv::Mat& prev_gray,
        const cv::Mat& cur_gray,
        int64_t timestamp_ns,
        const std::vector<cv::Point2f>* anchor = nullptr) override;

    const IgnoreBox& ignoreBox() const override { return mask_.box(); }

private:
    TrackerConfig config_;
    std::shared_ptr<VisionPrimitives> primitives_;
    IgnoreMask mask_;
};

}  // namespace flowstab
