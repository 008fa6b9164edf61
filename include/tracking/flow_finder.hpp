#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/ignore_box.hpp"
#include "core/types.hpp"
#include "vision/vision_primitives.hpp"

namespace flowstab {

// Finds point correspondences between two gray frames of the same stream.
class FlowFinder {
public:
    virtual ~FlowFinder() = default;

    // An empty prev_gray means there is no previous frame: the record has no flow.
    // `anchor`, when given, holds points already known in prev_gray that may be
    // tracked instead of detecting new ones.
    virtual MotionRecord findFlow(
        const cv::Mat& prev_gray,
        const cv::Mat& cur_gray,
        int64_t timestamp_ns,
        const std::vector<cv::Point2f>* anchor = nullptr) = 0;

    virtual const IgnoreBox& ignoreBox() const = 0;

    // Status of the last primitive call that failed during findFlow, Ok otherwise.
    VisionStatus lastStatus() const { return last_status_; }
    void setVerbose(bool verbose) { verbose_ = verbose; }

protected:
    VisionStatus last_status_{VisionStatus::Ok};
    bool verbose_{false};
};

// Returns nullptr and sets `error` when the configured algorithm is unknown.
std::unique_ptr<FlowFinder> createFlowFinder(
    const TrackerConfig& config,
    std::shared_ptr<VisionPrimitives> primitives,
    std::string& error);

}  // namespace flowstab
