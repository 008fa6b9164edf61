#pragma once

#include <opencv2/core.hpp>

#include "core/types.hpp"
#include "pipeline/stage.hpp"

namespace flowstab {

struct ArrowStyle {
    cv::Scalar color{0, 0, 255};  // BGR red
    int thickness{2};
    double head_length_px{20.0};
    double head_angle_rad{CV_PI / 6.0};
};

// Tips of the two head strokes drawn back from `end`. False for a zero-length arrow.
bool computeArrowHead(
    const cv::Point& origin,
    const cv::Point& end,
    double head_length_px,
    double head_angle_rad,
    cv::Point& out_left,
    cv::Point& out_right);

void drawFlowArrows(cv::Mat& image, const Correspondences& flow, const ArrowStyle& style = {});

// StreamMuxer combine overlaying motion arrows on a copy of each frame.
class FlowDrawer {
public:
    explicit FlowDrawer(ArrowStyle style = {});

    FlowResult operator()(Frame frame, const MotionRecord& record, const pipeline::Emit<Frame>& emit) const;

private:
    ArrowStyle style_;
};

}  // namespace flowstab
