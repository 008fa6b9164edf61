#include "render/flow_drawer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace flowstab {

bool computeArrowHead(
    const cv::Point& origin,
    const cv::Point& end,
    double head_length_px,
    double head_angle_rad,
    cv::Point& out_left,
    cv::Point& out_right) {
    const double dx = static_cast<double>(origin.x - end.x);
    const double dy = static_cast<double>(origin.y - end.y);
    const double length = std::sqrt(dx * dx + dy * dy);
    if (length == 0.0) {
        return false;
    }

    // beta: direction from the tip back to the origin
    const double cos_beta = dx / length;
    const double sin_beta = dy / length;
    const double cos_alpha = std::cos(head_angle_rad);
    const double sin_alpha = std::sin(head_angle_rad);

    out_left = cv::Point(
        cvRound(end.x + head_length_px * (cos_alpha * cos_beta - sin_alpha * sin_beta)),
        cvRound(end.y + head_length_px * (sin_beta * cos_alpha + sin_alpha * cos_beta)));
    out_right = cv::Point(
        cvRound(end.x + head_length_px * (cos_alpha * cos_beta + sin_alpha * sin_beta)),
        cvRound(end.y + head_length_px * (sin_beta * cos_alpha - sin_alpha * cos_beta)));
    return true;
}

void drawFlowArrows(cv::Mat& image, const Correspondences& flow, const ArrowStyle& style) {
    const std::size_t count = std::min(flow.origins.size(), flow.destinations.size());
    for (std::size_t i = 0; i < count; ++i) {
        const cv::Point origin(static_cast<int>(flow.origins[i].x), static_cast<int>(flow.origins[i].y));
        const cv::Point end(static_cast<int>(flow.destinations[i].x), static_cast<int>(flow.destinations[i].y));
        cv::line(image, origin, end, style.color, style.thickness);

        cv::Point left;
        cv::Point right;
        if (!computeArrowHead(origin, end, style.head_length_px, style.head_angle_rad, left, right)) {
            continue;
        }
        cv::line(image, end, left, style.color, style.thickness);
        cv::line(image, end, right, style.color, style.thickness);
    }
}

FlowDrawer::FlowDrawer(ArrowStyle style)
    : style_(style) {}

FlowResult FlowDrawer::operator()(Frame frame, const MotionRecord& record, const pipeline::Emit<Frame>& emit) const {
    if (!record.flow) {
        return emit(std::move(frame));
    }

    Frame out;
    out.meta = frame.meta;
    out.image = frame.image.clone();
    drawFlowArrows(out.image, *record.flow, style_);
    return emit(std::move(out));
}

}  // namespace flowstab
