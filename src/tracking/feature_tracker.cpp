#include "tracking/feature_tracker.hpp"

#include <iostream>
#include <utility>

namespace flowstab {

namespace {

bool insideFrame(const cv::Point2f& p, const cv::Size& frame_size) {
    return p.x >= 0.0F && p.y >= 0.0F &&
           p.x <= static_cast<float>(frame_size.width - 1) &&
           p.y <= static_cast<float>(frame_size.height - 1);
}

}  // namespace

FeatureTracker::FeatureTracker(TrackerConfig config, std::shared_ptr<VisionPrimitives> primitives)
    : config_(std::move(config)),
      primitives_(std::move(primitives)),
      mask_(config_.ignoreBox()) {}

std::vector<cv::Point2f> FeatureTracker::detectFeatures(const cv::Mat& gray) {
    std::vector<cv::Point2f> corners;
    const VisionStatus detect_status = primitives_->detectCorners(
        gray,
        config_.corner_count,
        config_.corner_quality_level,
        static_cast<double>(config_.corner_min_distance),
        mask_.maskFor(gray.size()),
        corners);
    if (detect_status != VisionStatus::Ok) {
        last_status_ = detect_status;
        std::cerr << "[tracker] corner detection failed: " << toString(detect_status) << '\n';
        return {};
    }

    const cv::TermCriteria subpix_criteria(
        cv::TermCriteria::COUNT | cv::TermCriteria::EPS,
        config_.subpix_max_iterations,
        config_.subpix_epsilon);
    const VisionStatus refine_status = primitives_->refineSubpixel(
        gray,
        corners,
        cv::Size(config_.subpix_window, config_.subpix_window),
        subpix_criteria);
    if (refine_status != VisionStatus::Ok) {
        // unrefined corners are still usable
        last_status_ = refine_status;
        std::cerr << "[tracker] sub-pixel refinement failed: " << toString(refine_status) << '\n';
    }
    return corners;
}

std::vector<cv::Point2f> FeatureTracker::usableAnchor(
    const std::vector<cv::Point2f>& anchor,
    const cv::Size& frame_size) const {
    std::vector<cv::Point2f> usable;
    usable.reserve(anchor.size());
    for (const auto& p : anchor) {
        if (insideFrame(p, frame_size) && !mask_.box().contains(p)) {
            usable.push_back(p);
        }
    }
    return usable;
}

MotionRecord FeatureTracker::findFlow(
    const cv::Mat& prev_gray,
    const cv::Mat& cur_gray,
    int64_t timestamp_ns,
    const std::vector<cv::Point2f>* anchor) {
    MotionRecord record;
    record.timestamp_ns = timestamp_ns;
    last_status_ = VisionStatus::Ok;
    if (prev_gray.empty()) {
        return record;
    }

    std::vector<cv::Point2f> origins;
    if (anchor != nullptr && config_.anchor_min_points > 0) {
        origins = usableAnchor(*anchor, prev_gray.size());
        if (static_cast<int>(origins.size()) < config_.anchor_min_points) {
            origins.clear();
        }
    }
    if (origins.empty()) {
        origins = detectFeatures(prev_gray);
        if (verbose_) {
            std::cerr << "[tracker] found " << origins.size() << " features\n";
        }
    }

    std::vector<cv::Point2f> tracked;
    std::vector<uint8_t> status;
    std::vector<float> errors;
    const cv::TermCriteria lk_criteria(
        cv::TermCriteria::COUNT | cv::TermCriteria::EPS,
        config_.max_iterations,
        config_.epsilon);
    const VisionStatus track_status = primitives_->trackPoints(
        prev_gray,
        cur_gray,
        origins,
        cv::Size(config_.win_size, config_.win_size),
        config_.pyramid_level,
        lk_criteria,
        tracked,
        status,
        errors);

    Correspondences flow;
    if (track_status != VisionStatus::Ok) {
        last_status_ = track_status;
        std::cerr << "[tracker] point tracking failed: " << toString(track_status) << '\n';
        record.flow = std::move(flow);
        return record;
    }

    const IgnoreBox& box = mask_.box();
    flow.origins.reserve(origins.size());
    flow.destinations.reserve(origins.size());
    for (std::size_t i = 0; i < origins.size(); ++i) {
        if (status[i] == 0U || box.contains(origins[i]) || box.contains(tracked[i])) {
            continue;
        }
        flow.origins.push_back(origins[i]);
        flow.destinations.push_back(tracked[i]);
    }

    if (verbose_) {
        std::cerr << "[tracker] correspondences kept: " << flow.size() << '/' << origins.size() << '\n';
    }
    record.flow = std::move(flow);
    return record;
}

}  // namespace flowstab
