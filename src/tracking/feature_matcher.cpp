#include "tracking/feature_matcher.hpp"

#include <iostream>
#include <utility>

namespace flowstab {

FeatureMatcher::FeatureMatcher(TrackerConfig config, std::shared_ptr<VisionPrimitives> primitives)
    : config_(std::move(config)),
      primitives_(std::move(primitives)),
      mask_(config_.ignoreBox()) {}

MotionRecord FeatureMatcher::findFlow(
    const cv::Mat& prev_gray,
    const cv::Mat& cur_gray,
    int64_t timestamp_ns,
    const std::vector<cv::Point2f>* /*anchor*/) {
    MotionRecord record;
    record.timestamp_ns = timestamp_ns;
    last_status_ = VisionStatus::Ok;
    if (prev_gray.empty()) {
        return record;
    }

    const cv::Mat& mask = mask_.maskFor(prev_gray.size());
    FeatureSet prev_features;
    FeatureSet cur_features;
    std::vector<cv::DMatch> matches;

    VisionStatus status = primitives_->detectAndDescribe(prev_gray, mask, config_.orb_features, prev_features);
    if (status == VisionStatus::Ok) {
        status = primitives_->detectAndDescribe(cur_gray, mask, config_.orb_features, cur_features);
    }
    if (status == VisionStatus::Ok) {
        status = primitives_->matchDescriptors(prev_features, cur_features, config_.match_ratio, matches);
    }

    Correspondences flow;
    if (status != VisionStatus::Ok) {
        last_status_ = status;
        std::cerr << "[matcher] feature matching failed: " << toString(status) << '\n';
        record.flow = std::move(flow);
        return record;
    }

    const IgnoreBox& box = mask_.box();
    flow.origins.reserve(matches.size());
    flow.destinations.reserve(matches.size());
    for (const auto& m : matches) {
        const cv::Point2f& origin = prev_features.keypoints[static_cast<std::size_t>(m.queryIdx)].pt;
        const cv::Point2f& destination = cur_features.keypoints[static_cast<std::size_t>(m.trainIdx)].pt;
        if (box.contains(origin) || box.contains(destination)) {
            continue;
        }
        flow.origins.push_back(origin);
        flow.destinations.push_back(destination);
    }

    if (verbose_) {
        std::cerr << "[matcher] " << prev_features.keypoints.size() << '/' << cur_features.keypoints.size()
                  << " features, " << flow.size() << " matches kept\n";
    }
    record.flow = std::move(flow);
    return record;
}

}  // namespace flowstab
