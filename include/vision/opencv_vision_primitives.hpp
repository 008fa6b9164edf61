#pragma once

#include <opencv2/features2d.hpp>

#include "vision/vision_primitives.hpp"

namespace flowstab {

class OpenCvVisionPrimitives : public VisionPrimitives {
public:
    OpenCvVisionPrimitives() = default;

    VisionStatus detectCorners(
        const cv::Mat& gray,
        int max_count,
        double quality_level,
        double min_distance,
        const cv::Mat& mask,
        std::vector<cv::Point2f>& out_corners) override;

    VisionStatus refineSubpixel(
        const cv::Mat& gray,
        std::vector<cv::Point2f>& points,
        const cv::Size& window,
        const cv::TermCriteria& criteria) override;

    VisionStatus trackPoints(
        const cv::Mat& prev_gray,
        const cv::Mat& cur_gray,
        const std::vector<cv::Point2f>& points,
        const cv::Size& window,
        int pyramid_levels,
        const cv::TermCriteria& criteria,
        std::vector<cv::Point2f>& out_tracked,
        std::vector<uint8_t>& out_status,
        std::vector<float>& out_errors) override;

    VisionStatus fitHomography(
        const std::vector<cv::Point2f>& origins,
        const std::vector<cv::Point2f>& destinations,
        const RansacParams& params,
        HomographyFit& out_fit) override;

    VisionStatus warpPerspective(
        const cv::Mat& src,
        const cv::Matx33d& H,
        cv::Mat& dst) override;

    VisionStatus detectAndDescribe(
        const cv::Mat& gray,
        const cv::Mat& mask,
        int max_features,
        FeatureSet& out_features) override;

    VisionStatus matchDescriptors(
        const FeatureSet& query,
        const FeatureSet& train,
        float ratio,
        std::vector<cv::DMatch>& out_matches) override;

private:
    cv::Ptr<cv::ORB> orb_;
    cv::Ptr<cv::BFMatcher> matcher_;
};

}  // namespace flowstab
