#pragma once

#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

namespace flowstab {

enum class VisionStatus {
    Ok,
    InvalidInput,    // empty image, wrong type, size mismatch
    Degenerate,      // too few points, no solution, singular transform
    NumericalError,  // the backend raised an error
};

const char* toString(VisionStatus status);

struct RansacParams {
    double reproj_threshold_px{3.0};
    double confidence{0.995};
    int max_iters{2000};
};

struct HomographyFit {
    cv::Matx33d H{cv::Matx33d::eye()};  // origins -> destinations
    int inliers{0};
    float inlier_ratio{0.0F};
    float reproj_rmse{0.0F};
};

struct FeatureSet {
    std::vector<cv::KeyPoint> keypoints;
    cv::Mat descriptors;
};

// Low-level vision operations the tracker and the estimator are built on.
// Implementations never throw; failures come back as a VisionStatus.
class VisionPrimitives {
public:
    virtual ~VisionPrimitives() = default;

    virtual VisionStatus detectCorners(
        const cv::Mat& gray,
        int max_count,
        double quality_level,
        double min_distance,
        const cv::Mat& mask,
        std::vector<cv::Point2f>& out_corners) = 0;

    virtual VisionStatus refineSubpixel(
        const cv::Mat& gray,
        std::vector<cv::Point2f>& points,
        const cv::Size& window,
        const cv::TermCriteria& criteria) = 0;

    virtual VisionStatus trackPoints(
        const cv::Mat& prev_gray,
        const cv::Mat& cur_gray,
        const std::vector<cv::Point2f>& points,
        const cv::Size& window,
        int pyramid_levels,
        const cv::TermCriteria& criteria,
        std::vector<cv::Point2f>& out_tracked,
        std::vector<uint8_t>& out_status,
        std::vector<float>& out_errors) = 0;

    virtual VisionStatus fitHomography(
        const std::vector<cv::Point2f>& origins,
        const std::vector<cv::Point2f>& destinations,
        const RansacParams& params,
        HomographyFit& out_fit) = 0;

    // Writes src into dst through the inverse of H (H maps dst coordinates to
    // src coordinates). Pixels with no source keep their current dst value;
    // an empty dst is first zero-filled at src's size.
    virtual VisionStatus warpPerspective(
        const cv::Mat& src,
        const cv::Matx33d& H,
        cv::Mat& dst) = 0;

    virtual VisionStatus detectAndDescribe(
        const cv::Mat& gray,
        const cv::Mat& mask,
        int max_features,
        FeatureSet& out_features) = 0;

    // Ratio-tested matches; queryIdx indexes `query`, trainIdx indexes `train`.
    virtual VisionStatus matchDescriptors(
        const FeatureSet& query,
        const FeatureSet& train,
        float ratio,
        std::vector<cv::DMatch>& out_matches) = 0;
};

}  // namespace flowstab
