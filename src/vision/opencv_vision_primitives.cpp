#include "vision/opencv_vision_primitives.hpp"

#include <cmath>

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/video/tracking.hpp>

#include "core/math_utils.hpp"

namespace flowstab {

namespace {

bool isGray8(const cv::Mat& img) {
    return !img.empty() && img.type() == CV_8UC1;
}

bool maskMatches(const cv::Mat& mask, const cv::Mat& img) {
    return mask.empty() || (mask.type() == CV_8UC1 && mask.size() == img.size());
}

}  // namespace

VisionStatus OpenCvVisionPrimitives::detectCorners(
    const cv::Mat& gray,
    int max_count,
    double quality_level,
    double min_distance,
    const cv::Mat& mask,
    std::vector<cv::Point2f>& out_corners) {
    out_corners.clear();
    if (!isGray8(gray) || !maskMatches(mask, gray) || max_count <= 0) {
        return VisionStatus::InvalidInput;
    }

    try {
        cv::goodFeaturesToTrack(gray, out_corners, max_count, quality_level, min_distance, mask);
    } catch (const cv::Exception&) {
        out_corners.clear();
        return VisionStatus::NumericalError;
    }
    return VisionStatus::Ok;
}

VisionStatus OpenCvVisionPrimitives::refineSubpixel(
    const cv::Mat& gray,
    std::vector<cv::Point2f>& points,
    const cv::Size& window,
    const cv::TermCriteria& criteria) {
    if (!isGray8(gray)) {
        return VisionStatus::InvalidInput;
    }
    if (points.empty()) {
        return VisionStatus::Ok;
    }

    try {
        cv::cornerSubPix(gray, points, window, cv::Size(-1, -1), criteria);
    } catch (const cv::Exception&) {
        return VisionStatus::NumericalError;
    }
    return VisionStatus::Ok;
}

VisionStatus OpenCvVisionPrimitives::trackPoints(
    const cv::Mat& prev_gray,
    const cv::Mat& cur_gray,
    const std::vector<cv::Point2f>& points,
    const cv::Size& window,
    int pyramid_levels,
    const cv::TermCriteria& criteria,
    std::vector<cv::Point2f>& out_tracked,
    std::vector<uint8_t>& out_status,
    std::vector<float>& out_errors) {
    out_tracked.clear();
    out_status.clear();
    out_errors.clear();
    if (!isGray8(prev_gray) || !isGray8(cur_gray) || prev_gray.size() != cur_gray.size()) {
        return VisionStatus::InvalidInput;
    }
    if (points.empty()) {
        return VisionStatus::Ok;
    }

    try {
        cv::calcOpticalFlowPyrLK(
            prev_gray,
            cur_gray,
            points,
            out_tracked,
            out_status,
            out_errors,
            window,
            pyramid_levels,
            criteria);
    } catch (const cv::Exception&) {
        out_tracked.clear();
        out_status.clear();
        out_errors.clear();
        return VisionStatus::NumericalError;
    }

    if (out_tracked.size() != points.size() || out_status.size() != points.size()) {
        return VisionStatus::NumericalError;
    }
    return VisionStatus::Ok;
}

VisionStatus OpenCvVisionPrimitives::fitHomography(
    const std::vector<cv::Point2f>& origins,
    const std::vector<cv::Point2f>& destinations,
    const RansacParams& params,
    HomographyFit& out_fit) {
    out_fit = HomographyFit{};
    if (origins.size() != destinations.size()) {
        return VisionStatus::InvalidInput;
    }
    if (origins.size() < 4) {
        return VisionStatus::Degenerate;
    }

    cv::Mat inlier_mask;
    cv::Mat H;
    try {
        H = cv::findHomography(
            origins,
            destinations,
            cv::RANSAC,
            params.reproj_threshold_px,
            inlier_mask,
            params.max_iters,
            params.confidence);
    } catch (const cv::Exception&) {
        return VisionStatus::NumericalError;
    }

    if (H.empty() || inlier_mask.empty()) {
        return VisionStatus::Degenerate;
    }

    cv::Mat H64;
    H.convertTo(H64, CV_64F);
    const cv::Matx33d Hd(H64.ptr<double>());
    if (!isInvertibleTransform(Hd)) {
        return VisionStatus::Degenerate;
    }

    int inlier_count = 0;
    double sq_error_sum = 0.0;
    for (int i = 0; i < static_cast<int>(origins.size()); ++i) {
        if (inlier_mask.at<unsigned char>(i) == 0U) {
            continue;
        }
        const cv::Point2f diff = applyHomography(Hd, origins[i]) - destinations[i];
        sq_error_sum += static_cast<double>(diff.x * diff.x + diff.y * diff.y);
        ++inlier_count;
    }

    out_fit.H = Hd;
    out_fit.inliers = inlier_count;
    out_fit.inlier_ratio = static_cast<float>(inlier_count) / static_cast<float>(origins.size());
    out_fit.reproj_rmse = (inlier_count > 0)
        ? static_cast<float>(std::sqrt(sq_error_sum / static_cast<double>(inlier_count)))
        : 0.0F;
    return VisionStatus::Ok;
}

VisionStatus OpenCvVisionPrimitives::warpPerspective(
    const cv::Mat& src,
    const cv::Matx33d& H,
    cv::Mat& dst) {
    if (src.empty()) {
        return VisionStatus::InvalidInput;
    }
    if (!isInvertibleTransform(H)) {
        return VisionStatus::Degenerate;
    }
    if (dst.empty() || dst.size() != src.size() || dst.type() != src.type()) {
        dst = cv::Mat::zeros(src.size(), src.type());
    }

    try {
        cv::warpPerspective(
            src,
            dst,
            cv::Mat(H),
            dst.size(),
            cv::INTER_LINEAR | cv::WARP_INVERSE_MAP,
            cv::BORDER_TRANSPARENT);
    } catch (const cv::Exception&) {
        return VisionStatus::NumericalError;
    }
    return VisionStatus::Ok;
}

VisionStatus OpenCvVisionPrimitives::detectAndDescribe(
    const cv::Mat& gray,
    const cv::Mat& mask,
    int max_features,
    FeatureSet& out_features) {
    out_features = FeatureSet{};
    if (!isGray8(gray) || !maskMatches(mask, gray) || max_features <= 0) {
        return VisionStatus::InvalidInput;
    }

    try {
        if (!orb_) {
            orb_ = cv::ORB::create(max_features);
        } else {
            orb_->setMaxFeatures(max_features);
        }
        orb_->detectAndCompute(gray, mask, out_features.keypoints, out_features.descriptors);
    } catch (const cv::Exception&) {
        out_features = FeatureSet{};
        return VisionStatus::NumericalError;
    }
    return VisionStatus::Ok;
}

VisionStatus OpenCvVisionPrimitives::matchDescriptors(
    const FeatureSet& query,
    const FeatureSet& train,
    float ratio,
    std::vector<cv::DMatch>& out_matches) {
    out_matches.clear();
    if (query.descriptors.empty() || train.descriptors.empty()) {
        return VisionStatus::Ok;
    }
    if (query.descriptors.type() != train.descriptors.type() ||
        query.descriptors.cols != train.descriptors.cols) {
        return VisionStatus::InvalidInput;
    }

    std::vector<std::vector<cv::DMatch>> knn_matches;
    try {
        if (!matcher_) {
            // ORB uses binary descriptors -> Hamming distance
            matcher_ = cv::BFMatcher::create(cv::NORM_HAMMING, false);
        }
        matcher_->knnMatch(query.descriptors, train.descriptors, knn_matches, 2);
    } catch (const cv::Exception&) {
        return VisionStatus::NumericalError;
    }

    // Lowe's ratio test
    for (const auto& m : knn_matches) {
        if (m.size() < 2) {
            continue;
        }
        if (m[0].distance < ratio * m[1].distance) {
            out_matches.push_back(m[0]);
        }
    }
    return VisionStatus::Ok;
}

}  // namespace flowstab
