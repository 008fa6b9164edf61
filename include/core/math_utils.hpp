#pragma once

#include <vector>

#include <opencv2/core.hpp>

namespace flowstab {

constexpr double kMinHomographyDeterminant = 1e-9;

cv::Matx33d identityTransform();
bool isFiniteTransform(const cv::Matx33d& H);
bool isInvertibleTransform(const cv::Matx33d& H, double min_abs_det = kMinHomographyDeterminant);
cv::Matx33d normalizeHomography(const cv::Matx33d& H);
cv::Point2f applyHomography(const cv::Matx33d& H, const cv::Point2f& p);
std::vector<cv::Point2f> applyHomography(const cv::Matx33d& H, const std::vector<cv::Point2f>& points);
double maxAbsDifference(const cv::Matx33d& a, const cv::Matx33d& b);

}  // namespace flowstab
