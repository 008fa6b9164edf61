#include "core/math_utils.hpp"

#include <algorithm>
#include <cmath>

namespace flowstab {

cv::Matx33d identityTransform() {
    return cv::Matx33d::eye();
}

bool isFiniteTransform(const cv::Matx33d& H) {
    for (int i = 0; i < 9; ++i) {
        if (!std::isfinite(H.val[i])) {
            return false;
        }
    }
    return true;
}

bool isInvertibleTransform(const cv::Matx33d& H, double min_abs_det) {
    if (!isFiniteTransform(H)) {
        return false;
    }
    // Scale-free test: compare against the magnitude of the normalized matrix.
    const cv::Matx33d Hn = normalizeHomography(H);
    return isFiniteTransform(Hn) && std::abs(cv::determinant(Hn)) > min_abs_det;
}

cv::Matx33d normalizeHomography(const cv::Matx33d& H) {
    const double w = H(2, 2);
    if (std::abs(w) < 1e-12) {
        return H;
    }
    return H * (1.0 / w);
}

cv::Point2f applyHomography(const cv::Matx33d& H, const cv::Point2f& p) {
    const cv::Vec3d q = H * cv::Vec3d(p.x, p.y, 1.0);
    if (std::abs(q[2]) < 1e-12) {
        return cv::Point2f(static_cast<float>(q[0]), static_cast<float>(q[1]));
    }
    return cv::Point2f(static_cast<float>(q[0] / q[2]), static_cast<float>(q[1] / q[2]));
}

std::vector<cv::Point2f> applyHomography(const cv::Matx33d& H, const std::vector<cv::Point2f>& points) {
    std::vector<cv::Point2f> out;
    out.reserve(points.size());
    for (const auto& p : points) {
        out.push_back(applyHomography(H, p));
    }
    return out;
}

double maxAbsDifference(const cv::Matx33d& a, const cv::Matx33d& b) {
    double worst = 0.0;
    for (int i = 0; i < 9; ++i) {
        worst = std::max(worst, std::abs(a.val[i] - b.val[i]));
    }
    return worst;
}

}  // namespace flowstab
