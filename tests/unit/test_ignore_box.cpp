#include "core/ignore_box.hpp"

#include <iostream>

int main() {
    const flowstab::IgnoreBox disabled = flowstab::IgnoreBox::fromBounds(10, -1, 10, 20);
    if (disabled.enabled() || disabled.contains(cv::Point2f(15.0F, 15.0F))) {
        std::cerr << "box with a -1 bound must be disabled and contain nothing\n";
        return 1;
    }

    const flowstab::IgnoreBox box = flowstab::IgnoreBox::fromBounds(10, 20, 30, 40);
    if (!box.enabled()) {
        std::cerr << "box with four bounds must be enabled\n";
        return 1;
    }
    // Bounds are inclusive.
    if (!box.contains(cv::Point2f(10.0F, 30.0F)) || !box.contains(cv::Point2f(20.0F, 40.0F)) ||
        !box.contains(cv::Point2f(15.5F, 35.5F))) {
        std::cerr << "box should contain its edges and interior\n";
        return 1;
    }
    if (box.contains(cv::Point2f(9.9F, 35.0F)) || box.contains(cv::Point2f(15.0F, 40.1F))) {
        std::cerr << "box should not contain points outside its bounds\n";
        return 1;
    }

    flowstab::IgnoreMask no_mask(disabled);
    if (!no_mask.maskFor(cv::Size(64, 48)).empty() || no_mask.built()) {
        std::cerr << "disabled box should give an empty mask\n";
        return 1;
    }

    flowstab::IgnoreMask mask(box);
    const cv::Mat& m = mask.maskFor(cv::Size(64, 48));
    if (m.empty() || m.type() != CV_8UC1 || m.size() != cv::Size(64, 48)) {
        std::cerr << "mask should be CV_8UC1 at frame size\n";
        return 1;
    }
    if (m.at<uchar>(30, 10) != 0 || m.at<uchar>(40, 20) != 0 || m.at<uchar>(35, 15) != 0) {
        std::cerr << "mask should be 0 inside the box\n";
        return 1;
    }
    if (m.at<uchar>(29, 10) != 1 || m.at<uchar>(35, 21) != 1 || m.at<uchar>(0, 0) != 1) {
        std::cerr << "mask should be 1 outside the box\n";
        return 1;
    }
    const int zeros = static_cast<int>(m.total()) - cv::countNonZero(m);
    if (zeros != 11 * 11) {
        std::cerr << "unexpected masked pixel count: " << zeros << "\n";
        return 1;
    }

    // Built once and reused.
    const uchar* first_data = m.data;
    if (mask.maskFor(cv::Size(64, 48)).data != first_data) {
        std::cerr << "mask should not be rebuilt\n";
        return 1;
    }

    // A box past the frame edge is clipped.
    flowstab::IgnoreMask clipped(flowstab::IgnoreBox::fromBounds(50, 500, 40, 400));
    const cv::Mat& c = clipped.maskFor(cv::Size(64, 48));
    if (c.at<uchar>(47, 63) != 0 || c.at<uchar>(39, 63) != 1) {
        std::cerr << "clipped box mask mismatch\n";
        return 1;
    }

    return 0;
}
