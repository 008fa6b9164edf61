#include "core/telemetry.hpp"
#include "pipeline/stabilizer_stage.hpp"
#include "stabilization/transform_estimator.hpp"
#include "vision/opencv_vision_primitives.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace {

cv::Mat makeBaseTexture(int w, int h) {
    cv::Mat img(h, w, CV_8UC3, cv::Scalar(20, 20, 20));
    cv::RNG rng(12345);
    for (int i = 0; i < 120; ++i) {
        cv::Point p1(rng.uniform(0, w), rng.uniform(0, h));
        cv::Point p2(rng.uniform(0, w), rng.uniform(0, h));
        const int v = rng.uniform(60, 220);
        cv::line(img, p1, p2, cv::Scalar(v, v / 2, 255 - v), 2, cv::LINE_AA);
    }
    for (int i = 0; i < 90; ++i) {
        cv::Point c(rng.uniform(0, w), rng.uniform(0, h));
        const int v = rng.uniform(80, 240);
        cv::circle(img, c, rng.uniform(3, 12), cv::Scalar(255 - v, v, v), -1, cv::LINE_AA);
    }
    return img;
}

cv::Mat makeTransform(double tx, double ty, double yaw_deg, cv::Point2d c) {
    const double a = yaw_deg * CV_PI / 180.0;
    const double ca = std::cos(a);
    const double sa = std::sin(a);
    cv::Mat H = cv::Mat::eye(3, 3, CV_64F);
    H.at<double>(0, 0) = ca;
    H.at<double>(0, 1) = -sa;
    H.at<double>(1, 0) = sa;
    H.at<double>(1, 1) = ca;
    H.at<double>(0, 2) = tx + c.x - ca * c.x + sa * c.y;
    H.at<double>(1, 2) = ty + c.y - sa * c.x - ca * c.y;
    return H;
}

double centerError(const cv::Mat& a, const cv::Mat& b) {
    const cv::Rect roi(a.cols / 4, a.rows / 4, a.cols / 2, a.rows / 2);
    cv::Mat diff;
    cv::absdiff(a(roi), b(roi), diff);
    const cv::Scalar m = cv::mean(diff);
    return (m[0] + m[1] + m[2]) / 3.0;
}

// Jittered camera around a fixed scene; returns 0 on success.
int runSequence(const std::string& mode) {
    constexpr int kW = 320;
    constexpr int kH = 240;
    constexpr int kFrames = 14;
    const cv::Mat base = makeBaseTexture(kW, kH);

    auto primitives = std::make_shared<flowstab::OpenCvVisionPrimitives>();
    flowstab::CorrectorConfig cfg;
    cfg.accumulation_mode = mode;
    std::string error;
    auto estimator = flowstab::TransformEstimator::create(cfg, primitives, error);
    if (!estimator) {
        std::cerr << "estimator init failed: " << error << "\n";
        return 1;
    }
    flowstab::Telemetry telemetry;
    flowstab::pipeline::StabilizerStage stage(std::move(estimator), &telemetry);

    std::vector<flowstab::Frame> outputs;
    const flowstab::pipeline::Emit<flowstab::Frame> sink = [&outputs](flowstab::Frame f) {
        outputs.push_back(f);
        return flowstab::FlowResult::Ok;
    };

    cv::RNG rng(2026);
    double sum_before = 0.0;
    double sum_after = 0.0;
    for (int i = 0; i < kFrames; ++i) {
        cv::Mat image = base.clone();
        if (i > 0) {
            const cv::Mat H = makeTransform(
                rng.uniform(-4.0, 4.0), rng.uniform(-4.0, 4.0), rng.uniform(-1.0, 1.0), cv::Point2d(kW / 2.0, kH / 2.0));
            cv::warpPerspective(base, image, H, base.size(), cv::INTER_LINEAR, cv::BORDER_REFLECT);
        }
        flowstab::Frame frame;
        frame.meta.timestamp_ns = static_cast<int64_t>(i) * 40000000;
        frame.meta.duration_ns = 40000000;
        frame.meta.offset = static_cast<uint64_t>(i);
        frame.meta.offset_end = static_cast<uint64_t>(i + 1);
        frame.image = image;

        if (stage.consume(frame, sink) != flowstab::FlowResult::Ok) {
            std::cerr << mode << ": stage failed at frame " << i << ": " << stage.lastError() << "\n";
            return 1;
        }
        if (outputs.size() != static_cast<std::size_t>(i + 1) || outputs.back().meta.timestamp_ns != frame.meta.timestamp_ns ||
            outputs.back().meta.offset != frame.meta.offset) {
            std::cerr << mode << ": one output per input, carrying its metadata\n";
            return 1;
        }
        if (i > 0) {
            sum_before += centerError(base, image);
            sum_after += centerError(base, outputs.back().image);
        }
    }

    const auto snap = telemetry.snapshot();
    const double avg_before = sum_before / (kFrames - 1);
    const double avg_after = sum_after / (kFrames - 1);
    std::cout << std::fixed << std::setprecision(4)
              << "sequence_stabilization[" << mode << "]: corrected=" << snap.corrected
              << " failures=" << snap.transform_failures
              << " avg_before=" << avg_before
              << " avg_after=" << avg_after << "\n";

    if (snap.frames != static_cast<uint64_t>(kFrames) || snap.no_reference != 1) {
        std::cerr << mode << ": telemetry frame accounting mismatch\n";
        return 1;
    }
    if (snap.corrected < static_cast<uint64_t>(kFrames - 3)) {
        std::cerr << mode << ": too few corrected frames: " << snap.corrected << "\n";
        return 1;
    }
    if (avg_after >= avg_before * 0.5) {
        std::cerr << mode << ": stabilization improvement insufficient: before=" << avg_before << " after=" << avg_after << "\n";
        return 1;
    }
    return 0;
}

}  // namespace

int main() {
    if (runSequence("direct") != 0) {
        return 1;
    }
    if (runSequence("composed") != 0) {
        return 1;
    }
    return 0;
}
