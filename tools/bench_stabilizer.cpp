#include "core/config.hpp"
#include "core/telemetry.hpp"
#include "core/time_utils.hpp"
#include "pipeline/flow_finder_stage.hpp"
#include "pipeline/stabilizer_stage.hpp"
#include "stabilization/transform_estimator.hpp"
#include "vision/opencv_vision_primitives.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace {

cv::Mat makeBaseTexture(int w, int h) {
    cv::Mat img(h, w, CV_8UC3, cv::Scalar(20, 20, 20));
    cv::RNG rng(777);
    for (int i = 0; i < 160; ++i) {
        cv::Point p1(rng.uniform(0, w), rng.uniform(0, h));
        cv::Point p2(rng.uniform(0, w), rng.uniform(0, h));
        const int v = rng.uniform(60, 230);
        cv::line(img, p1, p2, cv::Scalar(v, 255 - v, v / 2), 1, cv::LINE_AA);
    }
    for (int i = 0; i < 120; ++i) {
        cv::Point c(rng.uniform(0, w), rng.uniform(0, h));
        const int v = rng.uniform(80, 240);
        cv::circle(img, c, rng.uniform(3, 14), cv::Scalar(v, v, 255 - v), -1, cv::LINE_AA);
    }
    return img;
}

cv::Mat shifted(const cv::Mat& base, double dx, double dy) {
    const cv::Matx23d M(1.0, 0.0, dx, 0.0, 1.0, dy);
    cv::Mat out;
    cv::warpAffine(base, out, cv::Mat(M), base.size(), cv::INTER_LINEAR, cv::BORDER_REFLECT);
    return out;
}

double centerError(const cv::Mat& a, const cv::Mat& b) {
    const cv::Rect roi(a.cols / 4, a.rows / 4, a.cols / 2, a.rows / 2);
    cv::Mat diff;
    cv::absdiff(a(roi), b(roi), diff);
    const cv::Scalar m = cv::mean(diff);
    return (m[0] + m[1] + m[2]) / 3.0;
}

int64_t pct(std::vector<int64_t>& v, double p) {
    if (v.empty()) return 0;
    std::sort(v.begin(), v.end());
    const std::size_t idx = static_cast<std::size_t>(p * static_cast<double>(v.size() - 1));
    return v[idx];
}

}  // namespace

int main(int argc, char** argv) {
    constexpr int kW = 640;
    constexpr int kH = 480;
    const int frame_count = (argc > 1) ? std::max(2, std::stoi(argv[1])) : 300;
    const std::string mode = (argc > 2) ? argv[2] : "direct";

    const cv::Mat base = makeBaseTexture(kW, kH);
    auto primitives = std::make_shared<flowstab::OpenCvVisionPrimitives>();

    flowstab::CorrectorConfig corrector;
    corrector.accumulation_mode = mode;
    std::string error;
    auto estimator = flowstab::TransformEstimator::create(corrector, primitives, error);
    if (!estimator) {
        std::cerr << "estimator init failed: " << error << '\n';
        return 1;
    }
    flowstab::Telemetry telemetry;
    flowstab::pipeline::StabilizerStage stabilizer(std::move(estimator), &telemetry);

    auto finder = flowstab::pipeline::FlowFinderStage::create(flowstab::TrackerConfig{}, primitives, error);
    if (!finder) {
        std::cerr << "finder init failed: " << error << '\n';
        return 1;
    }

    std::vector<int64_t> finder_lat;
    std::vector<int64_t> stab_lat;
    finder_lat.reserve(static_cast<std::size_t>(frame_count));
    stab_lat.reserve(static_cast<std::size_t>(frame_count));

    cv::RNG rng(4242);
    cv::Mat first;
    double sum_before = 0.0;
    double sum_after = 0.0;
    int measured = 0;
    for (int i = 0; i < frame_count; ++i) {
        flowstab::Frame frame;
        frame.meta.timestamp_ns = static_cast<int64_t>(i) * 33333333;
        frame.meta.duration_ns = 33333333;
        frame.meta.offset = static_cast<uint64_t>(i);
        frame.meta.offset_end = static_cast<uint64_t>(i + 1);
        frame.image = (i == 0) ? base.clone() : shifted(base, rng.uniform(-6.0, 6.0), rng.uniform(-6.0, 6.0));
        if (i == 0) {
            first = frame.image;
        }

        int64_t t0 = flowstab::nowSteadyNs();
        const flowstab::FlowResult fr = finder->consume(frame, [](flowstab::MotionBuffer) {
            return flowstab::FlowResult::Ok;
        });
        finder_lat.push_back(flowstab::nowSteadyNs() - t0);
        if (fr != flowstab::FlowResult::Ok) {
            std::cerr << "finder failed: " << finder->lastError() << '\n';
            return 1;
        }

        cv::Mat corrected;
        t0 = flowstab::nowSteadyNs();
        const flowstab::FlowResult sr = stabilizer.consume(frame, [&corrected](flowstab::Frame out) {
            corrected = out.image;
            return flowstab::FlowResult::Ok;
        });
        stab_lat.push_back(flowstab::nowSteadyNs() - t0);
        if (sr != flowstab::FlowResult::Ok) {
            std::cerr << "stabilizer failed: " << stabilizer.lastError() << '\n';
            return 1;
        }

        if (i > 0) {
            sum_before += centerError(first, frame.image);
            sum_after += centerError(first, corrected);
            ++measured;
        }
    }

    const auto snap = telemetry.snapshot();
    std::cout << std::fixed << std::setprecision(3)
              << "frames=" << frame_count << " mode=" << mode << "\n"
              << "finder_p50_us=" << pct(finder_lat, 0.50) / 1000
              << " finder_p95_us=" << pct(finder_lat, 0.95) / 1000
              << " finder_p99_us=" << pct(finder_lat, 0.99) / 1000 << "\n"
              << "stabilizer_p50_us=" << pct(stab_lat, 0.50) / 1000
              << " stabilizer_p95_us=" << pct(stab_lat, 0.95) / 1000
              << " stabilizer_p99_us=" << pct(stab_lat, 0.99) / 1000 << "\n"
              << "residual_before=" << (measured > 0 ? sum_before / measured : 0.0)
              << " residual_after=" << (measured > 0 ? sum_after / measured : 0.0) << "\n"
              << "telemetry: " << snap << "\n";
    return 0;
}
