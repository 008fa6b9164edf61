#include "core/frame_utils.hpp"
#include "core/math_utils.hpp"
#include "stabilization/transform_estimator.hpp"
#include "vision/opencv_vision_primitives.hpp"

#include <cmath>
#include <deque>
#include <iostream>
#include <memory>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace {

cv::Mat makeTexture(int w, int h) {
    cv::Mat img(h, w, CV_8UC3, cv::Scalar(20, 20, 20));
    cv::RNG rng(31337);
    for (int i = 0; i < 140; ++i) {
        cv::Point p1(rng.uniform(0, w), rng.uniform(0, h));
        cv::Point p2(rng.uniform(0, w), rng.uniform(0, h));
        const int v = rng.uniform(60, 230);
        cv::line(img, p1, p2, cv::Scalar(v, 255 - v, v / 2), 2, cv::LINE_AA);
    }
    for (int i = 0; i < 70; ++i) {
        cv::Point c(rng.uniform(0, w), rng.uniform(0, h));
        const int v = rng.uniform(80, 240);
        cv::rectangle(img, cv::Rect(c.x, c.y, rng.uniform(4, 16), rng.uniform(4, 16)), cv::Scalar(v, v, 255 - v), -1);
    }
    return img;
}

cv::Mat shifted(const cv::Mat& base, double dx, double dy) {
    const cv::Matx23d M(1.0, 0.0, dx, 0.0, 1.0, dy);
    cv::Mat out;
    cv::warpAffine(base, out, cv::Mat(M), base.size(), cv::INTER_LINEAR, cv::BORDER_REFLECT);
    return out;
}

cv::Matx33d translation(double tx, double ty) {
    return cv::Matx33d(1.0, 0.0, tx, 0.0, 1.0, ty, 0.0, 0.0, 1.0);
}

cv::Matx33d rotationAbout(double deg, double cx, double cy) {
    const double a = deg * CV_PI / 180.0;
    return translation(cx, cy) *
           cv::Matx33d(std::cos(a), -std::sin(a), 0.0, std::sin(a), std::cos(a), 0.0, 0.0, 0.0, 1.0) *
           translation(-cx, -cy);
}

flowstab::Frame makeFrame(const cv::Mat& image, int64_t ts) {
    flowstab::Frame f;
    f.meta.timestamp_ns = ts;
    f.meta.duration_ns = 40;
    f.meta.offset = static_cast<uint64_t>(ts);
    f.meta.offset_end = static_cast<uint64_t>(ts + 1);
    f.image = image;
    return f;
}

flowstab::MotionRecord squareFlow(int64_t ts) {
    flowstab::MotionRecord r;
    r.timestamp_ns = ts;
    flowstab::Correspondences c;
    c.origins = {{40.0F, 40.0F}, {200.0F, 40.0F}, {40.0F, 160.0F}, {200.0F, 160.0F}, {120.0F, 100.0F}};
    c.destinations = {{50.0F, 40.0F}, {210.0F, 40.0F}, {50.0F, 160.0F}, {210.0F, 160.0F}, {130.0F, 100.0F}};
    r.flow = c;
    return r;
}

bool sameData(const cv::Mat& a, const cv::Mat& b) {
    return a.data == b.data && a.size() == b.size();
}

bool samePixels(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
}

// Real OpenCV behaviour unless a homography result is scripted for the next fit.
class ScriptedFitPrimitives : public flowstab::OpenCvVisionPrimitives {
public:
    struct Step {
        flowstab::VisionStatus status;
        cv::Matx33d H;
    };

    std::deque<Step> fits;
    int fit_calls{0};
    cv::Mat last_prev_gray;

    flowstab::VisionStatus fitHomography(
        const std::vector<cv::Point2f>& origins,
        const std::vector<cv::Point2f>& destinations,
        const flowstab::RansacParams& params,
        flowstab::HomographyFit& out_fit) override {
        ++fit_calls;
        if (fits.empty()) {
            return flowstab::OpenCvVisionPrimitives::fitHomography(origins, destinations, params, out_fit);
        }
        const Step step = fits.front();
        fits.pop_front();
        out_fit = flowstab::HomographyFit{};
        out_fit.H = step.H;
        out_fit.inliers = static_cast<int>(origins.size());
        return step.status;
    }

    flowstab::VisionStatus trackPoints(
        const cv::Mat& prev_gray,
        const cv::Mat& cur_gray,
        const std::vector<cv::Point2f>& points,
        const cv::Size& window,
        int pyramid_levels,
        const cv::TermCriteria& criteria,
        std::vector<cv::Point2f>& out_tracked,
        std::vector<uint8_t>& out_status,
        std::vector<float>& out_errors) override {
        last_prev_gray = prev_gray.clone();
        return flowstab::OpenCvVisionPrimitives::trackPoints(
            prev_gray, cur_gray, points, window, pyramid_levels, criteria, out_tracked, out_status, out_errors);
    }
};

std::unique_ptr<flowstab::TransformEstimator> makeEstimator(
    const std::string& mode,
    const std::string& rebase,
    std::shared_ptr<flowstab::VisionPrimitives> prims) {
    flowstab::CorrectorConfig cfg;
    cfg.accumulation_mode = mode;
    cfg.reference_rebase = rebase;
    std::string error;
    auto est = flowstab::TransformEstimator::create(cfg, std::move(prims), error);
    if (!est) {
        std::cerr << "estimator create failed: " << error << "\n";
    }
    return est;
}

}  // namespace

int main() {
    const cv::Mat base = makeTexture(320, 240);
    std::string error;
    flowstab::Frame out;
    flowstab::StepReport report;

    // Invalid configuration is rejected up front.
    {
        flowstab::CorrectorConfig bad;
        bad.accumulation_mode = "sideways";
        if (flowstab::TransformEstimator::create(bad, std::make_shared<flowstab::OpenCvVisionPrimitives>(), error) != nullptr) {
            std::cerr << "invalid accumulation mode should fail create\n";
            return 1;
        }
    }

    // First frame passes through and becomes the reference.
    {
        auto est = makeEstimator("direct", "auto", std::make_shared<flowstab::OpenCvVisionPrimitives>());
        if (!est) return 1;
        const flowstab::Frame f0 = makeFrame(base, 0);
        if (!est->process(f0, out, report, error) || report.kind != flowstab::StepKind::NoReference) {
            std::cerr << "first frame should pass through as no-reference\n";
            return 1;
        }
        if (!samePixels(out.image, f0.image) || out.meta.timestamp_ns != 0 || out.meta.offset_end != 1) {
            std::cerr << "first frame output should equal input with its metadata\n";
            return 1;
        }
        if (est->state() != flowstab::EstimatorState::Tracking || !sameData(est->referenceImage(), f0.image) ||
            est->hasAnchor()) {
            std::cerr << "first frame should become the reference without an anchor\n";
            return 1;
        }
        if (est->referenceRebase() != flowstab::ReferenceRebase::Corrected) {
            std::cerr << "auto rebase in direct mode should resolve to corrected\n";
            return 1;
        }

        // Identical frame: the transform is close to identity and the output matches.
        const flowstab::Frame f1 = makeFrame(base.clone(), 1);
        if (!est->process(f1, out, report, error) || report.kind != flowstab::StepKind::Corrected) {
            std::cerr << "identical frame should be corrected, got " << flowstab::toString(report.kind) << "\n";
            return 1;
        }
        if (flowstab::maxAbsDifference(est->accumulatedTransform(), flowstab::identityTransform()) > 1e-2) {
            std::cerr << "identical frames should give a near-identity transform\n";
            return 1;
        }
        cv::Mat diff;
        cv::absdiff(out.image, f1.image, diff);
        const cv::Scalar m = cv::mean(diff);
        if ((m[0] + m[1] + m[2]) / 3.0 > 1.0) {
            std::cerr << "near-identity correction should leave the frame almost unchanged\n";
            return 1;
        }

        // Geometry change breaks the stream invariant.
        const flowstab::Frame small = makeFrame(cv::Mat(120, 160, CV_8UC3, cv::Scalar(1, 2, 3)), 2);
        if (est->process(small, out, report, error) || error.empty()) {
            std::cerr << "frame size change should be rejected\n";
            return 1;
        }
        const flowstab::Frame floats = makeFrame(cv::Mat(240, 320, CV_32FC1, cv::Scalar(0.5)), 3);
        if (est->process(floats, out, report, error)) {
            std::cerr << "unsupported pixel type should be rejected\n";
            return 1;
        }
        if (est->process(flowstab::Frame{}, out, report, error)) {
            std::cerr << "empty frame should be rejected\n";
            return 1;
        }

        est->reset();
        if (est->state() != flowstab::EstimatorState::Uninitialized || !est->referenceImage().empty()) {
            std::cerr << "reset should drop the reference\n";
            return 1;
        }
    }

    // An empty correspondence set changes nothing and passes the frame through untouched.
    {
        auto prims = std::make_shared<ScriptedFitPrimitives>();
        prims->fits.push_back({flowstab::VisionStatus::Ok, translation(10.0, 0.0)});
        auto est = makeEstimator("composed", "auto", prims);
        if (!est) return 1;
        const flowstab::Frame f0 = makeFrame(base, 0);
        const flowstab::Frame f1 = makeFrame(shifted(base, 10.0, 0.0), 1);
        est->processWithRecord(f0, flowstab::MotionRecord{}, out, report, error);
        if (!est->processWithRecord(f1, squareFlow(1), out, report, error) || report.kind != flowstab::StepKind::Corrected) {
            std::cerr << "scripted frame should be corrected\n";
            return 1;
        }
        const cv::Mat ref_before = est->referenceImage();
        const cv::Mat last_before = est->lastOutputImage();
        const cv::Matx33d acc_before = est->accumulatedTransform();
        const std::vector<cv::Point2f> anchor_before = est->anchor();

        const flowstab::Frame f2 = makeFrame(shifted(base, 3.0, 1.0), 2);
        flowstab::MotionRecord empty;
        empty.timestamp_ns = 2;
        empty.flow = flowstab::Correspondences{};
        if (!est->processWithRecord(f2, empty, out, report, error) || report.kind != flowstab::StepKind::TrackingMiss) {
            std::cerr << "empty set should be a tracking miss\n";
            return 1;
        }
        if (!samePixels(out.image, f2.image) || out.meta.timestamp_ns != 2) {
            std::cerr << "tracking miss output must be the input frame, bit for bit\n";
            return 1;
        }
        if (!sameData(est->referenceImage(), ref_before) || !sameData(est->lastOutputImage(), last_before) ||
            flowstab::maxAbsDifference(est->accumulatedTransform(), acc_before) != 0.0 ||
            est->anchor() != anchor_before) {
            std::cerr << "tracking miss must leave reference, anchor, output and accumulator untouched\n";
            return 1;
        }

        // Same for a record without flow after initialisation.
        if (!est->processWithRecord(f2, flowstab::MotionRecord{}, out, report, error) ||
            report.kind != flowstab::StepKind::TrackingMiss || !sameData(est->referenceImage(), ref_before)) {
            std::cerr << "record without flow should also be a pass-through miss\n";
            return 1;
        }
        if (prims->fit_calls != 1) {
            std::cerr << "no homography fit should run on a miss\n";
            return 1;
        }
    }

    // Composed mode: the accumulator is the ordered product of the fitted transforms.
    {
        auto prims = std::make_shared<ScriptedFitPrimitives>();
        const cv::Matx33d H1 = translation(2.0, -1.0);
        const cv::Matx33d H2 = rotationAbout(1.5, 160.0, 120.0);
        const cv::Matx33d H3 = translation(-3.0, 0.5) * rotationAbout(-0.7, 100.0, 80.0);
        prims->fits = {{flowstab::VisionStatus::Ok, H1}, {flowstab::VisionStatus::Ok, H2}, {flowstab::VisionStatus::Ok, H3}};
        auto est = makeEstimator("composed", "auto", prims);
        if (!est) return 1;
        if (est->referenceRebase() != flowstab::ReferenceRebase::Raw) {
            std::cerr << "auto rebase in composed mode should resolve to raw\n";
            return 1;
        }

        est->processWithRecord(makeFrame(base, 0), flowstab::MotionRecord{}, out, report, error);
        const cv::Matx33d expected[] = {H1, H2 * H1, H3 * H2 * H1};
        for (int i = 0; i < 3; ++i) {
            const flowstab::Frame f = makeFrame(shifted(base, i + 1.0, 0.0), i + 1);
            if (!est->processWithRecord(f, squareFlow(i + 1), out, report, error) ||
                report.kind != flowstab::StepKind::Corrected) {
                std::cerr << "composed step " << i << " should be corrected\n";
                return 1;
            }
            if (flowstab::maxAbsDifference(est->accumulatedTransform(), expected[i]) > 1e-9) {
                std::cerr << "accumulator should equal the product of fitted transforms at step " << i << "\n";
                return 1;
            }
            // Raw rebase: the reference is the uncorrected frame, anchored at the destinations.
            if (!sameData(est->referenceImage(), f.image) || est->anchor() != squareFlow(i + 1).flow->destinations) {
                std::cerr << "composed mode should rebase onto the raw frame\n";
                return 1;
            }
        }
    }

    // Direct mode: the accumulator is replaced, and the anchor follows the inverse warp.
    {
        auto prims = std::make_shared<ScriptedFitPrimitives>();
        const cv::Matx33d H1 = translation(10.0, 0.0);
        const cv::Matx33d H2 = translation(4.0, 2.0);
        prims->fits = {{flowstab::VisionStatus::Ok, H1}, {flowstab::VisionStatus::Ok, H2}};
        auto est = makeEstimator("direct", "auto", prims);
        if (!est) return 1;

        const cv::Mat dark(240, 320, CV_8UC3, cv::Scalar(50, 50, 50));
        const cv::Mat bright(240, 320, CV_8UC3, cv::Scalar(200, 200, 200));
        est->processWithRecord(makeFrame(dark, 0), flowstab::MotionRecord{}, out, report, error);
        if (!est->processWithRecord(makeFrame(bright, 1), squareFlow(1), out, report, error)) {
            std::cerr << "direct step should succeed\n";
            return 1;
        }
        // dst(x) = src(H x): the last 10 columns have no source and keep the previous output.
        if (out.image.at<cv::Vec3b>(100, 0)[0] != 200 || out.image.at<cv::Vec3b>(100, 319)[0] != 50) {
            std::cerr << "uncovered border should keep previous output pixels\n";
            return 1;
        }
        if (!sameData(est->referenceImage(), out.image)) {
            std::cerr << "direct mode should rebase onto the corrected frame\n";
            return 1;
        }
        const auto expected_anchor = flowstab::applyHomography(H1.inv(), squareFlow(1).flow->destinations);
        const auto& anchor = est->anchor();
        if (anchor.size() != expected_anchor.size()) {
            std::cerr << "anchor size mismatch\n";
            return 1;
        }
        for (std::size_t i = 0; i < anchor.size(); ++i) {
            if (std::abs(anchor[i].x - expected_anchor[i].x) > 1e-4F || std::abs(anchor[i].y - expected_anchor[i].y) > 1e-4F) {
                std::cerr << "anchor should be mapped through the inverse transform\n";
                return 1;
            }
        }

        est->processWithRecord(makeFrame(bright, 2), squareFlow(2), out, report, error);
        if (flowstab::maxAbsDifference(est->accumulatedTransform(), H2) > 1e-12) {
            std::cerr << "direct mode should replace the accumulator\n";
            return 1;
        }
    }

    // Raw rebase can be forced in direct mode.
    {
        auto prims = std::make_shared<ScriptedFitPrimitives>();
        prims->fits = {{flowstab::VisionStatus::Ok, translation(10.0, 0.0)}};
        auto est = makeEstimator("direct", "raw", prims);
        if (!est) return 1;
        const flowstab::Frame f1 = makeFrame(shifted(base, 10.0, 0.0), 1);
        est->processWithRecord(makeFrame(base, 0), flowstab::MotionRecord{}, out, report, error);
        est->processWithRecord(f1, squareFlow(1), out, report, error);
        if (!sameData(est->referenceImage(), f1.image) || est->anchor() != squareFlow(1).flow->destinations) {
            std::cerr << "forced raw rebase should keep the raw frame and destinations\n";
            return 1;
        }
    }

    // Failure at frame K: K passes through raw, K becomes the reference, the next
    // frame is measured against K.
    {
        auto prims = std::make_shared<ScriptedFitPrimitives>();
        const cv::Matx33d H1 = translation(1.0, 0.0);
        const cv::Matx33d H2 = translation(1.0, 1.0);
        const cv::Matx33d H4 = translation(-1.0, 0.0);
        prims->fits = {
            {flowstab::VisionStatus::Ok, H1},
            {flowstab::VisionStatus::Ok, H2},
            {flowstab::VisionStatus::Degenerate, cv::Matx33d::eye()},
            {flowstab::VisionStatus::Ok, H4},
        };
        auto est = makeEstimator("composed", "auto", prims);
        if (!est) return 1;

        std::vector<flowstab::Frame> frames;
        for (int i = 0; i < 5; ++i) {
            frames.push_back(makeFrame(shifted(base, 1.5 * i, 0.8 * i), i));
        }
        for (int i = 0; i < 3; ++i) {
            if (!est->process(frames[i], out, report, error)) {
                std::cerr << "frame " << i << " failed: " << error << "\n";
                return 1;
            }
        }
        if (report.kind != flowstab::StepKind::Corrected) {
            std::cerr << "frame 2 should be corrected, got " << flowstab::toString(report.kind) << "\n";
            return 1;
        }
        const cv::Mat last_before = est->lastOutputImage();
        const cv::Matx33d acc_before = est->accumulatedTransform();

        if (!est->process(frames[3], out, report, error) || report.kind != flowstab::StepKind::TransformFailure ||
            report.failure != flowstab::VisionStatus::Degenerate) {
            std::cerr << "frame 3 should be a transform failure\n";
            return 1;
        }
        if (!samePixels(out.image, frames[3].image) || out.meta.timestamp_ns != 3) {
            std::cerr << "failed frame should pass through unmodified\n";
            return 1;
        }
        if (!sameData(est->referenceImage(), frames[3].image) || est->hasAnchor()) {
            std::cerr << "failed frame should become the reference, without an anchor\n";
            return 1;
        }
        if (!sameData(est->lastOutputImage(), last_before) ||
            flowstab::maxAbsDifference(est->accumulatedTransform(), acc_before) != 0.0) {
            std::cerr << "failure should keep the last output and the accumulator\n";
            return 1;
        }

        if (!est->process(frames[4], out, report, error) || report.kind != flowstab::StepKind::Corrected) {
            std::cerr << "frame after failure should be corrected\n";
            return 1;
        }
        if (!samePixels(prims->last_prev_gray, flowstab::toGray(frames[3].image))) {
            std::cerr << "frame after failure should be measured against the failed frame\n";
            return 1;
        }
        if (flowstab::maxAbsDifference(est->accumulatedTransform(), H4 * acc_before) > 1e-9) {
            std::cerr << "accumulation should resume from the kept accumulator\n";
            return 1;
        }
    }

    return 0;
}
