#include "stabilization/transform_estimator.hpp"

#include <iostream>
#include <utility>

#include "core/frame_utils.hpp"
#include "core/math_utils.hpp"

namespace flowstab {

const char* toString(StepKind kind) {
    switch (kind) {
        case StepKind::NoReference:
            return "no-reference";
        case StepKind::TrackingMiss:
            return "tracking-miss";
        case StepKind::Corrected:
            return "corrected";
        case StepKind::TransformFailure:
            return "transform-failure";
    }
    return "unknown";
}

TransformEstimator::TransformEstimator(
    CorrectorConfig config,
    std::shared_ptr<VisionPrimitives> primitives,
    std::unique_ptr<FlowFinder> finder)
    : config_(std::move(config)),
      primitives_(std::move(primitives)),
      finder_(std::move(finder)) {
    if (!parseAccumulationMode(config_.accumulation_mode, mode_)) {
        mode_ = AccumulationMode::Direct;
    }
    ReferenceRebase requested = ReferenceRebase::Auto;
    if (!parseReferenceRebase(config_.reference_rebase, requested)) {
        requested = ReferenceRebase::Auto;
    }
    rebase_ = resolveReferenceRebase(requested, mode_);

    ransac_.reproj_threshold_px = config_.ransac_reproj_threshold_px;
    ransac_.confidence = config_.ransac_confidence;
    ransac_.max_iters = config_.ransac_max_iters;
}

std::unique_ptr<TransformEstimator> TransformEstimator::create(
    const CorrectorConfig& config,
    std::shared_ptr<VisionPrimitives> primitives,
    std::string& error) {
    if (!validateCorrectorConfig(config, error)) {
        return nullptr;
    }
    std::unique_ptr<FlowFinder> finder = createFlowFinder(config.tracking, primitives, error);
    if (!finder) {
        return nullptr;
    }
    return std::make_unique<TransformEstimator>(config, std::move(primitives), std::move(finder));
}

const std::vector<cv::Point2f>& TransformEstimator::anchor() const {
    static const std::vector<cv::Point2f> kEmpty;
    return reference_.anchor ? *reference_.anchor : kEmpty;
}

void TransformEstimator::setVerbose(bool verbose) {
    verbose_ = verbose;
    if (finder_) {
        finder_->setVerbose(verbose);
    }
}

void TransformEstimator::reset() {
    state_ = EstimatorState::Uninitialized;
    reference_ = ReferenceState{};
    last_output_.release();
    accumulator_ = identityTransform();
}

bool TransformEstimator::checkFrame(const Frame& in, std::string& error) const {
    if (in.image.empty()) {
        error = "empty frame";
        return false;
    }
    if (!isSupportedFrameImage(in.image)) {
        error = "unsupported frame type, expected 8-bit gray, BGR or BGRA";
        return false;
    }
    if (state_ == EstimatorState::Tracking &&
        (in.image.size() != reference_.image.size() || in.image.type() != reference_.image.type())) {
        error = "frame geometry changed mid-stream: " + std::to_string(in.image.cols) + "x" +
                std::to_string(in.image.rows) + " vs reference " + std::to_string(reference_.image.cols) + "x" +
                std::to_string(reference_.image.rows);
        return false;
    }
    error.clear();
    return true;
}

void TransformEstimator::setReference(const cv::Mat& image, std::optional<std::vector<cv::Point2f>> anchor) {
    reference_.image = image;
    reference_.gray = toGray(image);
    reference_.anchor = std::move(anchor);
}

void TransformEstimator::bootstrap(const Frame& in, Frame& out, StepReport& report) {
    setReference(in.image, std::nullopt);
    last_output_ = in.image;
    state_ = EstimatorState::Tracking;

    report = StepReport{};
    report.kind = StepKind::NoReference;
    out = deriveFrame(in.meta, in.image);
}

void TransformEstimator::recoverFromFailure(const Frame& in, VisionStatus failure, Frame& out, StepReport& report) {
    std::cerr << "[stabilizer] transform failure at ts=" << in.meta.timestamp_ns << " (" << toString(failure)
              << "), passing frame through and restarting from it\n";
    setReference(in.image, std::nullopt);

    report.kind = StepKind::TransformFailure;
    report.failure = failure;
    out = deriveFrame(in.meta, in.image);
}

void TransformEstimator::applyRecord(const Frame& in, const MotionRecord& record, Frame& out, StepReport& report) {
    report = StepReport{};
    if (!record.flow || record.flow->empty()) {
        // Reference, anchor and accumulator are left untouched on a miss.
        report.kind = StepKind::TrackingMiss;
        out = deriveFrame(in.meta, in.image);
        return;
    }

    const Correspondences& flow = *record.flow;
    report.correspondences = flow.size();

    HomographyFit fit;
    const VisionStatus fit_status = primitives_->fitHomography(flow.origins, flow.destinations, ransac_, fit);
    if (fit_status != VisionStatus::Ok) {
        recoverFromFailure(in, fit_status, out, report);
        return;
    }

    const cv::Matx33d accumulated = (mode_ == AccumulationMode::Composed) ? fit.H * accumulator_ : fit.H;
    if (!isInvertibleTransform(accumulated)) {
        recoverFromFailure(in, VisionStatus::Degenerate, out, report);
        return;
    }

    cv::Mat corrected = last_output_.clone();
    const VisionStatus warp_status = primitives_->warpPerspective(in.image, accumulated, corrected);
    if (warp_status != VisionStatus::Ok) {
        recoverFromFailure(in, warp_status, out, report);
        return;
    }

    accumulator_ = accumulated;
    last_output_ = corrected;
    if (rebase_ == ReferenceRebase::Raw) {
        setReference(in.image, flow.destinations);
    } else {
        // The anchor follows the image through the same inverse warp.
        setReference(corrected, applyHomography(accumulated.inv(), flow.destinations));
    }

    if (verbose_) {
        std::cerr << "[stabilizer] ts=" << in.meta.timestamp_ns << " correspondences=" << flow.size()
                  << " inliers=" << fit.inliers << " rmse=" << fit.reproj_rmse << '\n';
    }

    report.kind = StepKind::Corrected;
    report.fit = fit;
    out.meta = in.meta;
    out.image = corrected;
}

bool TransformEstimator::process(const Frame& in, Frame& out, StepReport& report, std::string& error) {
    if (!checkFrame(in, error)) {
        return false;
    }
    if (state_ == EstimatorState::Uninitialized) {
        bootstrap(in, out, report);
        return true;
    }
    if (!finder_) {
        error = "no flow finder configured";
        return false;
    }

    const std::vector<cv::Point2f>* anchor = reference_.anchor ? &*reference_.anchor : nullptr;
    const MotionRecord record = finder_->findFlow(reference_.gray, toGray(in.image), in.meta.timestamp_ns, anchor);
    applyRecord(in, record, out, report);
    return true;
}

bool TransformEstimator::processWithRecord(
    const Frame& in,
    const MotionRecord& record,
    Frame& out,
    StepReport& report,
    std::string& error) {
    if (!checkFrame(in, error)) {
        return false;
    }
    if (state_ == EstimatorState::Uninitialized) {
        bootstrap(in, out, report);
        return true;
    }

    applyRecord(in, record, out, report);
    return true;
}

}  // namespace flowstab
