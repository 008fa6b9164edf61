#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/types.hpp"
#include "tracking/flow_finder.hpp"
#include "vision/vision_primitives.hpp"

namespace flowstab {

enum class EstimatorState {
    Uninitialized,
    Tracking,
};

enum class StepKind {
    NoReference,       // first frame: became the reference, passed through
    TrackingMiss,      // no correspondences: passed through, state untouched
    Corrected,
    TransformFailure,  // fit or warp failed: passed through, reference reset
};

const char* toString(StepKind kind);

struct StepReport {
    StepKind kind{StepKind::NoReference};
    std::size_t correspondences{0};
    HomographyFit fit;                         // meaningful when kind == Corrected
    VisionStatus failure{VisionStatus::Ok};    // meaningful when kind == TransformFailure
};

// Turns frame-to-frame motion into corrected frames.
//
// The accumulator maps reference coordinates into the current frame; every
// corrected frame is the current raw frame pulled back through its inverse and
// composited over the previous output, so uncovered borders keep old pixels.
class TransformEstimator {
public:
    TransformEstimator(
        CorrectorConfig config,
        std::shared_ptr<VisionPrimitives> primitives,
        std::unique_ptr<FlowFinder> finder);

    // Validates `config` and builds the flow finder it names.
    static std::unique_ptr<TransformEstimator> create(
        const CorrectorConfig& config,
        std::shared_ptr<VisionPrimitives> primitives,
        std::string& error);

    // Measures the motion of `in` against the current reference.
    // Returns false only when `in` breaks a stream invariant (empty image,
    // unsupported type, size change); every other outcome is in `report`.
    bool process(const Frame& in, Frame& out, StepReport& report, std::string& error);

    // Same as process() but with motion measured elsewhere.
    bool processWithRecord(
        const Frame& in,
        const MotionRecord& record,
        Frame& out,
        StepReport& report,
        std::string& error);

    void reset();

    EstimatorState state() const { return state_; }
    const cv::Mat& referenceImage() const { return reference_.image; }
    const cv::Mat& lastOutputImage() const { return last_output_; }
    bool hasAnchor() const { return reference_.anchor.has_value(); }
    const std::vector<cv::Point2f>& anchor() const;
    const cv::Matx33d& accumulatedTransform() const { return accumulator_; }
    AccumulationMode accumulationMode() const { return mode_; }
    ReferenceRebase referenceRebase() const { return rebase_; }
    void setVerbose(bool verbose);

private:
    struct ReferenceState {
        cv::Mat image;
        cv::Mat gray;
        std::optional<std::vector<cv::Point2f>> anchor;
    };

    bool checkFrame(const Frame& in, std::string& error) const;
    void bootstrap(const Frame& in, Frame& out, StepReport& report);
    void applyRecord(const Frame& in, const MotionRecord& record, Frame& out, StepReport& report);
    void recoverFromFailure(const Frame& in, VisionStatus failure, Frame& out, StepReport& report);
    void setReference(const cv::Mat& image, std::optional<std::vector<cv::Point2f>> anchor);

    CorrectorConfig config_;
    std::shared_ptr<VisionPrimitives> primitives_;
    std::unique_ptr<FlowFinder> finder_;
    AccumulationMode mode_{AccumulationMode::Direct};
    ReferenceRebase rebase_{ReferenceRebase::Corrected};
    RansacParams ransac_;

    EstimatorState state_{EstimatorState::Uninitialized};
    ReferenceState reference_;
    cv::Mat last_output_;
    cv::Matx33d accumulator_{cv::Matx33d::eye()};
    bool verbose_{false};
};

}  // namespace flowstab
