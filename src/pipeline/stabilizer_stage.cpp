#include "pipeline/stabilizer_stage.hpp"

#include <utility>

#include "core/time_utils.hpp"

namespace flowstab::pipeline {

void recordStep(Telemetry& telemetry, const StepReport& report, int64_t latency_ns) {
    const int correspondences = static_cast<int>(report.correspondences);
    switch (report.kind) {
        case StepKind::NoReference:
            telemetry.addNoReference();
            break;
        case StepKind::TrackingMiss:
            telemetry.addTrackingMiss();
            break;
        case StepKind::Corrected:
            telemetry.addCorrected(correspondences, report.fit.inliers);
            break;
        case StepKind::TransformFailure:
            telemetry.addTransformFailure(correspondences);
            break;
    }
    telemetry.setFrameLatencyUs(static_cast<int>(latency_ns / 1000));
}

StabilizerStage::StabilizerStage(std::unique_ptr<TransformEstimator> estimator, Telemetry* telemetry)
    : estimator_(std::move(estimator)),
      telemetry_(telemetry) {}

FlowResult StabilizerStage::consume(Frame frame, const EmitFn& emit) {
    const int64_t t0 = nowSteadyNs();
    Frame out;
    std::string error;
    if (!estimator_->process(frame, out, last_report_, error)) {
        return fail(error);
    }
    if (telemetry_ != nullptr) {
        recordStep(*telemetry_, last_report_, nowSteadyNs() - t0);
    }
    return emit(std::move(out));
}

}  // namespace flowstab::pipeline
