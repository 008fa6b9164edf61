#include "pipeline/motion_corrector.hpp"

#include <iostream>
#include <utility>

#include "core/time_utils.hpp"
#include "pipeline/stabilizer_stage.hpp"

namespace flowstab::pipeline {

MotionCorrector::MotionCorrector(TransformEstimator& estimator, Telemetry* telemetry)
    : estimator_(&estimator),
      telemetry_(telemetry) {}

FlowResult MotionCorrector::operator()(Frame frame, const MotionRecord& record, const Emit<Frame>& emit) {
    const int64_t t0 = nowSteadyNs();
    Frame out;
    StepReport report;
    if (!estimator_->processWithRecord(frame, record, out, report, last_error_)) {
        std::cerr << "[corrector] " << last_error_ << '\n';
        return FlowResult::Error;
    }
    if (telemetry_ != nullptr) {
        recordStep(*telemetry_, report, nowSteadyNs() - t0);
    }
    return emit(std::move(out));
}

}  // namespace flowstab::pipeline
