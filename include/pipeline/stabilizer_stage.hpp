#pragma once

#include <memory>

#include "core/telemetry.hpp"
#include "pipeline/stage.hpp"
#include "stabilization/transform_estimator.hpp"

namespace flowstab::pipeline {

// Frames in, stabilized frames out, one for one and in order.
class StabilizerStage : public Stage<Frame, Frame> {
public:
    StabilizerStage(std::unique_ptr<TransformEstimator> estimator, Telemetry* telemetry = nullptr);

    const char* name() const override { return "stabilizer"; }
    FlowResult consume(Frame frame, const EmitFn& emit) override;

    TransformEstimator& estimator() { return *estimator_; }
    const StepReport& lastReport() const { return last_report_; }

private:
    std::unique_ptr<TransformEstimator> estimator_;
    Telemetry* telemetry_{nullptr};
    StepReport last_report_;
};

// Records a finished estimator step into telemetry.
void recordStep(Telemetry& telemetry, const StepReport& report, int64_t latency_ns);

}  // namespace flowstab::pipeline
