#pragma once

#include "core/telemetry.hpp"
#include "pipeline/stage.hpp"
#include "stabilization/transform_estimator.hpp"

namespace flowstab::pipeline {

// StreamMuxer combine that corrects each frame with the motion paired to it.
class MotionCorrector {
public:
    explicit MotionCorrector(TransformEstimator& estimator, Telemetry* telemetry = nullptr);

    FlowResult operator()(Frame frame, const MotionRecord& record, const Emit<Frame>& emit);

    const std::string& lastError() const { return last_error_; }

private:
    TransformEstimator* estimator_;
    Telemetry* telemetry_;
    std::string last_error_;
};

}  // namespace flowstab::pipeline
