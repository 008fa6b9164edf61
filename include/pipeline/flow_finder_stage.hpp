#pragma once

#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "pipeline/stage.hpp"
#include "tracking/flow_finder.hpp"

namespace flowstab::pipeline {

// Frames in, encoded motion records out: one per frame, stamped with the
// frame's metadata. The first frame yields a record without flow.
class FlowFinderStage : public Stage<Frame, MotionBuffer> {
public:
    explicit FlowFinderStage(std::unique_ptr<FlowFinder> finder);

    static std::unique_ptr<FlowFinderStage> create(
        const TrackerConfig& config,
        std::shared_ptr<VisionPrimitives> primitives,
        std::string& error);

    const char* name() const override { return "finder"; }
    FlowResult consume(Frame frame, const EmitFn& emit) override;

    FlowFinder& finder() { return *finder_; }

private:
    std::unique_ptr<FlowFinder> finder_;
    cv::Mat prev_gray_;
};

}  // namespace flowstab::pipeline
