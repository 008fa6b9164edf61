#include "pipeline/flow_finder_stage.hpp"

#include <utility>

#include "core/frame_utils.hpp"
#include "wire/motion_codec.hpp"

namespace flowstab::pipeline {

FlowFinderStage::FlowFinderStage(std::unique_ptr<FlowFinder> finder)
    : finder_(std::move(finder)) {}

std::unique_ptr<FlowFinderStage> FlowFinderStage::create(
    const TrackerConfig& config,
    std::shared_ptr<VisionPrimitives> primitives,
    std::string& error) {
    if (!validateTrackerConfig(config, "finder", error)) {
        return nullptr;
    }
    std::unique_ptr<FlowFinder> finder = createFlowFinder(config, std::move(primitives), error);
    if (!finder) {
        return nullptr;
    }
    return std::make_unique<FlowFinderStage>(std::move(finder));
}

FlowResult FlowFinderStage::consume(Frame frame, const EmitFn& emit) {
    if (!isSupportedFrameImage(frame.image)) {
        return fail("unsupported frame at ts=" + std::to_string(frame.meta.timestamp_ns));
    }
    if (!prev_gray_.empty() && prev_gray_.size() != frame.image.size()) {
        return fail("frame size changed mid-stream at ts=" + std::to_string(frame.meta.timestamp_ns));
    }

    cv::Mat gray = toGray(frame.image);
    const MotionRecord record = finder_->findFlow(prev_gray_, gray, frame.meta.timestamp_ns);
    prev_gray_ = gray;

    MotionBuffer buffer;
    std::string error;
    if (!wire::makeMotionBuffer(record, frame.meta, buffer, error)) {
        return fail("encode failed: " + error);
    }
    return emit(std::move(buffer));
}

}  // namespace flowstab::pipeline
