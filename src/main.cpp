#include "core/config.hpp"
#include "core/telemetry.hpp"
#include "io/video_sink.hpp"
#include "io/video_source.hpp"
#include "pipeline/flow_finder_stage.hpp"
#include "pipeline/motion_corrector.hpp"
#include "pipeline/stabilizer_stage.hpp"
#include "pipeline/stream_muxer.hpp"
#include "render/flow_drawer.hpp"
#include "stabilization/transform_estimator.hpp"
#include "vision/opencv_vision_primitives.hpp"

#include <atomic>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace {
std::atomic<bool> g_running{true};

void onSigInt(int) {
    g_running.store(false);
}

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <config.yaml> <input> <output> [stabilize|muxed|draw]\n"
              << "  stabilize  track and correct in one stage (default)\n"
              << "  muxed      finder stage -> muxer -> corrector\n"
              << "  draw       finder stage -> muxer -> motion arrows\n";
}

using FrameHandler = std::function<flowstab::FlowResult(flowstab::Frame)>;

// Builds the per-frame entry point for `mode`. Objects the handler needs are
// owned by the caller's holders so they outlive the loop.
struct Graph {
    std::unique_ptr<flowstab::pipeline::StabilizerStage> stabilizer;
    std::unique_ptr<flowstab::pipeline::FlowFinderStage> finder;
    std::unique_ptr<flowstab::TransformEstimator> estimator;
    std::unique_ptr<flowstab::pipeline::MotionCorrector> corrector;
    std::unique_ptr<flowstab::pipeline::StreamMuxer<flowstab::Frame, flowstab::Frame>> muxer;
    FrameHandler handler;
};

bool buildGraph(
    const std::string& mode,
    const flowstab::AppConfig& config,
    const std::shared_ptr<flowstab::VisionPrimitives>& primitives,
    flowstab::Telemetry& telemetry,
    const flowstab::pipeline::Emit<flowstab::Frame>& sink,
    Graph& graph,
    std::string& error) {
    using flowstab::Frame;
    using flowstab::FlowResult;
    using flowstab::MotionBuffer;

    if (mode == "stabilize") {
        auto estimator = flowstab::TransformEstimator::create(config.corrector, primitives, error);
        if (!estimator) {
            return false;
        }
        estimator->setVerbose(config.io.verbose);
        graph.stabilizer = std::make_unique<flowstab::pipeline::StabilizerStage>(std::move(estimator), &telemetry);
        flowstab::pipeline::StabilizerStage* stage = graph.stabilizer.get();
        graph.handler = [stage, sink](Frame frame) { return stage->consume(std::move(frame), sink); };
        return true;
    }

    const bool drawing = (mode == "draw");
    if (!drawing && mode != "muxed") {
        error = "unknown mode: " + mode;
        return false;
    }

    const flowstab::TrackerConfig& tracking = drawing ? config.finder : config.corrector.tracking;
    graph.finder = flowstab::pipeline::FlowFinderStage::create(tracking, primitives, error);
    if (!graph.finder) {
        return false;
    }
    graph.finder->finder().setVerbose(config.io.verbose);

    if (drawing) {
        graph.muxer = std::make_unique<flowstab::pipeline::StreamMuxer<Frame, Frame>>(flowstab::FlowDrawer{});
    } else {
        if (config.corrector.accumulation_mode != "composed") {
            // Muxed motion is raw frame to raw frame, which only composes.
            std::cerr << "[corrector] muxed mode expects accumulation_mode: composed, got "
                      << config.corrector.accumulation_mode << '\n';
        }
        graph.estimator = flowstab::TransformEstimator::create(config.corrector, primitives, error);
        if (!graph.estimator) {
            return false;
        }
        graph.estimator->setVerbose(config.io.verbose);
        graph.corrector = std::make_unique<flowstab::pipeline::MotionCorrector>(*graph.estimator, &telemetry);
        flowstab::pipeline::MotionCorrector* corrector = graph.corrector.get();
        graph.muxer = std::make_unique<flowstab::pipeline::StreamMuxer<Frame, Frame>>(
            [corrector](Frame frame, const flowstab::MotionRecord& record, const flowstab::pipeline::Emit<Frame>& emit) {
                return (*corrector)(std::move(frame), record, emit);
            });
    }

    flowstab::pipeline::FlowFinderStage* finder = graph.finder.get();
    auto* muxer = graph.muxer.get();
    graph.handler = [finder, muxer, sink](Frame frame) {
        if (muxer->pushMain(frame, sink) != FlowResult::Ok) {
            return FlowResult::Error;
        }
        return finder->consume(std::move(frame), [muxer, sink](MotionBuffer buffer) {
            return muxer->pushMotion(std::move(buffer), sink);
        });
    };
    return true;
}
}

int main(int argc, char** argv) {
    std::signal(SIGINT, onSigInt);

    if (argc < 4) {
        printUsage(argv[0]);
        return 2;
    }
    const std::string config_path = argv[1];
    const std::string input = argv[2];
    const std::string output = argv[3];
    const std::string mode = (argc > 4) ? argv[4] : "stabilize";

    flowstab::AppConfig config;
    std::string error;
    if (!flowstab::loadConfig(config_path, config, error)) {
        std::cerr << "Config load failed: " << error << '\n';
        return 1;
    }

    flowstab::VideoSource source;
    if (!source.open(config.io, input, error)) {
        std::cerr << "Source open failed: " << error << '\n';
        return 1;
    }

    flowstab::VideoSink sink;
    if (!sink.open(config.io, output, source.fps(), error)) {
        std::cerr << "Sink open failed: " << error << '\n';
        return 1;
    }

    auto primitives = std::make_shared<flowstab::OpenCvVisionPrimitives>();
    flowstab::Telemetry telemetry;
    bool write_failed = false;
    const flowstab::pipeline::Emit<flowstab::Frame> write = [&sink, &write_failed](flowstab::Frame frame) {
        std::string write_error;
        if (!sink.writeFrame(frame, write_error)) {
            std::cerr << "[sink] " << write_error << '\n';
            write_failed = true;
            return flowstab::FlowResult::Error;
        }
        return flowstab::FlowResult::Ok;
    };

    Graph graph;
    if (!buildGraph(mode, config, primitives, telemetry, write, graph, error)) {
        std::cerr << "Pipeline setup failed: " << error << '\n';
        return 1;
    }

    std::cout << "Source: " << source.activeSourceDescription() << " @ " << source.fps() << " fps\n";
    std::cout << "Mode: " << mode << ", writing " << output << '\n';

    int exit_code = 0;
    while (g_running.load()) {
        flowstab::Frame frame;
        if (!source.readFrame(frame, error)) {
            if (!error.empty()) {
                std::cerr << "Read failed: " << error << '\n';
                exit_code = 1;
            }
            break;
        }

        if (graph.handler(std::move(frame)) != flowstab::FlowResult::Ok) {
            std::cerr << "Pipeline stopped at frame " << source.framesRead() - 1
                      << (write_failed ? " (write error)" : "") << '\n';
            exit_code = 1;
            break;
        }

        const int every = config.io.report_every_frames;
        if (every > 0 && source.framesRead() % static_cast<uint64_t>(every) == 0) {
            std::cout << "[telemetry] " << telemetry.snapshot() << '\n';
        }
    }

    if (graph.muxer && (graph.muxer->pendingMain() > 0 || graph.muxer->pendingMotion() > 0)) {
        std::cerr << "[muxer] " << graph.muxer->pendingMain() << " frames and " << graph.muxer->pendingMotion()
                  << " motion buffers left unpaired\n";
    }

    std::cout << "Done: read=" << source.framesRead() << " written=" << sink.framesWritten() << '\n';
    std::cout << "[telemetry] " << telemetry.snapshot() << '\n';
    sink.close();
    source.close();
    return exit_code;
}
