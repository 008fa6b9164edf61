#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <iostream>
#include <string>
#include <utility>

#include "core/types.hpp"
#include "pipeline/stage.hpp"
#include "wire/motion_codec.hpp"

namespace flowstab::pipeline {

enum class MuxError {
    None,
    StreamDesync,     // paired items carry different timestamps
    MalformedMotion,  // a motion buffer could not be decoded
};

// Joins a main stream with the motion stream computed from it. Items are
// queued per input and paired strictly in arrival order; paired items must
// share a timestamp. Any mismatch is fatal: the muxer stops accepting input.
//
// Main must expose `meta.timestamp_ns`.
template <typename Main, typename Out>
class StreamMuxer {
public:
    using EmitFn = Emit<Out>;
    using Combine = std::function<FlowResult(Main, const MotionRecord&, const EmitFn&)>;

    explicit StreamMuxer(Combine combine)
        : combine_(std::move(combine)) {}

    FlowResult pushMain(Main item, const EmitFn& emit) {
        if (failed()) {
            return FlowResult::Error;
        }
        pending_main_.push_back(std::move(item));
        return tryMux(emit);
    }

    FlowResult pushMotion(MotionBuffer buffer, const EmitFn& emit) {
        if (failed()) {
            return FlowResult::Error;
        }
        pending_motion_.push_back(std::move(buffer));
        return tryMux(emit);
    }

    bool failed() const { return error_kind_ != MuxError::None; }
    MuxError lastErrorKind() const { return error_kind_; }
    const std::string& lastError() const { return last_error_; }
    std::size_t pendingMain() const { return pending_main_.size(); }
    std::size_t pendingMotion() const { return pending_motion_.size(); }
    uint64_t pairedCount() const { return paired_; }

private:
    FlowResult tryMux(const EmitFn& emit) {
        while (!pending_main_.empty() && !pending_motion_.empty()) {
            Main item = std::move(pending_main_.front());
            pending_main_.pop_front();
            MotionBuffer motion = std::move(pending_motion_.front());
            pending_motion_.pop_front();

            if (item.meta.timestamp_ns != motion.meta.timestamp_ns) {
                return fail(
                    MuxError::StreamDesync,
                    "stream desync: main ts=" + std::to_string(item.meta.timestamp_ns) +
                        " motion ts=" + std::to_string(motion.meta.timestamp_ns));
            }

            MotionRecord record;
            std::string decode_error;
            if (!wire::decodeMotionRecord(motion.payload, record, decode_error)) {
                return fail(
                    MuxError::MalformedMotion,
                    "bad motion buffer at ts=" + std::to_string(motion.meta.timestamp_ns) + ": " + decode_error);
            }

            ++paired_;
            const FlowResult result = combine_(std::move(item), record, emit);
            if (result != FlowResult::Ok) {
                return result;
            }
        }
        return FlowResult::Ok;
    }

    FlowResult fail(MuxError kind, std::string error) {
        std::cerr << "[muxer] " << error << '\n';
        error_kind_ = kind;
        last_error_ = std::move(error);
        return FlowResult::Error;
    }

    Combine combine_;
    std::deque<Main> pending_main_;
    std::deque<MotionBuffer> pending_motion_;
    MuxError error_kind_{MuxError::None};
    std::string last_error_;
    uint64_t paired_{0};
};

}  // namespace flowstab::pipeline
