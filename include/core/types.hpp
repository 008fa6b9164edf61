#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

namespace flowstab {

constexpr int64_t kNoTimestamp = -1;

enum class FlowResult {
    Ok,
    Error,
};

// Metadata carried unchanged from an input buffer onto anything derived from it.
struct BufferMeta {
    int64_t timestamp_ns{kNoTimestamp};
    int64_t duration_ns{kNoTimestamp};
    uint64_t offset{0};
    uint64_t offset_end{0};
};

struct Frame {
    BufferMeta meta;
    cv::Mat image;  // CV_8UC1, CV_8UC3 (BGR) or CV_8UC4 (BGRA)
};

// destinations[i] is where origins[i] was found in the following frame.
struct Correspondences {
    std::vector<cv::Point2f> origins;
    std::vector<cv::Point2f> destinations;

    std::size_t size() const { return origins.size(); }
    bool empty() const { return origins.empty(); }
};

struct MotionRecord {
    int64_t timestamp_ns{kNoTimestamp};
    std::optional<Correspondences> flow;  // nullopt: no previous frame to compare against

    bool hasFlow() const { return flow.has_value(); }
};

// Serialized MotionRecord travelling alongside frames.
struct MotionBuffer {
    BufferMeta meta;
    std::vector<uint8_t> payload;
};

inline bool operator==(const Correspondences& a, const Correspondences& b) {
    return a.origins == b.origins && a.destinations == b.destinations;
}

inline bool operator==(const MotionRecord& a, const MotionRecord& b) {
    return a.timestamp_ns == b.timestamp_ns && a.flow == b.flow;
}

inline bool operator!=(const MotionRecord& a, const MotionRecord& b) {
    return !(a == b);
}

}  // namespace flowstab
