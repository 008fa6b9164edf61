#pragma once

#include <atomic>
#include <cstdint>
#include <ostream>

namespace flowstab {

struct TelemetrySnapshot {
    uint64_t frames{0};
    uint64_t corrected{0};
    uint64_t no_reference{0};
    uint64_t tracking_misses{0};
    uint64_t transform_failures{0};
    int last_correspondences{0};
    int last_inliers{0};
    int frame_latency_us{0};
};

std::ostream& operator<<(std::ostream& os, const TelemetrySnapshot& s);

class Telemetry {
public:
    void addCorrected(int correspondences, int inliers);
    void addNoReference();
    void addTrackingMiss();
    void addTransformFailure(int correspondences);
    void setFrameLatencyUs(int value);

    TelemetrySnapshot snapshot() const;

private:
    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> corrected_{0};
    std::atomic<uint64_t> no_reference_{0};
    std::atomic<uint64_t> tracking_misses_{0};
    std::atomic<uint64_t> transform_failures_{0};
    std::atomic<int> last_correspondences_{0};
    std::atomic<int> last_inliers_{0};
    std::atomic<int> frame_latency_us_{0};
};

}  // namespace flowstab
