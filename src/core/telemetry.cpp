#include "core/telemetry.hpp"

namespace flowstab {

void Telemetry::addCorrected(int correspondences, int inliers) {
    frames_.fetch_add(1);
    corrected_.fetch_add(1);
    last_correspondences_.store(correspondences);
    last_inliers_.store(inliers);
}

void Telemetry::addNoReference() {
    frames_.fetch_add(1);
    no_reference_.fetch_add(1);
}

void Telemetry::addTrackingMiss() {
    frames_.fetch_add(1);
    tracking_misses_.fetch_add(1);
    last_correspondences_.store(0);
    last_inliers_.store(0);
}

void Telemetry::addTransformFailure(int correspondences) {
    frames_.fetch_add(1);
    transform_failures_.fetch_add(1);
    last_correspondences_.store(correspondences);
    last_inliers_.store(0);
}

void Telemetry::setFrameLatencyUs(int value) { frame_latency_us_.store(value); }

TelemetrySnapshot Telemetry::snapshot() const {
    return TelemetrySnapshot{
        frames_.load(),
        corrected_.load(),
        no_reference_.load(),
        tracking_misses_.load(),
        transform_failures_.load(),
        last_correspondences_.load(),
        last_inliers_.load(),
        frame_latency_us_.load()};
}

std::ostream& operator<<(std::ostream& os, const TelemetrySnapshot& s) {
    os << "frames=" << s.frames
       << " corrected=" << s.corrected
       << " no_reference=" << s.no_reference
       << " misses=" << s.tracking_misses
       << " failures=" << s.transform_failures
       << " last_corr=" << s.last_correspondences
       << " last_inliers=" << s.last_inliers
       << " latency_us=" << s.frame_latency_us;
    return os;
}

}  // namespace flowstab
