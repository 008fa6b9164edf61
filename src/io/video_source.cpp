#include "io/video_source.hpp"

#include <cmath>

#include "core/time_utils.hpp"

#ifdef __linux__
#include <unistd.h>
#endif

namespace flowstab {

bool VideoSource::openFile(const std::string& path, std::string& error) {
#ifdef __linux__
    if (::access(path.c_str(), R_OK) != 0) {
        error = "input file not readable: " + path;
        return false;
    }
#endif
    if (!cap_.open(path, cv::CAP_ANY)) {
        error = "failed to open input file " + path;
        return false;
    }
    active_source_desc_ = "file:" + path;
    error.clear();
    return true;
}

bool VideoSource::openGStreamer(const std::string& pipeline, std::string& error) {
    if (!cap_.open(pipeline, cv::CAP_GSTREAMER)) {
        error = "failed to open GStreamer pipeline";
        return false;
    }
    active_source_desc_ = "gstreamer:" + pipeline;
    error.clear();
    return true;
}

bool VideoSource::open(const IoConfig& config, const std::string& location, std::string& error) {
    close();
    config_ = config;

    bool opened = false;
    if (config_.source_mode == "gstreamer") {
        opened = openGStreamer(location.empty() ? config_.gstreamer_pipeline : location, error);
    } else if (config_.source_mode == "file") {
        opened = openFile(location, error);
    } else {
        error = "unknown io.source_mode: " + config_.source_mode;
    }
    if (!opened) {
        return false;
    }

    fps_ = cap_.get(cv::CAP_PROP_FPS);
    if (!std::isfinite(fps_) || fps_ <= 0.0) {
        fps_ = config_.fallback_fps;
    }
    period_ns_ = millisToNs(1000.0 / fps_);
    error.clear();
    return true;
}

void VideoSource::close() {
    if (cap_.isOpened()) {
        cap_.release();
    }
    active_source_desc_.clear();
    fps_ = 0.0;
    period_ns_ = 0;
    last_timestamp_ns_ = kNoTimestamp;
    index_ = 0;
}

bool VideoSource::isOpen() const {
    return cap_.isOpened();
}

cv::Size VideoSource::frameSize() const {
    return cv::Size(
        static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT)));
}

bool VideoSource::readFrame(Frame& out, std::string& error) {
    error.clear();
    if (!cap_.isOpened()) {
        error = "source is not open";
        return false;
    }

    cv::Mat image;
    if (!cap_.read(image) || image.empty()) {
        return false;
    }

    // Containers without timestamps report 0 for every frame after the first.
    int64_t timestamp_ns = kNoTimestamp;
    const double pos_ms = cap_.get(cv::CAP_PROP_POS_MSEC);
    if (std::isfinite(pos_ms) && pos_ms >= 0.0) {
        timestamp_ns = millisToNs(pos_ms);
    }
    if (timestamp_ns == kNoTimestamp || (index_ > 0 && timestamp_ns <= last_timestamp_ns_)) {
        timestamp_ns = static_cast<int64_t>(index_) * period_ns_;
    }

    out.meta.timestamp_ns = timestamp_ns;
    out.meta.duration_ns = period_ns_;
    out.meta.offset = index_;
    out.meta.offset_end = index_ + 1;
    out.image = image;

    last_timestamp_ns_ = timestamp_ns;
    ++index_;
    return true;
}

}  // namespace flowstab
