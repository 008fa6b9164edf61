#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "core/config.hpp"
#include "core/types.hpp"

namespace flowstab {

// Reads frames from a file or a GStreamer pipeline and stamps them with
// buffer metadata.
class VideoSource {
public:
    VideoSource() = default;

    // `location` is a file path, or the pipeline string when io.source_mode
    // is gstreamer (an empty location uses io.gstreamer_pipeline).
    bool open(const IoConfig& config, const std::string& location, std::string& error);
    void close();
    bool isOpen() const;
    const std::string& activeSourceDescription() const { return active_source_desc_; }

    double fps() const { return fps_; }
    cv::Size frameSize() const;

    // False at end of stream; `error` stays empty in that case.
    bool readFrame(Frame& out, std::string& error);

    uint64_t framesRead() const { return index_; }

private:
    bool openFile(const std::string& path, std::string& error);
    bool openGStreamer(const std::string& pipeline, std::string& error);

    cv::VideoCapture cap_;
    IoConfig config_{};
    std::string active_source_desc_;
    double fps_{0.0};
    int64_t period_ns_{0};
    int64_t last_timestamp_ns_{kNoTimestamp};
    uint64_t index_{0};
};

}  // namespace flowstab
