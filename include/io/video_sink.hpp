#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "core/config.hpp"
#include "core/types.hpp"

namespace flowstab {

class VideoSink {
public:
    VideoSink() = default;

    // The writer opens lazily on the first frame so it can take that frame's size.
    bool open(const IoConfig& config, const std::string& path, double fps, std::string& error);
    void close();
    bool isOpen() const { return !path_.empty(); }

    bool writeFrame(const Frame& frame, std::string& error);

    uint64_t framesWritten() const { return written_; }

private:
    cv::VideoWriter writer_;
    std::string path_;
    int fourcc_{0};
    double fps_{0.0};
    cv::Size size_;
    uint64_t written_{0};
};

}  // namespace flowstab
