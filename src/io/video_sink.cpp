#include "io/video_sink.hpp"

#include <opencv2/imgproc.hpp>

namespace flowstab {

bool VideoSink::open(const IoConfig& config, const std::string& path, double fps, std::string& error) {
    close();
    if (path.empty()) {
        error = "output path is empty";
        return false;
    }
    if (config.fourcc.size() != 4) {
        error = "io.fourcc must be exactly 4 characters, got '" + config.fourcc + "'";
        return false;
    }
    if (fps <= 0.0) {
        error = "output fps must be > 0";
        return false;
    }

    fourcc_ = cv::VideoWriter::fourcc(config.fourcc[0], config.fourcc[1], config.fourcc[2], config.fourcc[3]);
    fps_ = fps;
    path_ = path;
    error.clear();
    return true;
}

void VideoSink::close() {
    if (writer_.isOpened()) {
        writer_.release();
    }
    path_.clear();
    size_ = cv::Size();
    written_ = 0;
}

bool VideoSink::writeFrame(const Frame& frame, std::string& error) {
    if (!isOpen()) {
        error = "sink is not open";
        return false;
    }
    if (frame.image.empty()) {
        error = "empty frame";
        return false;
    }

    if (!writer_.isOpened()) {
        size_ = frame.image.size();
        if (!writer_.open(path_, fourcc_, fps_, size_, true)) {
            error = "failed to open video writer for " + path_;
            return false;
        }
    }
    if (frame.image.size() != size_) {
        error = "frame size changed mid-stream";
        return false;
    }

    if (frame.image.channels() == 3) {
        writer_.write(frame.image);
    } else {
        cv::Mat bgr;
        cv::cvtColor(frame.image, bgr, frame.image.channels() == 1 ? cv::COLOR_GRAY2BGR : cv::COLOR_BGRA2BGR);
        writer_.write(bgr);
    }
    ++written_;
    error.clear();
    return true;
}

}  // namespace flowstab
