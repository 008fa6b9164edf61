#pragma once

#include <string>

#include "core/ignore_box.hpp"

namespace flowstab {

constexpr int kFinderCornerCount = 20;
constexpr int kFinderCornerMinDistance = 200;
constexpr int kCorrectorCornerCount = 50;
constexpr int kCorrectorCornerMinDistance = 50;

enum class FlowAlgorithm {
    PointTracking,
    FeatureRedetection,
};

enum class AccumulationMode {
    Direct,    // each frame-pair transform replaces the accumulator
    Composed,  // transforms are multiplied onto the accumulator
};

enum class ReferenceRebase {
    Auto,       // Composed -> Raw, Direct -> Corrected
    Raw,
    Corrected,
};

struct TrackerConfig {
    std::string algorithm{"point_tracking"};  // point_tracking | feature_redetection (1 | 2)
    int corner_count{kFinderCornerCount};
    double corner_quality_level{0.1};
    int corner_min_distance{kFinderCornerMinDistance};
    int win_size{30};
    int pyramid_level{4};
    int max_iterations{50};
    double epsilon{0.001};
    int subpix_window{10};
    int subpix_max_iterations{20};
    double subpix_epsilon{0.03};
    int anchor_min_points{8};
    int orb_features{500};
    float match_ratio{0.75F};
    int ignore_box_min_x{kIgnoreBoxDisabled};
    int ignore_box_max_x{kIgnoreBoxDisabled};
    int ignore_box_min_y{kIgnoreBoxDisabled};
    int ignore_box_max_y{kIgnoreBoxDisabled};

    IgnoreBox ignoreBox() const {
        return IgnoreBox::fromBounds(ignore_box_min_x, ignore_box_max_x, ignore_box_min_y, ignore_box_max_y);
    }
};

inline TrackerConfig correctorTrackingDefaults() {
    TrackerConfig cfg;
    cfg.corner_count = kCorrectorCornerCount;
    cfg.corner_min_distance = kCorrectorCornerMinDistance;
    return cfg;
}

struct CorrectorConfig {
    TrackerConfig tracking{correctorTrackingDefaults()};
    std::string accumulation_mode{"direct"};  // direct | composed
    std::string reference_rebase{"auto"};     // auto | raw | corrected
    double ransac_reproj_threshold_px{3.0};
    double ransac_confidence{0.995};
    int ransac_max_iters{2000};
};

struct IoConfig {
    std::string source_mode{"file"};  // file | gstreamer
    std::string gstreamer_pipeline{
        "filesrc location=input.mp4 ! decodebin ! videoconvert ! video/x-raw,format=BGR ! appsink"};
    double fallback_fps{30.0};
    std::string fourcc{"mp4v"};
    bool verbose{false};
    int report_every_frames{100};
};

struct AppConfig {
    TrackerConfig finder;
    CorrectorConfig corrector;
    IoConfig io;
};

bool parseFlowAlgorithm(const std::string& text, FlowAlgorithm& out);
bool parseAccumulationMode(const std::string& text, AccumulationMode& out);
bool parseReferenceRebase(const std::string& text, ReferenceRebase& out);
ReferenceRebase resolveReferenceRebase(ReferenceRebase rebase, AccumulationMode mode);

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
bool validateTrackerConfig(const TrackerConfig& cfg, const std::string& section, std::string& error);
bool validateCorrectorConfig(const CorrectorConfig& cfg, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);

}  // namespace flowstab
