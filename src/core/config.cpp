#include "core/config.hpp"

#include <fstream>

#include <opencv2/core.hpp>

namespace flowstab {

namespace {

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string unquote(std::string v) {
    v = trim(v);
    if (v.size() >= 2) {
        if ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')) {
            v = v.substr(1, v.size() - 2);
        }
    }
    return v;
}

bool toBool(const std::string& v, bool& out) {
    const std::string t = trim(v);
    if (t == "true" || t == "True" || t == "1") {
        out = true;
        return true;
    }
    if (t == "false" || t == "False" || t == "0") {
        out = false;
        return true;
    }
    return false;
}

// FileStorage has no boolean type: YAML true/false arrive as strings.
void readBool(const cv::FileNode& node, const char* key, bool& out) {
    const cv::FileNode child = node[key];
    if (child.empty()) {
        return;
    }
    if (child.isInt()) {
        out = static_cast<int>(child) != 0;
    } else if (child.isString()) {
        bool b = out;
        if (toBool(static_cast<std::string>(child), b)) {
            out = b;
        }
    }
}

// Accepts either the enum name or the legacy integer selector.
void readAlgorithm(const cv::FileNode& node, std::string& out) {
    const cv::FileNode child = node["algorithm"];
    if (child.empty()) {
        return;
    }
    if (child.isInt()) {
        out = std::to_string(static_cast<int>(child));
    } else if (child.isString()) {
        out = static_cast<std::string>(child);
    }
}

void applyMultiplyTransforms(bool multiply, CorrectorConfig& cfg) {
    cfg.accumulation_mode = multiply ? "composed" : "direct";
}

void readTracker(const cv::FileNode& node, TrackerConfig& cfg) {
    if (node.empty()) {
        return;
    }
    readAlgorithm(node, cfg.algorithm);
    readOrDefault(node, "corner_count", cfg.corner_count);
    readOrDefault(node, "corner_quality_level", cfg.corner_quality_level);
    readOrDefault(node, "corner_min_distance", cfg.corner_min_distance);
    readOrDefault(node, "win_size", cfg.win_size);
    readOrDefault(node, "pyramid_level", cfg.pyramid_level);
    readOrDefault(node, "max_iterations", cfg.max_iterations);
    readOrDefault(node, "epsilon", cfg.epsilon);
    readOrDefault(node, "subpix_window", cfg.subpix_window);
    readOrDefault(node, "subpix_max_iterations", cfg.subpix_max_iterations);
    readOrDefault(node, "subpix_epsilon", cfg.subpix_epsilon);
    readOrDefault(node, "anchor_min_points", cfg.anchor_min_points);
    readOrDefault(node, "orb_features", cfg.orb_features);
    readOrDefault(node, "match_ratio", cfg.match_ratio);
    readOrDefault(node, "ignore_box_min_x", cfg.ignore_box_min_x);
    readOrDefault(node, "ignore_box_max_x", cfg.ignore_box_max_x);
    readOrDefault(node, "ignore_box_min_y", cfg.ignore_box_min_y);
    readOrDefault(node, "ignore_box_max_y", cfg.ignore_box_max_y);
}

bool applyTrackerKey(const std::string& key, const std::string& value, TrackerConfig& cfg) {
    if (key == "algorithm") cfg.algorithm = value;
    else if (key == "corner_count") cfg.corner_count = std::stoi(value);
    else if (key == "corner_quality_level") cfg.corner_quality_level = std::stod(value);
    else if (key == "corner_min_distance") cfg.corner_min_distance = std::stoi(value);
    else if (key == "win_size") cfg.win_size = std::stoi(value);
    else if (key == "pyramid_level") cfg.pyramid_level = std::stoi(value);
    else if (key == "max_iterations") cfg.max_iterations = std::stoi(value);
    else if (key == "epsilon") cfg.epsilon = std::stod(value);
    else if (key == "subpix_window") cfg.subpix_window = std::stoi(value);
    else if (key == "subpix_max_iterations") cfg.subpix_max_iterations = std::stoi(value);
    else if (key == "subpix_epsilon") cfg.subpix_epsilon = std::stod(value);
    else if (key == "anchor_min_points") cfg.anchor_min_points = std::stoi(value);
    else if (key == "orb_features") cfg.orb_features = std::stoi(value);
    else if (key == "match_ratio") cfg.match_ratio = std::stof(value);
    else if (key == "ignore_box_min_x") cfg.ignore_box_min_x = std::stoi(value);
    else if (key == "ignore_box_max_x") cfg.ignore_box_max_x = std::stoi(value);
    else if (key == "ignore_box_min_y") cfg.ignore_box_min_y = std::stoi(value);
    else if (key == "ignore_box_max_y") cfg.ignore_box_max_y = std::stoi(value);
    else return false;
    return true;
}

bool loadConfigPlainYaml(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "failed to open config file: " + path;
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(ifs, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t.rfind("%YAML", 0) == 0 || t == "---") {
            continue;
        }

        // section header, e.g. "corrector:"
        if (t.back() == ':' && t.find(' ') == std::string::npos) {
            section = t.substr(0, t.size() - 1);
            continue;
        }

        const auto colon = t.find(':');
        if (colon == std::string::npos || section.empty()) {
            continue;
        }

        const std::string key = trim(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        // strip inline comment
        const auto hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        try {
            if (section == "finder") {
                applyTrackerKey(key, value, out.finder);
            } else if (section == "corrector") {
                if (applyTrackerKey(key, value, out.corrector.tracking)) {
                    continue;
                }
                if (key == "accumulation_mode") out.corrector.accumulation_mode = value;
                else if (key == "multiply_transforms") {
                    bool b = false;
                    if (toBool(value, b)) applyMultiplyTransforms(b, out.corrector);
                } else if (key == "reference_rebase") out.corrector.reference_rebase = value;
                else if (key == "ransac_reproj_threshold_px") out.corrector.ransac_reproj_threshold_px = std::stod(value);
                else if (key == "ransac_confidence") out.corrector.ransac_confidence = std::stod(value);
                else if (key == "ransac_max_iters") out.corrector.ransac_max_iters = std::stoi(value);
            } else if (section == "io") {
                if (key == "source_mode") out.io.source_mode = value;
                else if (key == "gstreamer_pipeline") out.io.gstreamer_pipeline = value;
                else if (key == "fallback_fps") out.io.fallback_fps = std::stod(value);
                else if (key == "fourcc") out.io.fourcc = value;
                else if (key == "report_every_frames") out.io.report_every_frames = std::stoi(value);
                else if (key == "verbose") {
                    bool b = out.io.verbose;
                    if (toBool(value, b)) out.io.verbose = b;
                }
            }
        } catch (const std::exception&) {
            error = "invalid value for " + section + "." + key + ": '" + value + "'";
            return false;
        }
    }

    return validateConfig(out, error);
}

}  // namespace

bool parseFlowAlgorithm(const std::string& text, FlowAlgorithm& out) {
    if (text == "point_tracking" || text == "lucas_kanade" || text == "1") {
        out = FlowAlgorithm::PointTracking;
        return true;
    }
    if (text == "feature_redetection" || text == "2") {
        out = FlowAlgorithm::FeatureRedetection;
        return true;
    }
    return false;
}

bool parseAccumulationMode(const std::string& text, AccumulationMode& out) {
    if (text == "direct") {
        out = AccumulationMode::Direct;
        return true;
    }
    if (text == "composed") {
        out = AccumulationMode::Composed;
        return true;
    }
    return false;
}

bool parseReferenceRebase(const std::string& text, ReferenceRebase& out) {
    if (text == "auto") {
        out = ReferenceRebase::Auto;
        return true;
    }
    if (text == "raw") {
        out = ReferenceRebase::Raw;
        return true;
    }
    if (text == "corrected") {
        out = ReferenceRebase::Corrected;
        return true;
    }
    return false;
}

ReferenceRebase resolveReferenceRebase(ReferenceRebase rebase, AccumulationMode mode) {
    if (rebase != ReferenceRebase::Auto) {
        return rebase;
    }
    return (mode == AccumulationMode::Composed) ? ReferenceRebase::Raw : ReferenceRebase::Corrected;
}

bool validateTrackerConfig(const TrackerConfig& cfg, const std::string& section, std::string& error) {
    FlowAlgorithm algorithm = FlowAlgorithm::PointTracking;
    if (!parseFlowAlgorithm(cfg.algorithm, algorithm)) {
        error = section + ".algorithm must be 'point_tracking' or 'feature_redetection', got '" + cfg.algorithm + "'";
        return false;
    }
    if (cfg.corner_count <= 0) {
        error = section + ".corner_count must be > 0";
        return false;
    }
    if (cfg.corner_quality_level <= 0.0 || cfg.corner_quality_level > 1.0) {
        error = section + ".corner_quality_level must be in (0,1]";
        return false;
    }
    if (cfg.corner_min_distance < 0) {
        error = section + ".corner_min_distance must be >= 0";
        return false;
    }
    if (cfg.win_size < 3) {
        error = section + ".win_size must be >= 3";
        return false;
    }
    if (cfg.pyramid_level < 0) {
        error = section + ".pyramid_level must be >= 0";
        return false;
    }
    if (cfg.max_iterations <= 0 || cfg.epsilon <= 0.0) {
        error = section + ".max_iterations and epsilon must be > 0";
        return false;
    }
    if (cfg.subpix_window <= 0 || cfg.subpix_max_iterations <= 0 || cfg.subpix_epsilon <= 0.0) {
        error = section + " sub-pixel window/iterations/epsilon must be > 0";
        return false;
    }
    if (cfg.anchor_min_points < 0) {
        error = section + ".anchor_min_points must be >= 0";
        return false;
    }
    if (cfg.orb_features <= 0) {
        error = section + ".orb_features must be > 0";
        return false;
    }
    if (cfg.match_ratio <= 0.0F || cfg.match_ratio >= 1.0F) {
        error = section + ".match_ratio must be in (0,1)";
        return false;
    }
    const IgnoreBox box = cfg.ignoreBox();
    if (box.enabled()) {
        if (box.minX() < 0 || box.minY() < 0) {
            error = section + " ignore box bounds must be >= 0 (or -1 to disable)";
            return false;
        }
        if (box.minX() > box.maxX() || box.minY() > box.maxY()) {
            error = section + " ignore box min must be <= max";
            return false;
        }
    }
    error.clear();
    return true;
}

bool validateCorrectorConfig(const CorrectorConfig& cfg, std::string& error) {
    if (!validateTrackerConfig(cfg.tracking, "corrector", error)) {
        return false;
    }
    AccumulationMode mode = AccumulationMode::Direct;
    if (!parseAccumulationMode(cfg.accumulation_mode, mode)) {
        error = "corrector.accumulation_mode must be 'direct' or 'composed'";
        return false;
    }
    ReferenceRebase rebase = ReferenceRebase::Auto;
    if (!parseReferenceRebase(cfg.reference_rebase, rebase)) {
        error = "corrector.reference_rebase must be 'auto', 'raw' or 'corrected'";
        return false;
    }
    if (cfg.ransac_reproj_threshold_px <= 0.0) {
        error = "corrector.ransac_reproj_threshold_px must be > 0";
        return false;
    }
    if (cfg.ransac_confidence <= 0.0 || cfg.ransac_confidence >= 1.0) {
        error = "corrector.ransac_confidence must be in (0,1)";
        return false;
    }
    if (cfg.ransac_max_iters <= 0) {
        error = "corrector.ransac_max_iters must be > 0";
        return false;
    }
    error.clear();
    return true;
}

bool validateConfig(const AppConfig& cfg, std::string& error) {
    if (!validateTrackerConfig(cfg.finder, "finder", error)) {
        return false;
    }
    if (!validateCorrectorConfig(cfg.corrector, error)) {
        return false;
    }
    if (cfg.io.source_mode != "file" && cfg.io.source_mode != "gstreamer") {
        error = "io.source_mode must be 'file' or 'gstreamer'";
        return false;
    }
    if (cfg.io.source_mode == "gstreamer" && cfg.io.gstreamer_pipeline.empty()) {
        error = "io.gstreamer_pipeline must not be empty when source_mode=gstreamer";
        return false;
    }
    if (cfg.io.fallback_fps <= 0.0) {
        error = "io.fallback_fps must be > 0";
        return false;
    }
    if (cfg.io.fourcc.size() != 4) {
        error = "io.fourcc must be exactly 4 characters";
        return false;
    }
    if (cfg.io.report_every_frames < 0) {
        error = "io.report_every_frames must be >= 0";
        return false;
    }
    error.clear();
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const cv::FileNode finder = fs["finder"];
            const cv::FileNode corrector = fs["corrector"];
            const cv::FileNode io = fs["io"];

            readTracker(finder, out.finder);

            readTracker(corrector, out.corrector.tracking);
            if (!corrector.empty()) {
                bool multiply = false;
                if (!corrector["multiply_transforms"].empty()) {
                    readBool(corrector, "multiply_transforms", multiply);
                    applyMultiplyTransforms(multiply, out.corrector);
                }
                readOrDefault(corrector, "accumulation_mode", out.corrector.accumulation_mode);
                readOrDefault(corrector, "reference_rebase", out.corrector.reference_rebase);
                readOrDefault(corrector, "ransac_reproj_threshold_px", out.corrector.ransac_reproj_threshold_px);
                readOrDefault(corrector, "ransac_confidence", out.corrector.ransac_confidence);
                readOrDefault(corrector, "ransac_max_iters", out.corrector.ransac_max_iters);
            }

            readOrDefault(io, "source_mode", out.io.source_mode);
            readOrDefault(io, "gstreamer_pipeline", out.io.gstreamer_pipeline);
            readOrDefault(io, "fallback_fps", out.io.fallback_fps);
            readOrDefault(io, "fourcc", out.io.fourcc);
            readOrDefault(io, "report_every_frames", out.io.report_every_frames);
            readBool(io, "verbose", out.io.verbose);

            return validateConfig(out, error);
        }
    } catch (const cv::Exception&) {
        // fall through to plain YAML parser below
    }

    return loadConfigPlainYaml(path, out, error);
}

}  // namespace flowstab
