#include "tracking/flow_finder.hpp"

#include <utility>

#include "tracking/feature_matcher.hpp"
#include "tracking/feature_tracker.hpp"

namespace flowstab {

std::unique_ptr<FlowFinder> createFlowFinder(
    const TrackerConfig& config,
    std::shared_ptr<VisionPrimitives> primitives,
    std::string& error) {
    if (!primitives) {
        error = "no vision primitives supplied";
        return nullptr;
    }

    FlowAlgorithm algorithm = FlowAlgorithm::PointTracking;
    if (!parseFlowAlgorithm(config.algorithm, algorithm)) {
        error = "unknown flow algorithm: " + config.algorithm;
        return nullptr;
    }

    error.clear();
    switch (algorithm) {
        case FlowAlgorithm::PointTracking:
            return std::make_unique<FeatureTracker>(config, std::move(primitives));
        case FlowAlgorithm::FeatureRedetection:
            return std::make_unique<FeatureMatcher>(config, std::move(primitives));
    }
    error = "unknown flow algorithm: " + config.algorithm;
    return nullptr;
}

}  // namespace flowstab
