#include "vision/vision_primitives.hpp"

namespace flowstab {

const char* toString(VisionStatus status) {
    switch (status) {
        case VisionStatus::Ok:
            return "ok";
        case VisionStatus::InvalidInput:
            return "invalid input";
        case VisionStatus::Degenerate:
            return "degenerate geometry";
        case VisionStatus::NumericalError:
            return "numerical error";
    }
    return "unknown";
}

}  // namespace flowstab
