#include "core/time_utils.hpp"

#include <chrono>
#include <cmath>

namespace flowstab {

int64_t nowSteadyNs() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
}

int64_t millisToNs(double millis) {
    return static_cast<int64_t>(std::llround(millis * 1.0e6));
}

}  // namespace flowstab
