#pragma once

#include <cstdint>

namespace flowstab {

int64_t nowSteadyNs();
int64_t millisToNs(double millis);

}  // namespace flowstab
