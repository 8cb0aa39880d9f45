#pragma once

namespace transfmt::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "1.0";

}  // namespace transfmt::core
