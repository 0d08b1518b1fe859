#ifndef AXIAL_CORE_CONFIG_H
#define AXIAL_CORE_CONFIG_H

#include <cstdint>

namespace axial::core::config {

// Wire value of an unbounded max-width / max-height.
inline constexpr std::int32_t kUnboundedExtent = 2147483647;

inline constexpr std::uint32_t kDefaultRegionWidth = 640;
inline constexpr std::uint32_t kDefaultRegionHeight = 480;

inline constexpr const char kDefaultOrientation[] = "VERTICAL";
inline constexpr const char kDefaultSpacing[] = "PACK_CENTER";

inline constexpr const char kVersionString[] = "axial_layout 0.1.0";

}  // namespace axial::core::config

#endif  // AXIAL_CORE_CONFIG_H
