#pragma once

/**
 * @file zoom_types.hpp
 * @brief Zoom level type and bounds shared by the coordinator and surfaces
 *
 * A zoom level is a logical magnification percentage. How a percentage
 * delta maps onto concrete rendering steps is up to each surface.
 */

#include "Novelist/core/types.hpp"

#include <algorithm>

namespace Novelist::editor {

using ZoomLevel = i32;

inline constexpr ZoomLevel MIN_ZOOM = 50;
inline constexpr ZoomLevel MAX_ZOOM = 200;
inline constexpr ZoomLevel DEFAULT_ZOOM = 100;
inline constexpr i32 DEFAULT_ZOOM_STEP = 10;

/**
 * @brief Clamp an arbitrary request into [MIN_ZOOM, MAX_ZOOM]
 *
 * Takes a 64-bit request so that level +/- step never overflows before
 * clamping.
 */
[[nodiscard]] constexpr ZoomLevel clampZoomLevel(i64 requested) {
  return static_cast<ZoomLevel>(std::clamp<i64>(requested, MIN_ZOOM, MAX_ZOOM));
}

[[nodiscard]] constexpr bool isValidZoomLevel(i64 level) {
  return level >= MIN_ZOOM && level <= MAX_ZOOM;
}

} // namespace Novelist::editor
