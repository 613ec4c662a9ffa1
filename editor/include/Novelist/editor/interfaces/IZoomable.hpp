#pragma once

/**
 * @file IZoomable.hpp
 * @brief Capability required of anything registered with the ZoomCoordinator
 */

#include "Novelist/editor/zoom_types.hpp"

#include <string>

namespace Novelist::editor {

/**
 * @brief A widget that can render at a coordinator-supplied zoom level
 *
 * applyZoomLevel() is invoked by the coordinator on every effective level
 * change and once right after registration.
 */
class IZoomable {
public:
  virtual ~IZoomable() = default;

  virtual void applyZoomLevel(ZoomLevel level) = 0;

  /// Identity used in coordinator log messages
  [[nodiscard]] virtual std::string zoomableName() const { return "zoomable"; }
};

} // namespace Novelist::editor
