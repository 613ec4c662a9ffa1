#pragma once

/**
 * @file IZoomSettingsStore.hpp
 * @brief Durable storage for the editor zoom level
 *
 * Decouples the ZoomCoordinator from QSettings so tests can inject a mock
 * and count or fail writes.
 */

#include "Novelist/core/result.hpp"
#include "Novelist/editor/zoom_types.hpp"

namespace Novelist::editor {

class IZoomSettingsStore {
public:
  virtual ~IZoomSettingsStore() = default;

  /**
   * @brief Read the saved zoom level
   * @return The saved level (DEFAULT_ZOOM when nothing was saved yet), or an
   *         error if the stored value is unreadable
   */
  [[nodiscard]] virtual Result<ZoomLevel> loadZoomLevel() const = 0;

  /**
   * @brief Persist a zoom level
   */
  virtual Result<void> saveZoomLevel(ZoomLevel level) = 0;
};

} // namespace Novelist::editor
