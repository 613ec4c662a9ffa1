#pragma once

/**
 * @file QtZoomSettingsStore.hpp
 * @brief QSettings-backed implementation of IZoomSettingsStore
 *
 * By default reads and writes the user's native settings
 * (organization "Novelist", application "Editor"). An INI file path can be
 * given instead, which tests use to stay out of the user's settings.
 */

#include "Novelist/editor/interfaces/IZoomSettingsStore.hpp"

#include <QString>

namespace Novelist::editor {

class QtZoomSettingsStore : public IZoomSettingsStore {
public:
  static constexpr const char* ZOOM_LEVEL_KEY = "editor/zoomLevel";

  QtZoomSettingsStore() = default;
  explicit QtZoomSettingsStore(QString iniFilePath);
  ~QtZoomSettingsStore() override = default;

  [[nodiscard]] Result<ZoomLevel> loadZoomLevel() const override;
  Result<void> saveZoomLevel(ZoomLevel level) override;

  [[nodiscard]] const QString& iniFilePath() const { return m_iniFilePath; }

private:
  QString m_iniFilePath;
};

} // namespace Novelist::editor
