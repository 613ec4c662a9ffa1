/**
 * @file QtZoomSettingsStore.cpp
 * @brief QSettings-backed zoom level persistence
 */

#include "Novelist/editor/interfaces/QtZoomSettingsStore.hpp"

#include <QSettings>
#include <memory>
#include <string>
#include <utility>

namespace Novelist::editor {

namespace {

std::unique_ptr<QSettings> openSettings(const QString& iniFilePath) {
  if (iniFilePath.isEmpty()) {
    return std::make_unique<QSettings>("Novelist", "Editor");
  }
  return std::make_unique<QSettings>(iniFilePath, QSettings::IniFormat);
}

} // namespace

QtZoomSettingsStore::QtZoomSettingsStore(QString iniFilePath)
    : m_iniFilePath(std::move(iniFilePath)) {}

Result<ZoomLevel> QtZoomSettingsStore::loadZoomLevel() const {
  auto settings = openSettings(m_iniFilePath);
  if (settings->status() != QSettings::NoError) {
    return Result<ZoomLevel>::error("Failed to read editor settings");
  }
  if (!settings->contains(ZOOM_LEVEL_KEY)) {
    return Result<ZoomLevel>::ok(DEFAULT_ZOOM);
  }

  bool ok = false;
  const int level = settings->value(ZOOM_LEVEL_KEY).toInt(&ok);
  if (!ok) {
    return Result<ZoomLevel>::error(std::string("Stored value for ") + ZOOM_LEVEL_KEY +
                                    " is not an integer");
  }
  return Result<ZoomLevel>::ok(static_cast<ZoomLevel>(level));
}

Result<void> QtZoomSettingsStore::saveZoomLevel(ZoomLevel level) {
  auto settings = openSettings(m_iniFilePath);
  settings->setValue(ZOOM_LEVEL_KEY, static_cast<int>(level));
  settings->sync();
  if (settings->status() != QSettings::NoError) {
    return Result<void>::error("Failed to write editor settings");
  }
  return Result<void>::ok();
}

} // namespace Novelist::editor
