/**
 * @file main.cpp
 * @brief Novelist editor entry point
 *
 * Builds the application's long-lived objects in dependency order: the
 * configuration, the logger, the zoom coordinator with its settings store,
 * and finally the main window, which must be destroyed before the
 * coordinator.
 *
 * Usage:
 *   novelist_editor
 *   novelist_editor --zoom 150 --log-level debug
 */

#include "Novelist/core/logger.hpp"
#include "Novelist/editor/editor_config.hpp"
#include "Novelist/editor/interfaces/QtZoomSettingsStore.hpp"
#include "Novelist/editor/qt/nv_main_window.hpp"
#include "Novelist/editor/zoom_coordinator.hpp"

#include <QApplication>
#include <QSettings>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace Novelist::editor;

int runEditor(int argc, char* argv[]) {
  QApplication app(argc, argv);
  QCoreApplication::setOrganizationName("Novelist");
  QCoreApplication::setApplicationName("Editor");

  std::vector<std::string> problems;
  QSettings settings("Novelist", "Editor");
  EditorConfig config = loadEditorConfig(settings, problems);

  auto commandLine = applyCommandLine(config, QCoreApplication::arguments(), problems);
  if (commandLine.isError()) {
    std::cerr << "novelist_editor: " << commandLine.error() << "\n"
              << "Options: --zoom-step <percent> --zoom <percent> "
                 "--log-level <level> --log-file <path>\n";
    return 2;
  }

  applyLoggingConfig(config);
  for (const auto& problem : problems) {
    NOVELIST_LOG_WARN("Configuration: {} (using default)", problem);
  }

  ZoomCoordinator coordinator;
  coordinator.attachSettingsStore(std::make_unique<QtZoomSettingsStore>());
  if (config.initialZoom) {
    coordinator.setLevel(*config.initialZoom, false);
  }

  qt::NVMainWindow window(&coordinator, config);
  window.show();

  NOVELIST_LOG_INFO("Novelist editor started at {}% zoom", coordinator.level());
  return app.exec();
}

} // namespace

int main(int argc, char* argv[]) { return runEditor(argc, argv); }
