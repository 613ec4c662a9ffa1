#pragma once

/**
 * @file nv_main_window.hpp
 * @brief Main window of the Novelist editor
 *
 * Hosts the manuscript and notes editors side by side, the View menu zoom
 * actions and a status bar label showing the current zoom level.
 */

#include "Novelist/editor/editor_config.hpp"
#include "Novelist/editor/zoom_coordinator.hpp"

#include <QMainWindow>

class QLabel;

namespace Novelist::editor::qt {

class NVZoomActions;
class NVZoomableTextEdit;

class NVMainWindow : public QMainWindow {
  Q_OBJECT

public:
  /**
   * @param coordinator Zoom coordinator, must outlive the window
   */
  NVMainWindow(ZoomCoordinator* coordinator, const EditorConfig& config,
               QWidget* parent = nullptr);
  ~NVMainWindow() override;

  [[nodiscard]] NVZoomableTextEdit* manuscriptEditor() const { return m_manuscriptEditor; }
  [[nodiscard]] NVZoomableTextEdit* notesEditor() const { return m_notesEditor; }
  [[nodiscard]] NVZoomActions* zoomActions() const { return m_zoomActions; }

  /// Load a text or HTML file into the manuscript editor
  bool openFile(const QString& path);

private:
  void setupEditors();
  void setupMenuBar();
  void setupStatusBar();
  void onOpenRequested();

  ZoomCoordinator* m_coordinator = nullptr;
  EditorConfig m_config;

  NVZoomableTextEdit* m_manuscriptEditor = nullptr;
  NVZoomableTextEdit* m_notesEditor = nullptr;
  NVZoomActions* m_zoomActions = nullptr;
  QLabel* m_zoomLabel = nullptr;
};

} // namespace Novelist::editor::qt
