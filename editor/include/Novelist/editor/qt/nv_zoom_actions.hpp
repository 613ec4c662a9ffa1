#pragma once

/**
 * @file nv_zoom_actions.hpp
 * @brief View-menu zoom actions bound to the ZoomCoordinator
 *
 * Owns the "Zoom In" (Ctrl++), "Zoom Out" (Ctrl+-) and "Reset Zoom"
 * (Ctrl+0) actions, keeps their enabled state in line with the current
 * level and re-emits coordinator changes as a Qt signal for status bars and
 * settings panels.
 */

#include "Novelist/editor/zoom_coordinator.hpp"

#include <QObject>
#include <QString>

class QAction;
class QMenu;

namespace Novelist::editor::qt {

class NVZoomActions : public QObject {
  Q_OBJECT

public:
  /**
   * @param coordinator Zoom coordinator, must outlive this object
   */
  explicit NVZoomActions(ZoomCoordinator* coordinator, QObject* parent = nullptr);
  ~NVZoomActions() override;

  [[nodiscard]] QAction* zoomInAction() const { return m_zoomInAction; }
  [[nodiscard]] QAction* zoomOutAction() const { return m_zoomOutAction; }
  [[nodiscard]] QAction* resetZoomAction() const { return m_resetZoomAction; }

  void populateMenu(QMenu* menu) const;

  void setZoomStep(i32 step) { m_zoomStep = step; }
  [[nodiscard]] i32 zoomStep() const { return m_zoomStep; }

  /// e.g. "Zoom: 110%"
  [[nodiscard]] QString statusText() const;

signals:
  void zoomLevelChanged(int level);

private:
  void updateActionStates(ZoomLevel level);

  ZoomCoordinator* m_coordinator = nullptr;
  ZoomSubscription m_subscription;
  i32 m_zoomStep = DEFAULT_ZOOM_STEP;

  QAction* m_zoomInAction = nullptr;
  QAction* m_zoomOutAction = nullptr;
  QAction* m_resetZoomAction = nullptr;
};

} // namespace Novelist::editor::qt
