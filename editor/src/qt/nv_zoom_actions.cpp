#include "Novelist/editor/qt/nv_zoom_actions.hpp"

#include <QAction>
#include <QKeySequence>
#include <QMenu>

namespace Novelist::editor::qt {

NVZoomActions::NVZoomActions(ZoomCoordinator* coordinator, QObject* parent)
    : QObject(parent), m_coordinator(coordinator) {
  m_zoomInAction = new QAction(tr("Zoom &In"), this);
  m_zoomInAction->setShortcut(QKeySequence::ZoomIn);
  m_zoomInAction->setStatusTip(tr("Enlarge the text in every editor"));

  m_zoomOutAction = new QAction(tr("Zoom &Out"), this);
  m_zoomOutAction->setShortcut(QKeySequence::ZoomOut);
  m_zoomOutAction->setStatusTip(tr("Shrink the text in every editor"));

  m_resetZoomAction = new QAction(tr("&Reset Zoom"), this);
  m_resetZoomAction->setShortcut(QKeySequence(tr("Ctrl+0")));
  m_resetZoomAction->setStatusTip(tr("Show text at 100%"));

  if (!m_coordinator) {
    m_zoomInAction->setEnabled(false);
    m_zoomOutAction->setEnabled(false);
    m_resetZoomAction->setEnabled(false);
    return;
  }

  connect(m_zoomInAction, &QAction::triggered, this,
          [this]() { m_coordinator->zoomIn(m_zoomStep); });
  connect(m_zoomOutAction, &QAction::triggered, this,
          [this]() { m_coordinator->zoomOut(m_zoomStep); });
  connect(m_resetZoomAction, &QAction::triggered, this, [this]() { m_coordinator->reset(); });

  m_subscription = m_coordinator->subscribe([this](ZoomLevel level) {
    updateActionStates(level);
    emit zoomLevelChanged(level);
  });

  updateActionStates(m_coordinator->level());
}

NVZoomActions::~NVZoomActions() {
  if (m_coordinator) {
    m_coordinator->unsubscribe(m_subscription);
  }
}

void NVZoomActions::populateMenu(QMenu* menu) const {
  if (!menu) {
    return;
  }
  menu->addAction(m_zoomInAction);
  menu->addAction(m_zoomOutAction);
  menu->addAction(m_resetZoomAction);
}

QString NVZoomActions::statusText() const {
  const ZoomLevel level = m_coordinator ? m_coordinator->level() : DEFAULT_ZOOM;
  return tr("Zoom: %1%").arg(level);
}

void NVZoomActions::updateActionStates(ZoomLevel level) {
  m_zoomInAction->setEnabled(level < MAX_ZOOM);
  m_zoomOutAction->setEnabled(level > MIN_ZOOM);
  m_resetZoomAction->setEnabled(level != DEFAULT_ZOOM);
}

} // namespace Novelist::editor::qt
