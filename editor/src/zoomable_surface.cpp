#include "Novelist/editor/zoomable_surface.hpp"
#include "Novelist/core/logger.hpp"
#include "Novelist/editor/reentrancy_guard.hpp"

namespace Novelist::editor {

ZoomableSurface::ZoomableSurface(ZoomCoordinator* coordinator) : m_coordinator(coordinator) {}

ZoomableSurface::~ZoomableSurface() { detachFromCoordinator(); }

bool ZoomableSurface::attachToCoordinator() {
  if (m_registration.isActive()) {
    return true;
  }
  if (!m_coordinator) {
    NOVELIST_LOG_WARN("Surface '{}' has no zoom coordinator to register with", zoomableName());
    return false;
  }

  auto result = m_coordinator->registerSurface(this);
  if (result.isError()) {
    NOVELIST_LOG_ERROR("Surface '{}' could not register for zoom: {}", zoomableName(),
                       result.error());
    return false;
  }

  m_registration = ZoomRegistration(m_coordinator, result.value());
  return true;
}

void ZoomableSurface::detachFromCoordinator() { m_registration.release(); }

void ZoomableSurface::applyZoomLevel(ZoomLevel level) {
  // Zoom steps can emit layout/content signals that loop back here
  ScopedReentrancyGuard guard(m_isApplyingZoom);
  if (!guard.acquired()) {
    NOVELIST_LOG_TRACE("Surface '{}' already applying zoom, ignoring nested {}%",
                       zoomableName(), level);
    return;
  }

  replaySteps(static_cast<i64>(level) - m_lastAppliedLevel);
}

void ZoomableSurface::replaceContent(const std::string& content, ContentFormat format) {
  const ZoomLevel saved = m_lastAppliedLevel;

  performContentReplacement(content, format);

  // The primitive is back at its baseline now; restore locally, no broadcast
  m_lastAppliedLevel = contentResetBaseline();
  replaySteps(static_cast<i64>(saved) - m_lastAppliedLevel);
}

void ZoomableSurface::increaseZoom(i32 step) {
  if (!m_coordinator) {
    NOVELIST_LOG_WARN("Zoom in requested on '{}' without a coordinator", zoomableName());
    return;
  }
  m_coordinator->zoomIn(step);
}

void ZoomableSurface::decreaseZoom(i32 step) {
  if (!m_coordinator) {
    NOVELIST_LOG_WARN("Zoom out requested on '{}' without a coordinator", zoomableName());
    return;
  }
  m_coordinator->zoomOut(step);
}

void ZoomableSurface::resetZoom() {
  if (!m_coordinator) {
    NOVELIST_LOG_WARN("Zoom reset requested on '{}' without a coordinator", zoomableName());
    return;
  }
  m_coordinator->reset();
}

void ZoomableSurface::replaySteps(i64 delta) {
  if (delta == 0) {
    return;
  }

  NOVELIST_LOG_TRACE("Surface '{}' replaying {} zoom step(s)", zoomableName(), delta);

  // Count each step as it lands so a throwing primitive leaves zoomLevel()
  // matching what is actually rendered
  if (delta > 0) {
    for (i64 i = 0; i < delta; ++i) {
      zoomStepIn();
      ++m_lastAppliedLevel;
    }
  } else {
    for (i64 i = 0; i < -delta; ++i) {
      zoomStepOut();
      --m_lastAppliedLevel;
    }
  }
}

} // namespace Novelist::editor
