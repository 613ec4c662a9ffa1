#pragma once

/**
 * @file zoomable_surface.hpp
 * @brief Coordinator-driven zoom for text primitives with relative zoom only
 *
 * Text widgets such as QTextEdit only offer "zoom in/out by one step" and
 * drop back to their neutral magnification whenever their whole content is
 * replaced. ZoomableSurface turns that into an absolute, coordinator-driven
 * level:
 * - applyZoomLevel() replays single steps from the last applied level
 * - replaceContent() re-applies the level after the primitive resets it
 * - zoom requests made on the surface are forwarded to the coordinator, so
 *   every registered surface follows
 *
 * Subclasses supply the primitive operations and must call
 * attachToCoordinator() at the end of their own constructor, once the
 * primitive is fully constructed.
 */

#include "Novelist/core/types.hpp"
#include "Novelist/editor/interfaces/IZoomable.hpp"
#include "Novelist/editor/zoom_coordinator.hpp"

#include <string>

namespace Novelist::editor {

enum class ContentFormat : u8 { PlainText, RichText };

class ZoomableSurface : public IZoomable {
public:
  explicit ZoomableSurface(ZoomCoordinator* coordinator);
  ~ZoomableSurface() override;

  ZoomableSurface(const ZoomableSurface&) = delete;
  ZoomableSurface& operator=(const ZoomableSurface&) = delete;

  /**
   * @brief Bring the primitive to @p level by replaying single steps
   *
   * A nested call made while a previous call is still replaying is ignored.
   * If a step throws, zoomLevel() stays at the last step that completed.
   */
  void applyZoomLevel(ZoomLevel level) override;

  /**
   * @brief Replace the displayed content without changing the zoom level
   */
  void replaceContent(const std::string& content, ContentFormat format);

  // Global zoom requests, forwarded to the coordinator
  void increaseZoom(i32 step = DEFAULT_ZOOM_STEP);
  void decreaseZoom(i32 step = DEFAULT_ZOOM_STEP);
  void resetZoom();

  /// Level this surface last rendered at
  [[nodiscard]] ZoomLevel zoomLevel() const { return m_lastAppliedLevel; }

  [[nodiscard]] ZoomCoordinator* coordinator() const { return m_coordinator; }
  [[nodiscard]] bool isRegisteredForZoom() const { return m_registration.isActive(); }

  /**
   * @brief Register with the coordinator and sync to its current level
   * @return false if there is no coordinator or registration failed
   */
  bool attachToCoordinator();
  void detachFromCoordinator();

protected:
  virtual void zoomStepIn() = 0;
  virtual void zoomStepOut() = 0;

  /// Swap the primitive's content; the primitive may reset its magnification
  virtual void performContentReplacement(const std::string& content, ContentFormat format) = 0;

  /// Level the primitive falls back to after performContentReplacement()
  [[nodiscard]] virtual ZoomLevel contentResetBaseline() const { return DEFAULT_ZOOM; }

private:
  void replaySteps(i64 delta);

  ZoomCoordinator* m_coordinator = nullptr;
  ZoomRegistration m_registration;
  ZoomLevel m_lastAppliedLevel = DEFAULT_ZOOM;
  bool m_isApplyingZoom = false;
};

} // namespace Novelist::editor
