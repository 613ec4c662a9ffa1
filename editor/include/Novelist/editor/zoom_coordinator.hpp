#pragma once

/**
 * @file zoom_coordinator.hpp
 * @brief Single source of truth for the editor-wide text zoom level
 *
 * The coordinator owns the current zoom percentage, keeps the set of live
 * zoomable surfaces and broadcasts every effective level change to all of
 * them, then persists the level and notifies subscribers.
 *
 * One coordinator is created by the application's composition root and
 * handed to every surface. It must outlive all surfaces registered with it.
 *
 * Usage:
 * @code
 * ZoomCoordinator coordinator;
 * coordinator.attachSettingsStore(std::make_unique<QtZoomSettingsStore>());
 *
 * NVZoomableTextEdit editor(&coordinator); // registers and syncs
 * coordinator.zoomIn();                    // every surface follows
 * @endcode
 */

#include "Novelist/core/result.hpp"
#include "Novelist/core/types.hpp"
#include "Novelist/editor/interfaces/IZoomSettingsStore.hpp"
#include "Novelist/editor/interfaces/IZoomable.hpp"
#include "Novelist/editor/zoom_types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace Novelist::editor {

using ZoomSurfaceId = u64;
inline constexpr ZoomSurfaceId INVALID_ZOOM_SURFACE_ID = 0;

using ZoomChangeHandler = std::function<void(ZoomLevel)>;

/**
 * @brief Handle returned by ZoomCoordinator::subscribe()
 */
class ZoomSubscription {
public:
  ZoomSubscription() = default;
  explicit ZoomSubscription(u64 id) : m_id(id) {}

  [[nodiscard]] u64 id() const { return m_id; }
  [[nodiscard]] bool isValid() const { return m_id != 0; }

private:
  u64 m_id = 0;
};

class ZoomCoordinator {
public:
  ZoomCoordinator();
  explicit ZoomCoordinator(ZoomLevel initialLevel);
  ~ZoomCoordinator();

  ZoomCoordinator(const ZoomCoordinator&) = delete;
  ZoomCoordinator& operator=(const ZoomCoordinator&) = delete;

  // =========================================================================
  // Level
  // =========================================================================

  [[nodiscard]] ZoomLevel level() const;

  /**
   * @brief Change the zoom level of every registered surface
   *
   * The request is clamped into [MIN_ZOOM, MAX_ZOOM]. Requesting the current
   * level does nothing. A surface that throws is logged and skipped; a failed
   * persistence write is logged. Neither is reported to the caller.
   *
   * @param requested Requested level in percent
   * @param persist Write the new level through the attached settings store
   */
  void setLevel(i64 requested, bool persist = true);

  void zoomIn(i32 step = DEFAULT_ZOOM_STEP);
  void zoomOut(i32 step = DEFAULT_ZOOM_STEP);
  void reset();

  // =========================================================================
  // Surfaces
  // =========================================================================

  /**
   * @brief Register a surface and sync it to the current level
   *
   * The surface receives applyZoomLevel(level()) before this returns.
   * Registering an already registered surface returns its existing id.
   *
   * @return The surface id, or an error for a null surface
   */
  Result<ZoomSurfaceId> registerSurface(IZoomable* surface);

  /// Removing an unknown id is a no-op
  void unregisterSurface(ZoomSurfaceId id);
  void unregisterSurface(const IZoomable* surface);

  [[nodiscard]] bool isRegistered(ZoomSurfaceId id) const;
  [[nodiscard]] usize surfaceCount() const;

  /// Drop every registration while keeping the current level
  void clearSurfaces();

  // =========================================================================
  // Persistence
  // =========================================================================

  /**
   * @brief Attach durable storage and restore the saved level from it
   *
   * A saved level inside the valid range becomes current without being
   * written back. Out-of-range or unreadable values are logged and ignored.
   * Passing nullptr detaches the current store.
   */
  void attachSettingsStore(std::unique_ptr<IZoomSettingsStore> store);
  [[nodiscard]] IZoomSettingsStore* settingsStore() const;

  // =========================================================================
  // Change Notification
  // =========================================================================

  /**
   * @brief Subscribe to effective level changes
   *
   * Handlers run after the broadcast and the persistence attempt. A handler
   * unsubscribed by an earlier handler of the same notification is skipped.
   */
  ZoomSubscription subscribe(ZoomChangeHandler handler);
  void unsubscribe(const ZoomSubscription& subscription);

private:
  struct SurfaceEntry {
    ZoomSurfaceId id = INVALID_ZOOM_SURFACE_ID;
    IZoomable* surface = nullptr;
  };

  struct Subscriber {
    u64 id = 0;
    ZoomChangeHandler handler;
  };

  [[nodiscard]] bool isCurrentGeneration(u64 generation) const;
  void deliver(const SurfaceEntry& entry, ZoomLevel level, const char* context);
  void persistLevel(IZoomSettingsStore& store, ZoomLevel level);
  void notifySubscribers(ZoomLevel level);
  [[nodiscard]] bool isSubscribed(u64 subscriberId) const;

  ZoomLevel m_level = DEFAULT_ZOOM;
  u64 m_generation = 0;

  std::vector<SurfaceEntry> m_surfaces;
  ZoomSurfaceId m_nextSurfaceId = 1;

  std::shared_ptr<IZoomSettingsStore> m_store;

  std::vector<Subscriber> m_subscribers;
  u64 m_nextSubscriberId = 1;

  mutable std::mutex m_mutex;
};

/**
 * @brief RAII handle for a surface registration
 *
 * Unregisters the surface from its coordinator when released or destroyed.
 */
class ZoomRegistration {
public:
  ZoomRegistration() = default;
  ZoomRegistration(ZoomCoordinator* coordinator, ZoomSurfaceId id)
      : m_coordinator(coordinator), m_id(id) {}
  ~ZoomRegistration() { release(); }

  ZoomRegistration(const ZoomRegistration&) = delete;
  ZoomRegistration& operator=(const ZoomRegistration&) = delete;

  ZoomRegistration(ZoomRegistration&& other) noexcept
      : m_coordinator(other.m_coordinator), m_id(other.m_id) {
    other.m_coordinator = nullptr;
    other.m_id = INVALID_ZOOM_SURFACE_ID;
  }

  ZoomRegistration& operator=(ZoomRegistration&& other) noexcept {
    if (this != &other) {
      release();
      m_coordinator = other.m_coordinator;
      m_id = other.m_id;
      other.m_coordinator = nullptr;
      other.m_id = INVALID_ZOOM_SURFACE_ID;
    }
    return *this;
  }

  void release() {
    if (m_coordinator && m_id != INVALID_ZOOM_SURFACE_ID) {
      m_coordinator->unregisterSurface(m_id);
    }
    m_coordinator = nullptr;
    m_id = INVALID_ZOOM_SURFACE_ID;
  }

  [[nodiscard]] bool isActive() const {
    return m_coordinator && m_id != INVALID_ZOOM_SURFACE_ID;
  }
  [[nodiscard]] ZoomSurfaceId id() const { return m_id; }

private:
  ZoomCoordinator* m_coordinator = nullptr;
  ZoomSurfaceId m_id = INVALID_ZOOM_SURFACE_ID;
};

} // namespace Novelist::editor
