#include "Novelist/editor/zoom_coordinator.hpp"
#include "Novelist/core/logger.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace Novelist::editor {

namespace {

// Only used for log messages; a failing name never blocks delivery
std::string surfaceName(const IZoomable& surface) {
  try {
    return surface.zoomableName();
  } catch (const std::exception&) {
    return "<unnamed>";
  } catch (...) {
    return "<unnamed>";
  }
}

} // namespace

ZoomCoordinator::ZoomCoordinator() = default;

ZoomCoordinator::ZoomCoordinator(ZoomLevel initialLevel)
    : m_level(clampZoomLevel(initialLevel)) {}

ZoomCoordinator::~ZoomCoordinator() {
  const usize remaining = surfaceCount();
  if (remaining > 0) {
    NOVELIST_LOG_WARN("ZoomCoordinator destroyed with {} surface(s) still registered",
                      remaining);
  }
}

// ============================================================================
// Level
// ============================================================================

ZoomLevel ZoomCoordinator::level() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

void ZoomCoordinator::setLevel(i64 requested, bool persist) {
  const ZoomLevel level = clampZoomLevel(requested);

  ZoomLevel previous = DEFAULT_ZOOM;
  u64 generation = 0;
  std::vector<SurfaceEntry> snapshot;
  std::shared_ptr<IZoomSettingsStore> store;
  bool unchanged = false;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    unchanged = (level == m_level);
    if (!unchanged) {
      previous = m_level;
      m_level = level;
      generation = ++m_generation;

      // Callbacks may register or unregister surfaces; iterate a copy
      snapshot = m_surfaces;
      if (persist) {
        store = m_store;
      }
    }
  }

  if (unchanged) {
    NOVELIST_LOG_TRACE("Zoom already at {}%, nothing to do", level);
    return;
  }

  NOVELIST_LOG_DEBUG("Zoom changed: {}% -> {}% ({} surface(s))", previous, level,
                     snapshot.size());

  for (const auto& entry : snapshot) {
    // A callback that changed the level again has already broadcast the
    // newer level to everyone; delivering ours now would undo it.
    if (!isCurrentGeneration(generation)) {
      NOVELIST_LOG_DEBUG("Zoom broadcast of {}% superseded by a nested change", level);
      return;
    }
    if (!isRegistered(entry.id)) {
      continue;
    }
    deliver(entry, level, "broadcast");
  }

  if (store) {
    persistLevel(*store, level);
  }

  notifySubscribers(level);
}

void ZoomCoordinator::zoomIn(i32 step) {
  setLevel(static_cast<i64>(level()) + step);
}

void ZoomCoordinator::zoomOut(i32 step) {
  setLevel(static_cast<i64>(level()) - step);
}

void ZoomCoordinator::reset() { setLevel(DEFAULT_ZOOM); }

bool ZoomCoordinator::isCurrentGeneration(u64 generation) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_generation == generation;
}

void ZoomCoordinator::deliver(const SurfaceEntry& entry, ZoomLevel level,
                              const char* context) {
  // Read the name up front: the callback may destroy the surface
  const std::string name = surfaceName(*entry.surface);
  try {
    entry.surface->applyZoomLevel(level);
  } catch (const std::exception& e) {
    NOVELIST_LOG_ERROR("Failed to apply zoom {}% to surface '{}' (#{}) during {}: {}", level,
                       name, entry.id, context, e.what());
  } catch (...) {
    NOVELIST_LOG_ERROR("Failed to apply zoom {}% to surface '{}' (#{}) during {}: unknown error",
                       level, name, entry.id, context);
  }
}

// ============================================================================
// Surfaces
// ============================================================================

Result<ZoomSurfaceId> ZoomCoordinator::registerSurface(IZoomable* surface) {
  if (!surface) {
    return Result<ZoomSurfaceId>::error("Cannot register a null zoomable surface");
  }

  SurfaceEntry entry;
  ZoomLevel level = DEFAULT_ZOOM;
  usize count = 0;
  bool alreadyRegistered = false;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_surfaces.begin(), m_surfaces.end(),
                           [surface](const SurfaceEntry& e) { return e.surface == surface; });
    if (it != m_surfaces.end()) {
      entry = *it;
      alreadyRegistered = true;
    } else {
      entry.id = m_nextSurfaceId++;
      entry.surface = surface;
      m_surfaces.push_back(entry);
    }
    level = m_level;
    count = m_surfaces.size();
  }

  if (alreadyRegistered) {
    NOVELIST_LOG_DEBUG("Surface '{}' already registered as #{}", surfaceName(*surface),
                       entry.id);
  } else {
    NOVELIST_LOG_DEBUG("Registered surface '{}' as #{} at {}% ({} registered)",
                       surfaceName(*surface), entry.id, level, count);
  }

  // Sync immediately so a late joiner never renders at a stale default
  deliver(entry, level, "initial sync");

  return Result<ZoomSurfaceId>::ok(entry.id);
}

void ZoomCoordinator::unregisterSurface(ZoomSurfaceId id) {
  usize remaining = 0;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_surfaces.begin(), m_surfaces.end(),
                           [id](const SurfaceEntry& e) { return e.id == id; });
    if (it == m_surfaces.end()) {
      return;
    }
    m_surfaces.erase(it);
    remaining = m_surfaces.size();
  }
  NOVELIST_LOG_DEBUG("Unregistered surface #{} ({} registered)", id, remaining);
}

void ZoomCoordinator::unregisterSurface(const IZoomable* surface) {
  ZoomSurfaceId id = INVALID_ZOOM_SURFACE_ID;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_surfaces.begin(), m_surfaces.end(),
                           [surface](const SurfaceEntry& e) { return e.surface == surface; });
    if (it == m_surfaces.end()) {
      return;
    }
    id = it->id;
  }
  unregisterSurface(id);
}

bool ZoomCoordinator::isRegistered(ZoomSurfaceId id) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return std::any_of(m_surfaces.begin(), m_surfaces.end(),
                     [id](const SurfaceEntry& e) { return e.id == id; });
}

usize ZoomCoordinator::surfaceCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_surfaces.size();
}

void ZoomCoordinator::clearSurfaces() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_surfaces.clear();
}

// ============================================================================
// Persistence
// ============================================================================

void ZoomCoordinator::attachSettingsStore(std::unique_ptr<IZoomSettingsStore> store) {
  std::shared_ptr<IZoomSettingsStore> attached(std::move(store));
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_store = attached;
  }

  if (!attached) {
    NOVELIST_LOG_DEBUG("Zoom settings store detached");
    return;
  }

  auto saved = attached->loadZoomLevel();
  if (saved.isError()) {
    NOVELIST_LOG_WARN("Could not read saved zoom level: {}", saved.error());
    return;
  }

  const ZoomLevel savedLevel = saved.value();
  if (!isValidZoomLevel(savedLevel)) {
    NOVELIST_LOG_WARN("Ignoring saved zoom level {}% outside [{}%, {}%]", savedLevel, MIN_ZOOM,
                      MAX_ZOOM);
    return;
  }

  NOVELIST_LOG_INFO("Zoom settings store attached, restoring {}%", savedLevel);
  setLevel(savedLevel, false);
}

IZoomSettingsStore* ZoomCoordinator::settingsStore() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_store.get();
}

void ZoomCoordinator::persistLevel(IZoomSettingsStore& store, ZoomLevel level) {
  try {
    auto result = store.saveZoomLevel(level);
    if (result.isError()) {
      NOVELIST_LOG_WARN("Failed to persist zoom level {}%: {}", level, result.error());
    }
  } catch (const std::exception& e) {
    NOVELIST_LOG_WARN("Failed to persist zoom level {}%: {}", level, e.what());
  } catch (...) {
    NOVELIST_LOG_WARN("Failed to persist zoom level {}%: unknown error", level);
  }
}

// ============================================================================
// Change Notification
// ============================================================================

ZoomSubscription ZoomCoordinator::subscribe(ZoomChangeHandler handler) {
  std::lock_guard<std::mutex> lock(m_mutex);
  Subscriber sub;
  sub.id = m_nextSubscriberId++;
  sub.handler = std::move(handler);
  m_subscribers.push_back(std::move(sub));
  return ZoomSubscription(m_subscribers.back().id);
}

void ZoomCoordinator::unsubscribe(const ZoomSubscription& subscription) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_subscribers.erase(std::remove_if(m_subscribers.begin(), m_subscribers.end(),
                                     [&subscription](const Subscriber& sub) {
                                       return sub.id == subscription.id();
                                     }),
                      m_subscribers.end());
}

void ZoomCoordinator::notifySubscribers(ZoomLevel level) {
  std::vector<Subscriber> subscribersCopy;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    subscribersCopy = m_subscribers;
  }

  for (const auto& subscriber : subscribersCopy) {
    // An earlier handler may have unsubscribed (and destroyed) this one
    if (!subscriber.handler || !isSubscribed(subscriber.id)) {
      continue;
    }
    try {
      subscriber.handler(level);
    } catch (const std::exception& e) {
      NOVELIST_LOG_ERROR("Zoom change subscriber #{} failed: {}", subscriber.id, e.what());
    } catch (...) {
      NOVELIST_LOG_ERROR("Zoom change subscriber #{} failed: unknown error", subscriber.id);
    }
  }
}

bool ZoomCoordinator::isSubscribed(u64 subscriberId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return std::any_of(m_subscribers.begin(), m_subscribers.end(),
                     [subscriberId](const Subscriber& sub) { return sub.id == subscriberId; });
}

} // namespace Novelist::editor
