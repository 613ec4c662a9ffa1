#pragma once

/**
 * @file MockZoomSettingsStore.hpp
 * @brief In-memory IZoomSettingsStore for tests
 *
 * Records every write and can be told to fail loads or saves, either by
 * returning an error Result or by throwing.
 */

#include "Novelist/editor/interfaces/IZoomSettingsStore.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace Novelist::editor {

class MockZoomSettingsStore : public IZoomSettingsStore {
public:
  MockZoomSettingsStore() = default;
  explicit MockZoomSettingsStore(ZoomLevel savedLevel) : m_savedLevel(savedLevel) {}
  ~MockZoomSettingsStore() override = default;

  // =========================================================================
  // IZoomSettingsStore Implementation
  // =========================================================================

  [[nodiscard]] Result<ZoomLevel> loadZoomLevel() const override {
    m_loadCount++;
    if (m_failLoads) {
      return Result<ZoomLevel>::error("mock load failure");
    }
    return Result<ZoomLevel>::ok(m_savedLevel);
  }

  Result<void> saveZoomLevel(ZoomLevel level) override {
    m_saveAttempts++;
    if (m_throwOnSave) {
      throw std::runtime_error("mock store exploded");
    }
    if (m_failSaves) {
      return Result<void>::error("mock save failure");
    }
    m_savedLevel = level;
    m_writes.push_back(level);
    return Result<void>::ok();
  }

  // =========================================================================
  // Mock Control
  // =========================================================================

  void setSavedLevel(ZoomLevel level) { m_savedLevel = level; }
  void setFailLoads(bool fail) { m_failLoads = fail; }
  void setFailSaves(bool fail) { m_failSaves = fail; }
  void setThrowOnSave(bool shouldThrow) { m_throwOnSave = shouldThrow; }

  [[nodiscard]] ZoomLevel savedLevel() const { return m_savedLevel; }
  [[nodiscard]] const std::vector<ZoomLevel>& writes() const { return m_writes; }
  [[nodiscard]] int saveAttempts() const { return m_saveAttempts; }
  [[nodiscard]] int loadCount() const { return m_loadCount; }

private:
  ZoomLevel m_savedLevel = DEFAULT_ZOOM;
  bool m_failLoads = false;
  bool m_failSaves = false;
  bool m_throwOnSave = false;

  std::vector<ZoomLevel> m_writes;
  int m_saveAttempts = 0;
  mutable int m_loadCount = 0;
};

} // namespace Novelist::editor
