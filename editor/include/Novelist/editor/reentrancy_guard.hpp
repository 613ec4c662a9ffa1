#pragma once

/**
 * @file reentrancy_guard.hpp
 * @brief RAII token that makes a code path non-reentrant
 *
 * Example usage:
 * @code
 *   ScopedReentrancyGuard guard(m_isApplying);
 *   if (!guard.acquired()) {
 *     return; // already inside this path
 *   }
 *   ...      // flag cleared on every exit, including exceptions
 * @endcode
 */

namespace Novelist::editor {

class ScopedReentrancyGuard {
public:
  explicit ScopedReentrancyGuard(bool& flag) : m_flag(flag), m_acquired(!flag) {
    if (m_acquired) {
      m_flag = true;
    }
  }

  ~ScopedReentrancyGuard() {
    if (m_acquired) {
      m_flag = false;
    }
  }

  ScopedReentrancyGuard(const ScopedReentrancyGuard&) = delete;
  ScopedReentrancyGuard& operator=(const ScopedReentrancyGuard&) = delete;
  ScopedReentrancyGuard(ScopedReentrancyGuard&&) = delete;
  ScopedReentrancyGuard& operator=(ScopedReentrancyGuard&&) = delete;

  [[nodiscard]] bool acquired() const { return m_acquired; }

private:
  bool& m_flag;
  bool m_acquired;
};

} // namespace Novelist::editor
