#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used across Novelist
 *
 * Errors carry a human readable message. Use Result<void> for operations
 * that only report success or failure.
 */

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace Novelist {

template <typename T> class Result {
public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

  static Result error(std::string message) {
    return Result(std::in_place_index<1>, std::move(message));
  }

  [[nodiscard]] bool isOk() const { return m_data.index() == 0; }
  [[nodiscard]] bool isError() const { return m_data.index() == 1; }

  [[nodiscard]] const T& value() const& {
    if (isError()) {
      throw std::logic_error("Result::value() called on error: " + std::get<1>(m_data));
    }
    return std::get<0>(m_data);
  }

  [[nodiscard]] T&& value() && {
    if (isError()) {
      throw std::logic_error("Result::value() called on error: " + std::get<1>(m_data));
    }
    return std::get<0>(std::move(m_data));
  }

  [[nodiscard]] T valueOr(T fallback) const {
    return isOk() ? std::get<0>(m_data) : std::move(fallback);
  }

  [[nodiscard]] const std::string& error() const {
    if (isOk()) {
      throw std::logic_error("Result::error() called on success");
    }
    return std::get<1>(m_data);
  }

private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& payload) : m_data(tag, std::forward<U>(payload)) {}

  std::variant<T, std::string> m_data;
};

template <> class Result<void> {
public:
  static Result ok() { return Result(true, {}); }
  static Result error(std::string message) { return Result(false, std::move(message)); }

  [[nodiscard]] bool isOk() const { return m_ok; }
  [[nodiscard]] bool isError() const { return !m_ok; }

  [[nodiscard]] const std::string& error() const {
    if (m_ok) {
      throw std::logic_error("Result::error() called on success");
    }
    return m_error;
  }

private:
  Result(bool ok, std::string message) : m_ok(ok), m_error(std::move(message)) {}

  bool m_ok;
  std::string m_error;
};

} // namespace Novelist
