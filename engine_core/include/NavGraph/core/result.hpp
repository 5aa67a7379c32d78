#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used by every fallible operation
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace NavGraph {

template <typename T, typename E = std::string> class Result {
public:
  static Result ok(T value) { return Result(std::move(value), OkTag{}); }
  static Result error(E err) { return Result(std::move(err), ErrorTag{}); }

  [[nodiscard]] bool isOk() const { return m_value.has_value(); }
  [[nodiscard]] bool isError() const { return m_error.has_value(); }

  [[nodiscard]] T& value() & {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error result");
    }
    return *m_value;
  }

  [[nodiscard]] const T& value() const& {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error result");
    }
    return *m_value;
  }

  [[nodiscard]] T&& value() && {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error result");
    }
    return std::move(*m_value);
  }

  [[nodiscard]] const E& error() const {
    if (!m_error) {
      throw std::logic_error("Result::error() called on ok result");
    }
    return *m_error;
  }

  [[nodiscard]] T valueOr(T fallback) const& { return m_value ? *m_value : std::move(fallback); }

private:
  struct OkTag {};
  struct ErrorTag {};

  Result(T value, OkTag) : m_value(std::move(value)) {}
  Result(E err, ErrorTag) : m_error(std::move(err)) {}

  std::optional<T> m_value;
  std::optional<E> m_error;
};

template <typename E> class Result<void, E> {
public:
  static Result ok() { return Result(); }
  static Result error(E err) { return Result(std::move(err)); }

  [[nodiscard]] bool isOk() const { return !m_error.has_value(); }
  [[nodiscard]] bool isError() const { return m_error.has_value(); }

  [[nodiscard]] const E& error() const {
    if (!m_error) {
      throw std::logic_error("Result::error() called on ok result");
    }
    return *m_error;
  }

private:
  Result() = default;
  explicit Result(E err) : m_error(std::move(err)) {}

  std::optional<E> m_error;
};

} // namespace NavGraph
