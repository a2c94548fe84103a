#pragma once

/**
 * @file common.hpp
 * @brief Common utilities and macros for the kiln core
 */

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <cpptrace/cpptrace.hpp>

#include "logger.hpp"

// ============================================================================
// Assertion Macros (Debug-only)
// ============================================================================

#ifdef DEBUG
#define KILN_ASSERT(condition, message)                                        \
  do {                                                                         \
    if (!(condition)) {                                                        \
        std::string trace = cpptrace::generate_trace().to_string();            \
        kiln::core::Logger::critical("ASSERTION FAILED: {}\nStack Trace:\n{}", \
            message, trace);                                                   \
      throw cpptrace::runtime_error(                                           \
          "ASSERTION FAILED: " + std::string(message) +                        \
          "\nFile: " __FILE__ "\nLine: " + std::to_string(__LINE__));          \
    }                                                                          \
  } while (0)
#else
#define KILN_ASSERT(condition, message) (void)(0)
#endif

// ============================================================================
// Utilities
// ============================================================================

namespace kiln::util {

/**
 * @brief RAII scope guard for cleanup operations
 * @example
 *   auto guard = makeScopeGuard([&] { device.freeCommandBuffers(pool, cmd); });
 */
template <typename Func> class ScopeGuard {
public:
  explicit ScopeGuard(Func &&f) : m_func(std::move(f)) {}

  ScopeGuard(const ScopeGuard &) = delete;
  ScopeGuard &operator=(const ScopeGuard &) = delete;

  ~ScopeGuard() { m_func(); }

private:
  Func m_func;
};

template <typename Func> [[nodiscard]] auto makeScopeGuard(Func &&func) {
  return ScopeGuard<Func>(std::forward<Func>(func));
}

// ============================================================================
// Cast Helper Functions (to reduce static_cast noise)
// ============================================================================

template <typename T>
constexpr uint32_t u32(T value) noexcept {
  return static_cast<uint32_t>(value);
}

template <typename T>
constexpr uint64_t u64(T value) noexcept {
  if constexpr (std::is_pointer_v<T>) {
    return reinterpret_cast<uint64_t>(value);
  } else {
    return static_cast<uint64_t>(value);
  }
}

template <typename T>
constexpr size_t sz(T value) noexcept {
  return static_cast<size_t>(value);
}

template <typename T>
constexpr float toFloat(T value) noexcept {
  return static_cast<float>(value);
}

template <typename Enum>
constexpr auto underlying(Enum e) noexcept -> std::underlying_type_t<Enum> {
  return static_cast<std::underlying_type_t<Enum>>(e);
}

/**
 * @brief Narrowing conversion that refuses to truncate.
 * Handles (node, mesh, primitive ids) are 32-bit; a document index that does
 * not fit yields nullopt so the caller can report a handle overflow.
 */
template <typename T>
  requires std::is_integral_v<T>
constexpr std::optional<uint32_t> checkedU32(T value) noexcept {
  if constexpr (std::is_signed_v<T>) {
    if (value < 0) {
      return std::nullopt;
    }
  }
  if (static_cast<std::make_unsigned_t<T>>(value) >
      std::numeric_limits<uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

} // namespace kiln::util
