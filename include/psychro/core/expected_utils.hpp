#pragma once

#include "psychro/core/exceptions.hpp"
#include <expected>
#include <format>
#include <string>
#include <vector>

namespace psychro::core {

/**
 * @brief Utilities for working with std::expected to reduce boilerplate
 */
namespace expected_utils {

/**
 * @brief Assign-or-return helper
 *
 * Usage:
 *   PSYCHRO_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto __tmp = some_expected_result;
 *   if (!__tmp) return std::unexpected(__tmp.error());
 *   value = std::move(__tmp.value());
 */
#define PSYCHRO_TRY_ASSIGN(lhs, expr)                                                         \
    do {                                                                                      \
        auto psychro_try_tmp = (expr);                                                        \
        if (!psychro_try_tmp)                                                                 \
            return std::unexpected(psychro_try_tmp.error());                                  \
        lhs = std::move(psychro_try_tmp.value());                                             \
    } while (0)

/**
 * @brief PSYCHRO_TRY_VOID macro for void expected results
 *
 * Usage: PSYCHRO_TRY_VOID(some_void_expected_result);
 */
#define PSYCHRO_TRY_VOID(expr)                                                                \
    do {                                                                                      \
        auto psychro_try_tmp_void = (expr);                                                   \
        if (!psychro_try_tmp_void)                                                            \
            return std::unexpected(psychro_try_tmp_void.error());                             \
    } while (0)

/**
 * @brief Add a context entry to the error of an expected, keeping its type and kind
 *
 * @param initial Initial expected value
 * @param context Context to add to error
 * @return Same expected or error with added context
 */
template <typename T, typename E>
[[nodiscard]] auto with_context(std::expected<T, E> initial, std::string context) -> std::expected<T, E> {
  if (!initial) {
    auto error = std::move(initial.error());
    error.add_context(std::move(context));
    return std::unexpected(std::move(error));
  }
  return initial;
}

/**
 * @brief Collect multiple expected values into a vector
 *
 * @param expecteds Vector of expected values
 * @return Vector of values or first error encountered
 */
template <typename T, typename E>
[[nodiscard]] auto collect_all(std::vector<std::expected<T, E>>&& expecteds) -> std::expected<std::vector<T>, E> {
  std::vector<T> results;
  results.reserve(expecteds.size());

  for (auto& expected : expecteds) {
    if (!expected) {
      return std::unexpected(expected.error());
    }
    results.push_back(std::move(expected.value()));
  }

  return results;
}

} // namespace expected_utils

} // namespace psychro::core
