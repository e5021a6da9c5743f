#pragma once

/**
 * @file
 * @brief Result alias and helper constructors based on `std::expected`.
 */

#include "nblisten/core/error.hpp"

#include <expected>
#include <type_traits>
#include <utility>

namespace nblisten {

/**
 * @brief Operation result type used by the library.
 * @tparam T Success value type.
 */
template <class T>
using result = std::expected<T, error>;

/**
 * @brief Construct a successful `result<T>`.
 * @param value Value to store in the success state.
 */
template <class T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value) {
    return result<std::decay_t<T>>{std::forward<T>(value)};
}

/// @brief Construct a successful `result<void>`.
[[nodiscard]] constexpr result<void> ok() {
    return result<void>{};
}

/**
 * @brief Construct an error result.
 * @param e Error value.
 */
template <class T>
[[nodiscard]] constexpr result<T> err(error e) {
    return std::unexpected<error>{e};
}

} // namespace nblisten
