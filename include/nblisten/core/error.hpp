#pragma once

/**
 * @file
 * @brief Error value carried by every fallible nblisten operation.
 */

#include <cerrno>
#include <iosfwd>
#include <string>
#include <system_error>

namespace nblisten {

/**
 * @brief Error value used across `result<T>`.
 *
 * Wraps a `std::error_code` in the system category so the raw OS code stays
 * available through `value()`.
 */
class error {
public:
    /// Construct a success-like empty error (`value() == 0`).
    error() noexcept = default;
    /// Construct from an explicit error code.
    explicit error(std::error_code code) noexcept;

    /**
     * @brief Build an error from errno.
     * @param value errno value. Defaults to current `errno`.
     */
    [[nodiscard]] static error from_errno(int value = errno) noexcept;

    /// @return Underlying `std::error_code`.
    [[nodiscard]] std::error_code code() const noexcept;
    /// @return Raw OS error value.
    [[nodiscard]] int value() const noexcept;
    /// @return Human-readable message for the code.
    [[nodiscard]] std::string message() const;
    /// @return `true` when the raw OS value equals `os_value`.
    [[nodiscard]] bool is(int os_value) const noexcept;

    friend bool operator==(const error&, const error&) noexcept = default;

private:
    std::error_code code_;
};

/// @brief Wrap an errno value into `error`.
[[nodiscard]] error make_error_from_errno(int value) noexcept;

/// Write `message()` followed by the raw value, e.g. `Bad file descriptor (9)`.
std::ostream& operator<<(std::ostream& out, const error& value);

} // namespace nblisten
