// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so the device, protocol and
// orchestration layers name the success/error pair the same way. The default
// error type is std::error_code: std::errc values for protocol misuse and
// system_category codes carried over from errno for sysfs / hidraw failures.

#pragma once

#include <cerrno>
#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace awlights {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

/// Error result for a generic condition, e.g. `return fail(std::errc::not_connected);`.
[[nodiscard]] inline unexpected_t<std::error_code> fail(std::errc condition) {
    return unexpected_t<std::error_code>(std::make_error_code(condition));
}

/// Wrap the current errno as a system_category error code.
[[nodiscard]] inline std::error_code lastSystemError() {
    return std::error_code(errno, std::system_category());
}

} // namespace awlights
