// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so every public operation
// reports success or a std::error_code the same way. Errors raised by printlink
// itself live in the `printlink` category (see Error.hpp); platform errors that
// have no printlink equivalent pass through unchanged.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

#include "printlink/core/Error.hpp"

namespace printlink {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

[[nodiscard]] inline unexpected_t<std::error_code> unexpected(core::Errc code) {
    return unexpected_t<std::error_code>(core::make_error_code(code));
}

} // namespace printlink
