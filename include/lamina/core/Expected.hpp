// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so the rest of the codebase
// can name the success/error pair consistently. Default error type is
// ConfigurationError since every fallible operation in the library rejects a
// geometry or layer set; callers can override it when they need something else.

#pragma once

#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

#include "lamina/core/Errors.hpp"

namespace lamina {

template <typename T, typename E = ConfigurationError>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace lamina
