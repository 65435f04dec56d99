#pragma once

#include <chrono>
#include <cstdint>

#include <tl/expected.hpp>

#include "memc/errors.hpp"

namespace memc
{
    /// Expiration values above this are read by memcached as absolute unix timestamps
    /// rather than relative seconds.
    constexpr std::chrono::seconds MAX_RELATIVE_EXPIRATION = std::chrono::hours(24 * 30);

    /// Converts a time-to-live into the protocol's expiration in seconds. Zero means the
    /// item never expires.
    ///
    /// The result is always relative seconds. A ttl above MAX_RELATIVE_EXPIRATION is not
    /// converted to an absolute timestamp, so the server will read it as a time in 1970
    /// and expire the item immediately.
    ///
    /// @param ttl The time-to-live. Must be a non-negative whole number of seconds.
    /// @return The number of seconds or an ExpirationNotValid error.
    tl::expected<int32_t, Error> toSeconds(std::chrono::nanoseconds ttl);
}  // namespace memc
