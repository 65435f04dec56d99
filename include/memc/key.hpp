#pragma once

#include <cstddef>
#include <string_view>

#include <tl/expected.hpp>

#include "memc/errors.hpp"

namespace memc
{
    /// The longest key the memcached protocol accepts, in bytes.
    constexpr std::size_t MAX_KEY_LENGTH = 250;

    /// Checks that a key can be sent to the cache server. A key must be between 1 and
    /// MAX_KEY_LENGTH bytes long and must not contain spaces or control characters.
    /// @param key The key to check.
    /// @return Success or a KeyNotValid error.
    tl::expected<void, Error> checkKey(std::string_view key);
}  // namespace memc
