#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "memc/errors.hpp"
#include "memc/transport.hpp"

// Formatting and parsing for the memcached text protocol. Reply lines are passed without
// their trailing "\r\n".
namespace memc::impl::protocol
{
    constexpr std::string_view CRLF = "\r\n";

    // The header line that precedes a value in a get reply.
    struct ValueHeader
    {
        std::string key;
        uint32_t flags;
        std::size_t length;

        bool operator==(ValueHeader const& other) const = default;
    };

    // Returns the full set command, including the data block.
    std::string formatSet(Item const& item);

    std::string formatGet(std::string_view key);

    // Parses the reply to a set command.
    tl::expected<void, Error> parseStoreReply(std::string_view line);

    // Parses a line of a get reply. Returns the value header, or std::nullopt for "END".
    // A header announcing more than maxLength bytes is rejected.
    tl::expected<std::optional<ValueHeader>, Error> parseValueLine(std::string_view line,
                                                                   std::size_t maxLength);

    // Returns true if the line is a complete failure reply (NOT_STORED, ERROR, CLIENT_ERROR
    // or SERVER_ERROR). Nothing follows such a reply, so the connection can be reused. After
    // any other rejected line the rest of the response is unknown.
    bool isFailureReply(std::string_view line);
}  // namespace memc::impl::protocol
