#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "memc/errors.hpp"

namespace memc
{
    /// The default time allowed for establishing a connection.
    constexpr std::chrono::milliseconds DEFAULT_DIAL_TIMEOUT = std::chrono::milliseconds(500);
    /// The default number of idle connections kept per server.
    constexpr std::size_t DEFAULT_MAX_IDLE_CONNECTIONS = 2;
    /// The default largest value accepted from a server, memcached's default item size limit.
    constexpr std::size_t DEFAULT_MAX_VALUE_LENGTH = 1024 * 1024;

    /// Item is a single cache entry as the server sees it.
    struct Item
    {
        std::string key;  ///< The key of the entry.
        std::vector<std::byte> value;  ///< The opaque payload.
        uint32_t flags = 0;  ///< Opaque per-item metadata, not interpreted by the client.
        int32_t expiration = 0;  ///< Expiration in seconds, 0 for none.

        bool operator==(Item const& other) const = default;
    };

    /// Transport exchanges store and retrieve commands with one or more cache servers.
    ///
    /// All functions are thread-safe and block until the server responds or fails.
    class Transport
    {
      public:
        virtual ~Transport() = default;

        /// Stores an item, replacing any existing value for its key.
        /// @param item The item to store.
        /// @return Success or a TransportFailure.
        virtual tl::expected<void, Error> store(Item const& item) = 0;

        /// Retrieves the item for a key.
        /// @param key The key to look up.
        /// @return The item, std::nullopt if the key is absent, or a TransportFailure.
        virtual tl::expected<std::optional<Item>, Error> retrieve(std::string const& key) = 0;

        /// Releases all connections. Later calls fail with a TransportFailure. Calling close
        /// more than once has no further effect.
        virtual void close() = 0;
    };

    /// Configuration for the TCP transport.
    struct TransportConfig
    {
        std::vector<std::string> servers;  ///< Server addresses in "host:port" format.
        std::chrono::nanoseconds dialTimeout =
            DEFAULT_DIAL_TIMEOUT;  ///< The time allowed for establishing a connection.
        std::size_t maxIdleConnections =
            DEFAULT_MAX_IDLE_CONNECTIONS;  ///< The idle connections kept per server.
        std::size_t maxValueLength =
            DEFAULT_MAX_VALUE_LENGTH;  ///< Larger values in a reply are a TransportFailure.
    };

    /// Creates a transport that speaks the memcached text protocol over TCP.
    /// Connections are opened lazily and pooled per server. Keys are spread across servers
    /// by the CRC-32 of the key.
    /// @param config The configuration for the transport.
    /// @return A shared pointer to the transport or a TransportFailure if an address cannot
    /// be parsed.
    tl::expected<std::shared_ptr<Transport>, Error> createTransport(TransportConfig const& config);
}  // namespace memc
