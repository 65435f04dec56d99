#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "memc/codec.hpp"
#include "memc/errors.hpp"
#include "memc/key.hpp"
#include "memc/transport.hpp"

namespace memc
{
    /// ClientConfig holds the settings applied once when the client is created.
    struct ClientConfig
    {
        std::vector<std::string> servers;  ///< Server addresses in "host:port" format.
        std::chrono::nanoseconds dialTimeout {
            0};  ///< The connection timeout. Zero uses DEFAULT_DIAL_TIMEOUT.
        std::chrono::nanoseconds defaultTTL {
            0};  ///< The expiration used when a store has no override. Zero never expires.
        std::size_t maxIdleConnections =
            DEFAULT_MAX_IDLE_CONNECTIONS;  ///< The idle connections kept per server.
        std::size_t maxValueLength =
            DEFAULT_MAX_VALUE_LENGTH;  ///< The largest value accepted from a server.
    };

    /// Per-call options for Client::store.
    struct StoreOptions
    {
        std::optional<std::chrono::nanoseconds>
            ttl;  ///< Replaces the client's default ttl for this call only.
    };

    /// Client stores and retrieves typed values in a memcached-compatible cache.
    ///
    /// Each call validates the key, converts the value with memc::codec and makes a single
    /// attempt against the transport. Nothing is sent when validation or encoding fails.
    /// The configuration is read-only after construction, so all functions are thread-safe
    /// as long as the transport is.
    class Client
    {
      public:
        /// Creates a client backed by the TCP transport.
        /// @param config The configuration for the client.
        /// @return The client or a TransportFailure if a server address cannot be parsed.
        static tl::expected<Client, Error> create(ClientConfig config);

        /// Creates a client backed by the given transport.
        /// @param config The configuration for the client. The server list is informational.
        /// @param transport The transport to dispatch commands to.
        Client(ClientConfig config, std::shared_ptr<Transport> transport);
        ~Client();

        Client(Client const&) = delete;
        Client& operator=(Client const&) = delete;
        Client(Client&&) = default;
        /// Closes the current transport before taking over the other client's.
        Client& operator=(Client&& other);

        /// Stores a value under a key.
        /// @param key The key to store the value under.
        /// @param value The value to store.
        /// @param options Per-call options.
        /// @return Success, KeyNotValid, EncodingFailure, ExpirationNotValid or
        /// TransportFailure.
        template<codec::Encodable T>
        tl::expected<void, Error> store(std::string_view key,
                                        T const& value,
                                        StoreOptions const& options = {}) const
        {
            if (auto valid = checkKey(key); !valid)
            {
                return tl::make_unexpected(valid.error());
            }

            auto encoded = codec::encode(value);
            if (!encoded)
            {
                return tl::make_unexpected(encoded.error());
            }

            return dispatchStore(key, std::move(*encoded), options);
        }

        /// Stores a C string under a key. A null pointer is an EncodingFailure.
        tl::expected<void, Error> store(std::string_view key,
                                        char const* value,
                                        StoreOptions const& options = {}) const
        {
            return store<char const*>(key, value, options);
        }

        /// Retrieves the value stored under a key.
        /// @param key The key to look up.
        /// @return The decoded value, or KeyNotValid, CacheMiss, DecodingFailure or
        /// TransportFailure.
        template<codec::Decodable T>
        tl::expected<T, Error> retrieve(std::string_view key) const
        {
            return dispatchRetrieve(key).and_then([](codec::Bytes const& bytes)
                                                  { return codec::decode<T>(bytes); });
        }

        /// Releases the transport's connections. Later calls fail with a TransportFailure.
        void close();

        /// Returns the configuration the client was created with.
        [[nodiscard]] ClientConfig const& config() const { return config_; }

      private:
        tl::expected<void, Error> dispatchStore(std::string_view key,
                                                codec::Bytes value,
                                                StoreOptions const& options) const;
        tl::expected<codec::Bytes, Error> dispatchRetrieve(std::string_view key) const;

        ClientConfig config_;
        std::shared_ptr<Transport> transport_;
    };

    /// Stores a value under a key. See Client::store.
    template<typename T>
    tl::expected<void, Error> store(Client const& client,
                                    std::string_view key,
                                    T const& value,
                                    StoreOptions const& options = {})
    {
        return client.store(key, value, options);
    }

    /// Retrieves the value stored under a key. See Client::retrieve.
    template<codec::Decodable T>
    tl::expected<T, Error> retrieve(Client const& client, std::string_view key)
    {
        return client.template retrieve<T>(key);
    }
}  // namespace memc
