#pragma once

#include <chrono>
#include <memory>

#include "memc/transport.hpp"

namespace memc::inmemory
{
    /// @brief Server is an in-process cache that implements the Transport interface.
    ///
    /// Items expire against an internal clock that starts at the current system time and
    /// only moves when advance() is called, which keeps expiration tests deterministic.
    /// Expirations follow memcached: values up to 30 days are relative seconds, larger values
    /// are absolute unix timestamps. Closing the server clears it.
    class Server : public Transport
    {
      public:
        ~Server() override = default;

        /// Moves the internal clock forward.
        /// @param duration How far to move the clock.
        virtual void advance(std::chrono::seconds duration) = 0;

        /// Simulates an outage. While unavailable, every command fails with a
        /// TransportFailure.
        /// @param available Whether the server accepts commands.
        virtual void setAvailable(bool available) = 0;

        /// Returns the number of stored items that have not expired.
        [[nodiscard]] virtual std::size_t size() const = 0;
    };

    /// Creates a new in-memory server.
    /// @return A shared pointer to the server.
    std::shared_ptr<Server> createServer();
}  // namespace memc::inmemory
