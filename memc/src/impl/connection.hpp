#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <tl/expected.hpp>

#include "memc/errors.hpp"
#include "servers.hpp"

namespace memc::impl
{
    // Connection is a blocking TCP connection to a single cache server. Only connection
    // establishment is bounded by a timeout. A connection is used by one thread at a time.
    class Connection
    {
        // Restricts construction to open().
        struct Token
        {
            explicit Token() = default;
        };

      public:
        static tl::expected<std::unique_ptr<Connection>, Error> open(
            Address const& address, std::chrono::nanoseconds timeout);

        Connection(Token, std::string address);

        Connection(Connection const&) = delete;
        Connection& operator=(Connection const&) = delete;

        tl::expected<void, Error> write(std::string const& data);

        // Reads one line and strips the trailing "\r\n".
        tl::expected<std::string, Error> readLine();

        // Reads a data block of the given length followed by "\r\n".
        tl::expected<std::vector<std::byte>, Error> readBlock(std::size_t length);

        [[nodiscard]] std::string const& address() const { return address_; }

      private:
        std::string address_;
        asio::io_context io_;
        asio::ip::tcp::socket socket_;
        asio::streambuf buffer_;
    };
}  // namespace memc::impl
