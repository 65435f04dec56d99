#include <algorithm>
#include <iterator>

#include "connection.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace memc::impl
{
    namespace
    {
        tl::unexpected<Error> ioFailure(std::string const& address,
                                        std::string_view operation,
                                        asio::error_code const& ec)
        {
            return tl::unexpected<Error>(errors::TransportFailure {
                .message = fmt::format("{} {} failed: {}", operation, address, ec.message())});
        }
    }  // namespace

    Connection::Connection(Token, std::string address)
        : address_(std::move(address))
        , socket_(io_)
    {
    }

    tl::expected<std::unique_ptr<Connection>, Error> Connection::open(
        Address const& address, std::chrono::nanoseconds timeout)
    {
        auto connection =
            std::make_unique<Connection>(Token {}, fmt::format("{}:{}", address.host, address.port));

        asio::error_code ec;
        asio::ip::tcp::resolver resolver(connection->io_);
        auto endpoints = resolver.resolve(address.host, address.port, ec);
        if (ec)
        {
            return ioFailure(connection->address_, "resolve", ec);
        }

        asio::error_code connectError = asio::error::would_block;
        asio::async_connect(connection->socket_,
                            endpoints,
                            [&connectError](asio::error_code const& result,
                                            asio::ip::tcp::endpoint const&)
                            { connectError = result; });

        // Run until the connect completes or the timeout expires. On expiry, closing the
        // socket cancels the pending connect and the handler runs with operation_aborted.
        connection->io_.restart();
        connection->io_.run_for(timeout);
        if (!connection->io_.stopped())
        {
            connection->socket_.close(ec);
            connection->io_.run();
            connectError = asio::error::timed_out;
        }

        if (connectError)
        {
            return ioFailure(connection->address_, "connect to", connectError);
        }

        connection->socket_.set_option(asio::ip::tcp::no_delay(true), ec);
        spdlog::debug("connected to {}", connection->address_);
        return connection;
    }

    tl::expected<void, Error> Connection::write(std::string const& data)
    {
        asio::error_code ec;
        asio::write(socket_, asio::buffer(data), ec);
        if (ec)
        {
            return ioFailure(address_, "write to", ec);
        }
        return {};
    }

    tl::expected<std::string, Error> Connection::readLine()
    {
        asio::error_code ec;
        auto length = asio::read_until(socket_, buffer_, "\r\n", ec);
        if (ec)
        {
            return ioFailure(address_, "read from", ec);
        }

        auto begin = asio::buffers_begin(buffer_.data());
        std::string line(begin, begin + static_cast<std::ptrdiff_t>(length - 2));
        buffer_.consume(length);
        return line;
    }

    tl::expected<std::vector<std::byte>, Error> Connection::readBlock(std::size_t length)
    {
        auto const total = length + 2;
        if (buffer_.size() < total)
        {
            asio::error_code ec;
            asio::read(socket_, buffer_, asio::transfer_exactly(total - buffer_.size()), ec);
            if (ec)
            {
                return ioFailure(address_, "read from", ec);
            }
        }

        auto begin = asio::buffers_begin(buffer_.data());
        std::vector<std::byte> block(length);
        std::transform(begin,
                       begin + static_cast<std::ptrdiff_t>(length),
                       block.begin(),
                       [](char c) { return static_cast<std::byte>(c); });

        auto terminator = std::string(begin + static_cast<std::ptrdiff_t>(length),
                                      begin + static_cast<std::ptrdiff_t>(total));
        buffer_.consume(total);
        if (terminator != "\r\n")
        {
            return tl::make_unexpected(errors::TransportFailure {
                .message = fmt::format("data block from {} is not terminated by CRLF", address_)});
        }
        return block;
    }
}  // namespace memc::impl
