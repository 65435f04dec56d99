#include <mutex>
#include <unordered_map>

#include "memc/transport.hpp"

#include <spdlog/spdlog.h>

#include "impl/connection.hpp"
#include "impl/protocol.hpp"
#include "impl/servers.hpp"
#include "memc/fmt/errors.hpp"

namespace memc
{
    using impl::Connection;
    using impl::ServerList;

    namespace
    {
        // The outcome of a command on a borrowed connection. A connection that saw an I/O
        // error or a reply it could not parse is in an unknown state and must not be reused.
        template<typename T>
        struct Outcome
        {
            tl::expected<T, Error> result;
            bool reusable;
        };

        class TcpTransport final : public Transport
        {
          public:
            TcpTransport(ServerList servers, TransportConfig const& config)
                : servers_(std::move(servers))
                , dialTimeout_(config.dialTimeout)
                , maxIdleConnections_(config.maxIdleConnections)
                , maxValueLength_(config.maxValueLength)
                , idle_(servers_.size())
            {
            }

            ~TcpTransport() override { close(); }

            tl::expected<void, Error> store(Item const& item) override
            {
                auto command = impl::protocol::formatSet(item);
                return withConnection<void>(
                    item.key,
                    [&command](Connection& connection) -> Outcome<void>
                    {
                        if (auto written = connection.write(command); !written)
                        {
                            return {.result = tl::make_unexpected(written.error()), .reusable = false};
                        }

                        auto line = connection.readLine();
                        if (!line)
                        {
                            return {.result = tl::make_unexpected(line.error()), .reusable = false};
                        }

                        auto reply = impl::protocol::parseStoreReply(*line);
                        if (!reply)
                        {
                            spdlog::warn("set rejected by {}: {}", connection.address(), reply.error());
                            return {.result = reply,
                                    .reusable = impl::protocol::isFailureReply(*line)};
                        }
                        return {.result = reply, .reusable = true};
                    });
            }

            tl::expected<std::optional<Item>, Error> retrieve(std::string const& key) override
            {
                auto command = impl::protocol::formatGet(key);
                return withConnection<std::optional<Item>>(
                    key,
                    [this, &command, &key](Connection& connection) -> Outcome<std::optional<Item>>
                    {
                        if (auto written = connection.write(command); !written)
                        {
                            return {.result = tl::make_unexpected(written.error()), .reusable = false};
                        }

                        std::optional<Item> found;
                        while (true)
                        {
                            auto line = connection.readLine();
                            if (!line)
                            {
                                return {.result = tl::make_unexpected(line.error()),
                                        .reusable = false};
                            }

                            auto header = impl::protocol::parseValueLine(*line, maxValueLength_);
                            if (!header)
                            {
                                spdlog::warn("get rejected by {}: {}", connection.address(), header.error());
                                return {.result = tl::make_unexpected(header.error()),
                                        .reusable = impl::protocol::isFailureReply(*line)};
                            }
                            if (!header->has_value())
                            {
                                break;
                            }

                            auto block = connection.readBlock((*header)->length);
                            if (!block)
                            {
                                return {.result = tl::make_unexpected(block.error()),
                                        .reusable = false};
                            }
                            if ((*header)->key == key)
                            {
                                found = Item {.key = key,
                                              .value = std::move(*block),
                                              .flags = (*header)->flags,
                                              .expiration = 0};
                            }
                        }
                        return {.result = std::move(found), .reusable = true};
                    });
            }

            void close() override
            {
                std::lock_guard lock {mutex_};
                if (closed_)
                {
                    return;
                }
                closed_ = true;
                for (auto& connections : idle_)
                {
                    connections.clear();
                }
            }

          private:
            // Runs a command on a pooled connection to the server responsible for the key.
            template<typename T, typename F>
            tl::expected<T, Error> withConnection(std::string const& key, F&& command)
            {
                auto index = servers_.pick(key);
                if (!index)
                {
                    return tl::make_unexpected(index.error());
                }

                auto connection = acquire(*index);
                if (!connection)
                {
                    spdlog::error("{}", connection.error());
                    return tl::make_unexpected(connection.error());
                }

                Outcome<T> outcome = command(**connection);
                if (outcome.reusable)
                {
                    release(*index, std::move(*connection));
                }
                else
                {
                    spdlog::error("{}", outcome.result.error());
                    spdlog::debug("discarding connection to {}", (*connection)->address());
                }
                return std::move(outcome.result);
            }

            tl::expected<std::unique_ptr<Connection>, Error> acquire(std::size_t index)
            {
                {
                    std::lock_guard lock {mutex_};
                    if (closed_)
                    {
                        return tl::make_unexpected(
                            errors::TransportFailure {.message = "transport closed"});
                    }
                    auto& connections = idle_[index];
                    if (!connections.empty())
                    {
                        auto connection = std::move(connections.back());
                        connections.pop_back();
                        return connection;
                    }
                }
                return Connection::open(servers_.at(index), dialTimeout_);
            }

            void release(std::size_t index, std::unique_ptr<Connection> connection)
            {
                std::lock_guard lock {mutex_};
                if (closed_ || idle_[index].size() >= maxIdleConnections_)
                {
                    return;
                }
                idle_[index].push_back(std::move(connection));
            }

            ServerList servers_;
            std::chrono::nanoseconds dialTimeout_;
            std::size_t maxIdleConnections_;
            std::size_t maxValueLength_;

            std::mutex mutex_;
            bool closed_ = false;
            std::vector<std::vector<std::unique_ptr<Connection>>> idle_;
        };
    }  // namespace

    tl::expected<std::shared_ptr<Transport>, Error> createTransport(TransportConfig const& config)
    {
        auto servers = ServerList::create(config.servers);
        if (!servers)
        {
            return tl::make_unexpected(servers.error());
        }
        return std::make_shared<TcpTransport>(std::move(*servers), config);
    }
}  // namespace memc
