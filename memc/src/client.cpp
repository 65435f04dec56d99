#include "memc/client.hpp"

#include <spdlog/spdlog.h>

#include "memc/expiration.hpp"
#include "memc/fmt/errors.hpp"

namespace memc
{
    namespace
    {
        // Anything the transport reports other than a miss is surfaced as a transport failure.
        Error toTransportFailure(Error error)
        {
            if (std::holds_alternative<errors::TransportFailure>(error))
            {
                return error;
            }
            return errors::TransportFailure {.message = fmt::format("{}", error)};
        }
    }  // namespace

    tl::expected<Client, Error> Client::create(ClientConfig config)
    {
        auto transportConfig = TransportConfig {
            .servers = config.servers,
            .dialTimeout = config.dialTimeout == std::chrono::nanoseconds::zero()
                ? std::chrono::nanoseconds(DEFAULT_DIAL_TIMEOUT)
                : config.dialTimeout,
            .maxIdleConnections = config.maxIdleConnections,
            .maxValueLength = config.maxValueLength,
        };

        auto transport = createTransport(transportConfig);
        if (!transport)
        {
            return tl::make_unexpected(transport.error());
        }
        return Client(std::move(config), std::move(*transport));
    }

    Client::Client(ClientConfig config, std::shared_ptr<Transport> transport)
        : config_(std::move(config))
        , transport_(std::move(transport))
    {
    }

    Client::~Client()
    {
        close();
    }

    Client& Client::operator=(Client&& other)
    {
        if (this != &other)
        {
            close();
            config_ = std::move(other.config_);
            transport_ = std::move(other.transport_);
        }
        return *this;
    }

    void Client::close()
    {
        if (transport_)
        {
            transport_->close();
        }
    }

    tl::expected<void, Error> Client::dispatchStore(std::string_view key,
                                                    codec::Bytes value,
                                                    StoreOptions const& options) const
    {
        auto expiration = toSeconds(options.ttl.value_or(config_.defaultTTL));
        if (!expiration)
        {
            return tl::make_unexpected(expiration.error());
        }

        if (!transport_)
        {
            return tl::make_unexpected(errors::TransportFailure {.message = "no transport"});
        }

        spdlog::trace("store {} ({} bytes, expiration {}s)", key, value.size(), *expiration);
        auto item = Item {
            .key = std::string(key),
            .value = std::move(value),
            .flags = 0,
            .expiration = *expiration,
        };
        return transport_->store(item).map_error(toTransportFailure);
    }

    tl::expected<codec::Bytes, Error> Client::dispatchRetrieve(std::string_view key) const
    {
        if (auto valid = checkKey(key); !valid)
        {
            return tl::make_unexpected(valid.error());
        }

        if (!transport_)
        {
            return tl::make_unexpected(errors::TransportFailure {.message = "no transport"});
        }

        spdlog::trace("retrieve {}", key);
        auto item = transport_->retrieve(std::string(key));
        if (!item)
        {
            return tl::make_unexpected(toTransportFailure(std::move(item.error())));
        }
        if (!item->has_value())
        {
            return tl::make_unexpected(errors::CacheMiss {});
        }
        return std::move((*item)->value);
    }
}  // namespace memc
