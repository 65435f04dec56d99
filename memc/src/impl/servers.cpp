#include <algorithm>
#include <cctype>

#include "servers.hpp"

#include <fmt/format.h>

#include "crc32.hpp"

namespace memc::impl
{
    namespace
    {
        tl::unexpected<Error> invalidAddress(std::string_view address, std::string_view reason)
        {
            return tl::unexpected<Error>(errors::TransportFailure {
                .message = fmt::format("invalid server address '{}': {}", address, reason)});
        }

        bool isPort(std::string_view port)
        {
            if (port.empty() || port.size() > 5)
            {
                return false;
            }
            if (!std::all_of(port.begin(),
                             port.end(),
                             [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
            {
                return false;
            }
            auto value = std::stoul(std::string(port));
            return value > 0 && value <= 65535;
        }
    }  // namespace

    tl::expected<Address, Error> parseAddress(std::string_view address)
    {
        std::string_view host;
        std::string_view port;

        if (address.starts_with('['))
        {
            auto close = address.find(']');
            if (close == std::string_view::npos)
            {
                return invalidAddress(address, "missing ']'");
            }
            if (close + 1 >= address.size() || address[close + 1] != ':')
            {
                return invalidAddress(address, "missing port");
            }
            host = address.substr(1, close - 1);
            port = address.substr(close + 2);
        }
        else
        {
            auto colon = address.rfind(':');
            if (colon == std::string_view::npos)
            {
                return invalidAddress(address, "missing port");
            }
            host = address.substr(0, colon);
            port = address.substr(colon + 1);
            if (host.find(':') != std::string_view::npos)
            {
                return invalidAddress(address, "IPv6 hosts must be enclosed in brackets");
            }
        }

        if (host.empty())
        {
            return invalidAddress(address, "missing host");
        }
        if (!isPort(port))
        {
            return invalidAddress(address, "port must be a number between 1 and 65535");
        }
        return Address {.host = std::string(host), .port = std::string(port)};
    }

    ServerList::ServerList(std::vector<Address> addresses)
        : addresses_(std::move(addresses))
    {
    }

    tl::expected<ServerList, Error> ServerList::create(std::vector<std::string> const& servers)
    {
        std::vector<Address> addresses;
        addresses.reserve(servers.size());
        for (auto const& server : servers)
        {
            auto address = parseAddress(server);
            if (!address)
            {
                return tl::make_unexpected(address.error());
            }
            addresses.push_back(std::move(*address));
        }
        return ServerList(std::move(addresses));
    }

    tl::expected<std::size_t, Error> ServerList::pick(std::string_view key) const
    {
        if (addresses_.empty())
        {
            return tl::make_unexpected(errors::TransportFailure {.message = "no servers configured"});
        }
        if (addresses_.size() == 1)
        {
            return 0;
        }
        return crc32(key) % addresses_.size();
    }
}  // namespace memc::impl
