#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "memc/errors.hpp"

namespace memc::impl
{
    struct Address
    {
        std::string host;
        std::string port;

        bool operator==(Address const& other) const = default;
    };

    // Splits "host:port" or "[v6-host]:port" into its parts.
    tl::expected<Address, Error> parseAddress(std::string_view address);

    // ServerList maps keys onto a fixed set of servers.
    class ServerList
    {
      public:
        static tl::expected<ServerList, Error> create(std::vector<std::string> const& servers);

        // Returns the index of the server responsible for a key, or an error if the list is
        // empty.
        [[nodiscard]] tl::expected<std::size_t, Error> pick(std::string_view key) const;

        [[nodiscard]] Address const& at(std::size_t index) const { return addresses_.at(index); }
        [[nodiscard]] std::size_t size() const { return addresses_.size(); }

      private:
        explicit ServerList(std::vector<Address> addresses);

        std::vector<Address> addresses_;
    };
}  // namespace memc::impl
