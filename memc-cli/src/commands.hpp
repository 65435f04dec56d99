#pragma once
#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "config/config.hpp"
#include "errors.hpp"
#include "memc/client.hpp"

namespace memc_cli
{
    // Exit codes shared by the commands.
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_ERROR = 1;
    constexpr int EXIT_MISS = 2;

    struct CommandOptions
    {
        std::string configPath;
        std::string key;
        std::string type = "string";
        bool verbose = false;
    };

    namespace detail
    {
        inline tl::expected<memc::Client, Error> connect(CommandOptions const& options)
        {
            auto config = config::loadConfig(options.configPath);
            if (!config)
            {
                return tl::unexpected(config.error());
            }

            spdlog::set_level(options.verbose ? spdlog::level::debug : config->logLevel);

            auto client = memc::Client::create(config->client);
            if (!client)
            {
                return tl::unexpected(Error {client.error()});
            }
            return std::move(*client);
        }

        inline tl::expected<int64_t, Error> parseInt64(std::string const& text)
        {
            int64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc {} || ptr != text.data() + text.size())
            {
                return tl::unexpected(
                    errors::UsageError {fmt::format("'{}' is not a 64-bit integer", text)});
            }
            return value;
        }

        inline int report(Error const& error)
        {
            if (auto const* cacheError = std::get_if<memc::Error>(&error);
                cacheError && memc::isCacheMiss(*cacheError))
            {
                std::cout << "miss\n";
                return EXIT_MISS;
            }
            std::cerr << fmt::format("{}\n", error);
            return EXIT_ERROR;
        }
    }  // namespace detail

    inline int runSet(CommandOptions const& options,
                      std::string const& value,
                      std::optional<int64_t> ttlSeconds)
    {
        auto client = detail::connect(options);
        if (!client)
        {
            return detail::report(client.error());
        }

        memc::StoreOptions storeOptions;
        if (ttlSeconds)
        {
            storeOptions.ttl = std::chrono::seconds(*ttlSeconds);
        }

        tl::expected<void, memc::Error> stored;
        if (options.type == "string")
        {
            stored = client->store(options.key, value, storeOptions);
        }
        else if (options.type == "int64")
        {
            auto number = detail::parseInt64(value);
            if (!number)
            {
                return detail::report(number.error());
            }
            stored = client->store(options.key, *number, storeOptions);
        }
        else
        {
            return detail::report(
                errors::UsageError {fmt::format("unknown value type '{}'", options.type)});
        }

        if (!stored)
        {
            return detail::report(stored.error());
        }
        spdlog::info("stored {}", options.key);
        return EXIT_OK;
    }

    inline int runGet(CommandOptions const& options)
    {
        auto client = detail::connect(options);
        if (!client)
        {
            return detail::report(client.error());
        }

        if (options.type == "string")
        {
            auto value = client->retrieve<std::string>(options.key);
            if (!value)
            {
                return detail::report(value.error());
            }
            std::cout << *value << '\n';
            return EXIT_OK;
        }
        if (options.type == "int64")
        {
            auto value = client->retrieve<int64_t>(options.key);
            if (!value)
            {
                return detail::report(value.error());
            }
            std::cout << *value << '\n';
            return EXIT_OK;
        }
        return detail::report(
            errors::UsageError {fmt::format("unknown value type '{}'", options.type)});
    }
}  // namespace memc_cli
