#include <filesystem>

#include "config.hpp"

#include <toml++/toml.hpp>

namespace memc_cli::config
{
    namespace
    {
        tl::expected<memc::ClientConfig, Error> parseClient(const toml::table& config)
        {
            memc::ClientConfig client;

            auto clientTable = config["client"].as_table();
            if (!clientTable)
            {
                return tl::unexpected(errors::ConfigError {"missing [client] section in config file"});
            }

            auto serversArray = (*clientTable)["servers"].as_array();
            if (!serversArray)
            {
                return tl::unexpected(
                    errors::ConfigError {"missing or invalid servers array in [client]"});
            }
            for (auto& serverNode : *serversArray)
            {
                auto server = serverNode.as_string();
                if (!server)
                {
                    return tl::unexpected(
                        errors::ConfigError {"invalid entry in servers array - must be a string"});
                }
                client.servers.push_back(server->get());
            }
            if (client.servers.empty())
            {
                return tl::unexpected(errors::ConfigError {"no servers defined in [client]"});
            }

            // Parse dial_timeout_ms (optional, the transport default applies if not specified)
            if (auto timeoutNode = (*clientTable)["dial_timeout_ms"])
            {
                if (!timeoutNode.as_integer() || timeoutNode.as_integer()->get() < 0)
                {
                    return tl::unexpected(errors::ConfigError {
                        "invalid dial_timeout_ms in [client] - must be a non-negative integer"});
                }
                client.dialTimeout = std::chrono::milliseconds(timeoutNode.as_integer()->get());
            }

            // Parse default_ttl_s (optional, items never expire if not specified)
            if (auto ttlNode = (*clientTable)["default_ttl_s"])
            {
                if (!ttlNode.as_integer() || ttlNode.as_integer()->get() < 0)
                {
                    return tl::unexpected(errors::ConfigError {
                        "invalid default_ttl_s in [client] - must be a non-negative integer"});
                }
                client.defaultTTL = std::chrono::seconds(ttlNode.as_integer()->get());
            }

            // Parse max_idle_connections (optional, use default if not specified)
            if (auto idleNode = (*clientTable)["max_idle_connections"])
            {
                if (!idleNode.as_integer() || idleNode.as_integer()->get() < 0)
                {
                    return tl::unexpected(errors::ConfigError {
                        "invalid max_idle_connections in [client] - must be a non-negative integer"});
                }
                client.maxIdleConnections = static_cast<std::size_t>(idleNode.as_integer()->get());
            }

            // Parse max_value_bytes (optional, use default if not specified)
            if (auto valueNode = (*clientTable)["max_value_bytes"])
            {
                if (!valueNode.as_integer() || valueNode.as_integer()->get() <= 0)
                {
                    return tl::unexpected(errors::ConfigError {
                        "invalid max_value_bytes in [client] - must be a positive integer"});
                }
                client.maxValueLength = static_cast<std::size_t>(valueNode.as_integer()->get());
            }

            return client;
        }

        tl::expected<spdlog::level::level_enum, Error> parseLogLevel(const toml::table& config)
        {
            auto logTable = config["log"].as_table();
            if (!logTable)
            {
                return DEFAULT_LOG_LEVEL;
            }

            auto levelNode = (*logTable)["level"];
            if (!levelNode)
            {
                return DEFAULT_LOG_LEVEL;
            }
            if (!levelNode.as_string())
            {
                return tl::unexpected(
                    errors::ConfigError {"invalid level in [log] - must be a string"});
            }

            auto name = levelNode.as_string()->get();
            auto level = spdlog::level::from_str(name);
            // from_str falls back to off for unknown names.
            if (level == spdlog::level::off && name != "off")
            {
                return tl::unexpected(errors::ConfigError {"unknown log level: " + name});
            }
            return level;
        }
    }  // namespace

    tl::expected<Config, Error> loadConfig(std::string_view path)
    {
        if (!std::filesystem::exists(path))
        {
            return tl::unexpected(
                errors::ConfigError {"config file not found: " + std::string(path)});
        }

        toml::table config;
        try
        {
            config = toml::parse_file(path);
        }
        catch (const toml::parse_error& err)
        {
            return tl::unexpected(
                errors::ConfigError {"failed to parse TOML file: " + std::string(err.what())});
        }

        auto client = parseClient(config);
        if (!client)
        {
            return tl::unexpected(client.error());
        }

        auto logLevel = parseLogLevel(config);
        if (!logLevel)
        {
            return tl::unexpected(logLevel.error());
        }

        return Config {.client = std::move(*client), .logLevel = *logLevel};
    }
}  // namespace memc_cli::config
