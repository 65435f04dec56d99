#pragma once

#include <string>
#include <variant>

#include <fmt/core.h>

#include "memc/errors.hpp"
#include "memc/fmt/errors.hpp"

namespace memc_cli
{
    namespace errors
    {
        struct ConfigError
        {
            std::string message;
        };

        struct UsageError
        {
            std::string message;
        };
    }  // namespace errors

    using Error = std::variant<errors::ConfigError, errors::UsageError, memc::Error>;
}  // namespace memc_cli

template<>
struct fmt::formatter<memc_cli::errors::ConfigError>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(memc_cli::errors::ConfigError const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "config error: {}", err.message);
    }
};

template<>
struct fmt::formatter<memc_cli::errors::UsageError>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(memc_cli::errors::UsageError const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "usage error: {}", err.message);
    }
};

template<>
struct fmt::formatter<memc_cli::Error>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(memc_cli::Error const& err, FormatContext& ctx) const
    {
        return std::visit([&ctx](auto const& alternative)
                          { return fmt::format_to(ctx.out(), "{}", alternative); },
                          err);
    }
};
