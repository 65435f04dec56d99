#pragma once

#include <variant>

#include <fmt/core.h>

#include "memc/errors.hpp"

template<>
struct fmt::formatter<memc::errors::KeyNotValid>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(memc::errors::KeyNotValid const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "key not valid: {}", err.message);
    }
};

template<>
struct fmt::formatter<memc::errors::ExpirationNotValid>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(memc::errors::ExpirationNotValid const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(),
                              "expiration not valid: {}ns is not a non-negative whole number of seconds "
                              "that fits in 32 bits",
                              err.duration.count());
    }
};

template<>
struct fmt::formatter<memc::errors::EncodingFailure>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(memc::errors::EncodingFailure const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "encoding failure: {}", err.message);
    }
};

template<>
struct fmt::formatter<memc::errors::DecodingFailure>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(memc::errors::DecodingFailure const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "decoding failure: {}", err.message);
    }
};

template<>
struct fmt::formatter<memc::errors::CacheMiss>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(memc::errors::CacheMiss const& err, FormatContext& ctx) const
    {
        (void)err;
        return fmt::format_to(ctx.out(), "cache miss");
    }
};

template<>
struct fmt::formatter<memc::errors::TransportFailure>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(memc::errors::TransportFailure const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "transport failure: {}", err.message);
    }
};

template<>
struct fmt::formatter<memc::Error>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(memc::Error const& err, FormatContext& ctx) const
    {
        return std::visit([&ctx](auto const& alternative)
                          { return fmt::format_to(ctx.out(), "{}", alternative); },
                          err);
    }
};
