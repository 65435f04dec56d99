#pragma once
#include <string_view>

#include <spdlog/common.h>
#include <tl/expected.hpp>

#include "../errors.hpp"
#include "memc/client.hpp"

namespace memc_cli::config
{
    constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL = spdlog::level::info;

    struct Config
    {
        memc::ClientConfig client;
        spdlog::level::level_enum logLevel = DEFAULT_LOG_LEVEL;
    };

    tl::expected<Config, Error> loadConfig(std::string_view path);

}  // namespace memc_cli::config
