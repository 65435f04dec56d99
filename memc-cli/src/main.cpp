#include <iostream>

#include <fmt/format.h>
#include <lyra/lyra.hpp>

#include "commands.hpp"

struct SetProgram
{
    bool showHelp = false;
    memc_cli::CommandOptions options;
    std::string value;
    int64_t ttlSeconds = -1;
    int exitCode = memc_cli::EXIT_OK;

    void addCommand(lyra::group& g)
    {
        g.add_argument(lyra::command("set", [this](const lyra::group& f) { run(f); })
                           .add_argument(lyra::help(showHelp))
                           .add_argument(lyra::opt(options.configPath, "config")
                                             .name("--config")
                                             .name("-c")
                                             .required()
                                             .help("Path to the configuration file"))
                           .add_argument(lyra::opt(options.key, "key")
                                             .name("--key")
                                             .name("-k")
                                             .required()
                                             .help("Key to store the value under"))
                           .add_argument(lyra::opt(value, "value")
                                             .name("--value")
                                             .name("-v")
                                             .required()
                                             .help("Value to store"))
                           .add_argument(lyra::opt(options.type, "type")
                                             .name("--type")
                                             .name("-t")
                                             .choices("string", "int64")
                                             .help("Type to encode the value as"))
                           .add_argument(lyra::opt(ttlSeconds, "seconds")
                                             .name("--ttl")
                                             .help("Expiration in seconds, overriding the default"))
                           .add_argument(lyra::opt(options.verbose)
                                             .name("--verbose")
                                             .help("Enable debug logging")));
    }

    void run(const lyra::group& g)
    {
        if (showHelp)
        {
            std::cout << g;
            return;
        }

        std::optional<int64_t> ttl;
        if (ttlSeconds >= 0)
        {
            ttl = ttlSeconds;
        }
        exitCode = memc_cli::runSet(options, value, ttl);
    }
};

struct GetProgram
{
    bool showHelp = false;
    memc_cli::CommandOptions options;
    int exitCode = memc_cli::EXIT_OK;

    void addCommand(lyra::group& g)
    {
        g.add_argument(lyra::command("get", [this](const lyra::group& f) { run(f); })
                           .add_argument(lyra::help(showHelp))
                           .add_argument(lyra::opt(options.configPath, "config")
                                             .name("--config")
                                             .name("-c")
                                             .required()
                                             .help("Path to the configuration file"))
                           .add_argument(lyra::opt(options.key, "key")
                                             .name("--key")
                                             .name("-k")
                                             .required()
                                             .help("Key to look up"))
                           .add_argument(lyra::opt(options.type, "type")
                                             .name("--type")
                                             .name("-t")
                                             .choices("string", "int64")
                                             .help("Type to decode the value as"))
                           .add_argument(lyra::opt(options.verbose)
                                             .name("--verbose")
                                             .help("Enable debug logging")));
    }

    void run(const lyra::group& g)
    {
        if (showHelp)
        {
            std::cout << g;
            return;
        }

        exitCode = memc_cli::runGet(options);
    }
};

int main(int argc, char** argv)
{
    bool showHelp = false;
    lyra::group global;
    global.add_argument(lyra::help(showHelp));

    lyra::group subcommands;
    subcommands.require(1, 1);

    SetProgram set;
    set.addCommand(subcommands);
    GetProgram get;
    get.addCommand(subcommands);

    auto cli = lyra::cli().add_argument(global).add_argument(subcommands);
    auto result = cli.parse({argc, argv});
    if (!result)
    {
        std::cerr << result.message() << '\n';
        return 1;
    }
    if (showHelp)
    {
        std::cout << cli;
        return 0;
    }

    return set.exitCode != memc_cli::EXIT_OK ? set.exitCode : get.exitCode;
}
