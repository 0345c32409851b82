#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "minishare/server/config.hpp"
#include "minishare/server/server.hpp"
#include "minishare/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "MiniShare server " << minishare::version() << "\n"
                  << "Usage: " << program_name
                  << " [--config <FILE>] [--port <PORT>] [--root <DIR>] [--address <ADDRESS>]"
                     " [--max-sessions <N>] [--grace <ms>] [--read-timeout <ms>] [--log <FILE>]"
                     " [--log-level <LEVEL>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    // --config is applied first so that the remaining flags override the file.
    std::optional<std::filesystem::path> find_config_file(int argc, char *argv[])
    {
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                return std::filesystem::path(argv[i + 1]);
            }
        }
        return std::nullopt;
    }

    void configure_logging(const minishare::server::ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using minishare::server::Server;
    using minishare::server::ServerConfig;

    ServerConfig config;

    try
    {
        if (const auto config_file = find_config_file(argc, argv))
        {
            config = minishare::server::load_server_config(*config_file);
        }

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            const bool takes_value = arg == "--config" || arg == "--port" || arg == "--root" ||
                                     arg == "--address" || arg == "--max-sessions" || arg == "--grace" ||
                                     arg == "--read-timeout" || arg == "--log" || arg == "--log-level";
            if (!takes_value)
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--max-sessions")
            {
                config.max_sessions = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--grace")
            {
                config.grace_period = minishare::server::checked_grace_period(std::stoll(*value));
            }
            else if (arg == "--read-timeout")
            {
                config.read_timeout = minishare::server::checked_read_timeout(std::stoll(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else if (arg == "--log-level")
            {
                config.log_level = *value;
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.root.empty() || config.max_sessions == 0)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        configure_logging(config);
        spdlog::info("Starting MiniShare server {} on {}:{}", minishare::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
