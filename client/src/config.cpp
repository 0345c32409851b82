#include "minishare/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace minishare::client
{

    namespace
    {

        std::uint16_t parse_port(const std::string &value)
        {
            std::size_t consumed = 0;
            const auto port = std::stoul(value, &consumed);
            if (consumed != value.size() || port == 0 || port > 65535)
            {
                throw std::runtime_error("Invalid port: " + value);
            }
            return static_cast<std::uint16_t>(port);
        }

        void apply_endpoint(ClientConfig &config, const std::string &endpoint)
        {
            const auto colon_pos = endpoint.rfind(':');
            if (colon_pos == std::string::npos)
            {
                config.port = parse_port(endpoint);
                return;
            }
            if (colon_pos > 0)
            {
                config.host = endpoint.substr(0, colon_pos);
            }
            config.port = parse_port(endpoint.substr(colon_pos + 1));
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;
        if (index < argc && !std::string(argv[index]).starts_with("--"))
        {
            apply_endpoint(config, argv[index++]);
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--downloads")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--downloads requires a directory");
                }
                config.downloads_dir = std::filesystem::path(argv[index++]);
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

    std::string usage(std::string_view program_name)
    {
        return "Usage: " + std::string(program_name) + " [[host:]port] [--downloads <dir>] [--log <file>]";
    }

} // namespace minishare::client
