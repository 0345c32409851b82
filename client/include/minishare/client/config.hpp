#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace minishare::client
{

    struct ClientConfig
    {
        std::string host{"localhost"};
        std::uint16_t port{8080};
        std::filesystem::path downloads_dir{"downloads"};
        std::optional<std::filesystem::path> log_path;
    };

    // Accepts an optional leading "[host:]port" endpoint followed by
    // --downloads <dir> and --log <file>.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(std::string_view program_name);

} // namespace minishare::client
