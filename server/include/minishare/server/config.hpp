#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace minishare::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::filesystem::path root{"shared_files"};
        std::size_t max_sessions{10};
        std::chrono::milliseconds grace_period{std::chrono::seconds{5}};
        std::optional<std::chrono::milliseconds> read_timeout;
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
    };

    // Read timeouts must be positive and fit poll()'s int milliseconds; grace
    // periods must not be negative. Both throw std::invalid_argument.
    std::chrono::milliseconds checked_read_timeout(std::int64_t milliseconds);
    std::chrono::milliseconds checked_grace_period(std::int64_t milliseconds);

    // Keys absent from the document keep their current value.
    void from_json(const nlohmann::json &json, ServerConfig &config);

    ServerConfig load_server_config(const std::filesystem::path &path);

} // namespace minishare::server
