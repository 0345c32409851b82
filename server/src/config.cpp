#include "minishare/server/config.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace minishare::server
{

    std::chrono::milliseconds checked_read_timeout(std::int64_t milliseconds)
    {
        if (milliseconds <= 0 || milliseconds > std::numeric_limits<int>::max())
        {
            throw std::invalid_argument("read timeout must be between 1 and " +
                                        std::to_string(std::numeric_limits<int>::max()) + " ms");
        }
        return std::chrono::milliseconds(milliseconds);
    }

    std::chrono::milliseconds checked_grace_period(std::int64_t milliseconds)
    {
        if (milliseconds < 0)
        {
            throw std::invalid_argument("grace period must not be negative");
        }
        return std::chrono::milliseconds(milliseconds);
    }

    void from_json(const nlohmann::json &json, ServerConfig &config)
    {
        config.address = json.value("address", config.address);
        config.port = json.value("port", config.port);
        if (auto it = json.find("root"); it != json.end())
        {
            config.root = it->get<std::string>();
        }
        config.max_sessions = json.value("max_sessions", config.max_sessions);
        if (auto it = json.find("grace_period_ms"); it != json.end())
        {
            config.grace_period = checked_grace_period(it->get<std::int64_t>());
        }
        if (auto it = json.find("read_timeout_ms"); it != json.end() && !it->is_null())
        {
            config.read_timeout = checked_read_timeout(it->get<std::int64_t>());
        }
        if (auto it = json.find("log_file"); it != json.end() && !it->is_null())
        {
            config.log_file = std::filesystem::path(it->get<std::string>());
        }
        config.log_level = json.value("log_level", config.log_level);

        if (config.max_sessions == 0)
        {
            throw std::invalid_argument("max_sessions must be at least 1");
        }
    }

    ServerConfig load_server_config(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open config file " + path.string());
        }
        ServerConfig config;
        from_json(nlohmann::json::parse(in), config);
        return config;
    }

} // namespace minishare::server
