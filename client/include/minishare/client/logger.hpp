#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace minishare::client
{

    // Tagged activity log of the client. Writes to a file when a path is
    // given and to a null sink otherwise, so the console stays reserved for
    // the shell.
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path = std::nullopt);

        template <typename... Args>
        void log(const std::string &tag, Args &&...args)
        {
            if (!logger_)
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->info("[{}] {}", tag, std::string(buf.data(), buf.size()));
        }

        bool enabled() const noexcept { return logger_ != nullptr; }

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace minishare::client
