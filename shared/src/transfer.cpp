#include "minishare/transfer.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <span>

#include <spdlog/spdlog.h>

#include "minishare/channel.hpp"
#include "minishare/crypto.hpp"

namespace minishare::transfer
{

    namespace
    {

        using Clock = std::chrono::steady_clock;

        double seconds(Clock::duration elapsed) noexcept
        {
            return std::chrono::duration<double>(elapsed).count();
        }

        void report(const ProgressCallback &callback, std::uint64_t done, std::uint64_t total,
                    Clock::time_point started)
        {
            if (!callback)
            {
                return;
            }
            try
            {
                callback(TransferProgress{
                    .bytes_transferred = done,
                    .total_bytes = total,
                    .elapsed = Clock::now() - started,
                });
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Progress observer failed: {}", ex.what());
            }
        }

        // Removes a partially written file unless the transfer completed.
        class PartialFileGuard
        {
        public:
            explicit PartialFileGuard(std::filesystem::path path) : path_(std::move(path)) {}

            ~PartialFileGuard()
            {
                if (!released_)
                {
                    std::error_code ec;
                    std::filesystem::remove(path_, ec);
                }
            }

            PartialFileGuard(const PartialFileGuard &) = delete;
            PartialFileGuard &operator=(const PartialFileGuard &) = delete;

            void release() noexcept { released_ = true; }

        private:
            std::filesystem::path path_;
            bool released_{false};
        };

    } // namespace

    std::string_view to_string(Direction direction) noexcept
    {
        return direction == Direction::Inbound ? "inbound" : "outbound";
    }

    double TransferProgress::percent() const noexcept
    {
        if (total_bytes == 0)
        {
            return 100.0;
        }
        return static_cast<double>(bytes_transferred) * 100.0 / static_cast<double>(total_bytes);
    }

    double TransferProgress::bytes_per_second() const noexcept
    {
        const auto secs = seconds(elapsed);
        return secs > 0.0 ? static_cast<double>(bytes_transferred) / secs : 0.0;
    }

    double TransferResult::bytes_per_second() const noexcept
    {
        const auto secs = seconds(elapsed);
        return secs > 0.0 ? static_cast<double>(bytes) / secs : 0.0;
    }

    TransferResult send_file(FramedChannel &channel, const std::filesystem::path &source, std::uint64_t total_bytes,
                             const ProgressCallback &report_progress)
    {
        std::ifstream in(source, std::ios::binary);
        if (!in.is_open())
        {
            throw TransferError(ErrorCode::LocalIOError, "Cannot open " + source.filename().string() + " for reading");
        }
        return send_stream(channel, in, total_bytes, report_progress);
    }

    TransferResult send_stream(FramedChannel &channel, std::istream &in, std::uint64_t total_bytes,
                               const ProgressCallback &report_progress)
    {
        const auto started = Clock::now();
        crypto::StreamHasher hasher;
        std::array<char, kChunkSize> buffer{};
        std::uint64_t sent = 0;
        while (sent < total_bytes)
        {
            const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), total_bytes - sent));
            in.read(buffer.data(), static_cast<std::streamsize>(wanted));
            const auto got = static_cast<std::size_t>(in.gcount());
            if (got == 0)
            {
                throw TransferError(ErrorCode::LocalIOError,
                                    "Source became unreadable after " + std::to_string(sent) + " of " +
                                        std::to_string(total_bytes) + " bytes");
            }
            const auto chunk = std::as_bytes(std::span(buffer.data(), got));
            hasher.update(chunk);
            channel.write_bytes(chunk);
            sent += got;
            report(report_progress, sent, total_bytes, started);
        }
        channel.flush();
        if (total_bytes == 0)
        {
            report(report_progress, 0, 0, started);
        }

        return TransferResult{
            .bytes = sent,
            .elapsed = Clock::now() - started,
            .digest = hasher.finish(),
        };
    }

    TransferResult receive_file(FramedChannel &channel, const std::filesystem::path &destination,
                                std::uint64_t total_bytes, const ProgressCallback &report_progress)
    {
        const auto started = Clock::now();
        PartialFileGuard guard(destination);
        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        std::string local_failure;
        if (!out.is_open())
        {
            local_failure = "Cannot open " + destination.filename().string() + " for writing";
        }

        crypto::StreamHasher hasher;
        std::array<std::byte, kChunkSize> buffer{};
        std::uint64_t received = 0;
        while (received < total_bytes)
        {
            const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), total_bytes - received));
            const auto chunk = std::span(buffer.data(), wanted);
            try
            {
                channel.read_exactly(chunk);
            }
            catch (const ChannelError &ex)
            {
                throw TransferError(ErrorCode::StreamTruncated,
                                    "Stream ended after " + std::to_string(received) + " of " +
                                        std::to_string(total_bytes) + " bytes: " + ex.what());
            }
            received += wanted;

            if (local_failure.empty())
            {
                hasher.update(chunk);
                out.write(reinterpret_cast<const char *>(chunk.data()), static_cast<std::streamsize>(wanted));
                if (!out)
                {
                    local_failure = "Write to " + destination.filename().string() + " failed after " +
                                    std::to_string(received - wanted) + " bytes";
                    out.close();
                }
            }
            report(report_progress, received, total_bytes, started);
        }
        if (total_bytes == 0)
        {
            report(report_progress, 0, 0, started);
        }

        if (local_failure.empty())
        {
            out.close();
            if (out.fail())
            {
                local_failure = "Failed to finalize " + destination.filename().string();
            }
        }
        if (!local_failure.empty())
        {
            throw TransferError(ErrorCode::LocalIOError, local_failure);
        }

        guard.release();
        return TransferResult{
            .bytes = received,
            .elapsed = Clock::now() - started,
            .digest = hasher.finish(),
        };
    }

    void discard_payload(FramedChannel &channel, std::uint64_t total_bytes)
    {
        std::array<std::byte, kChunkSize> buffer{};
        std::uint64_t remaining = total_bytes;
        while (remaining > 0)
        {
            const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
            channel.read_exactly(std::span(buffer.data(), wanted));
            remaining -= wanted;
        }
    }

    ProgressCallback throttle(ProgressCallback callback, std::chrono::milliseconds interval)
    {
        if (!callback)
        {
            return callback;
        }
        auto last = std::make_shared<Clock::time_point>();
        return [callback = std::move(callback), interval, last](const TransferProgress &progress)
        {
            const auto now = Clock::now();
            if (!progress.complete() && now - *last < interval)
            {
                return;
            }
            *last = now;
            callback(progress);
        };
    }

} // namespace minishare::transfer
