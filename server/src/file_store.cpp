#include "minishare/server/file_store.hpp"

#include <algorithm>
#include <random>
#include <sstream>

#include <spdlog/spdlog.h>

namespace minishare::server
{

    namespace
    {
        constexpr auto kStagingDir = ".incoming";
        constexpr auto kStagingSuffix = ".part";

        std::string generate_token()
        {
            thread_local std::mt19937_64 rng{std::random_device{}()};
            std::uniform_int_distribution<std::uint64_t> dist;
            std::ostringstream oss;
            oss << std::hex << dist(rng);
            return oss.str();
        }

        std::string not_found_message(const std::string &name)
        {
            return "not found: " + name;
        }

    } // namespace

    StagedFile::StagedFile(std::filesystem::path temp_path, std::filesystem::path final_path)
        : temp_path_(std::move(temp_path)), final_path_(std::move(final_path)) {}

    StagedFile::~StagedFile()
    {
        if (!done_)
        {
            std::error_code ec;
            std::filesystem::remove(temp_path_, ec);
        }
    }

    StagedFile::StagedFile(StagedFile &&other) noexcept
        : temp_path_(std::move(other.temp_path_)), final_path_(std::move(other.final_path_)), done_(other.done_)
    {
        other.done_ = true;
    }

    void StagedFile::commit()
    {
        std::error_code ec;
        std::filesystem::rename(temp_path_, final_path_, ec);
        if (ec)
        {
            throw StoreError(minishare::ErrorCode::LocalIOError,
                             "Cannot store " + final_path_.filename().string() + ": " + ec.message());
        }
        done_ = true;
    }

    FileStore::FileStore(std::filesystem::path root)
        : root_(std::move(root)), staging_(root_ / kStagingDir)
    {
        if (!std::filesystem::exists(root_))
        {
            spdlog::info("Created shared folder {}", root_.string());
        }
        std::filesystem::create_directories(root_);
        std::filesystem::create_directories(staging_);
        purge_staging();
    }

    std::filesystem::path FileStore::resolve(const std::string &name) const
    {
        if (!minishare::protocol::is_valid_file_name(name))
        {
            throw StoreError(minishare::ErrorCode::InvalidName, std::string(minishare::protocol::kInvalidFilename));
        }
        return root_ / name;
    }

    bool FileStore::exists(const std::string &name) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(resolve(name), ec);
    }

    minishare::protocol::FileEntry FileStore::stat(const std::string &name) const
    {
        const auto path = resolve(name);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw StoreError(minishare::ErrorCode::NotFound, not_found_message(name));
        }
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw StoreError(minishare::ErrorCode::NotFound, not_found_message(name));
        }
        return minishare::protocol::FileEntry{.name = name, .size = size};
    }

    OpenedFile FileStore::open(const std::string &name) const
    {
        const auto path = resolve(name);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw StoreError(minishare::ErrorCode::NotFound, not_found_message(name));
        }
        OpenedFile opened{.entry = {.name = name, .size = 0}, .stream = std::ifstream(path, std::ios::binary)};
        if (!opened.stream.is_open())
        {
            if (!std::filesystem::exists(path, ec))
            {
                throw StoreError(minishare::ErrorCode::NotFound, not_found_message(name));
            }
            throw StoreError(minishare::ErrorCode::LocalIOError, "Cannot open " + name + " for reading");
        }
        opened.stream.seekg(0, std::ios::end);
        const auto end = opened.stream.tellg();
        opened.stream.seekg(0, std::ios::beg);
        if (end < 0 || !opened.stream)
        {
            throw StoreError(minishare::ErrorCode::LocalIOError, "Cannot determine size of " + name);
        }
        opened.entry.size = static_cast<std::uint64_t>(end);
        return opened;
    }

    std::vector<minishare::protocol::FileEntry> FileStore::list() const
    {
        std::vector<minishare::protocol::FileEntry> entries;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(root_, ec))
        {
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec))
            {
                continue;
            }
            const auto size = entry.file_size(entry_ec);
            if (entry_ec)
            {
                // Removed while enumerating.
                continue;
            }
            entries.push_back({.name = entry.path().filename().string(), .size = size});
        }
        if (ec)
        {
            throw StoreError(minishare::ErrorCode::LocalIOError, "Cannot enumerate shared folder: " + ec.message());
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto &lhs, const auto &rhs)
                  { return lhs.name < rhs.name; });
        return entries;
    }

    void FileStore::remove(const std::string &name) const
    {
        const auto path = resolve(name);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw StoreError(minishare::ErrorCode::NotFound, not_found_message(name));
        }
        const bool removed = std::filesystem::remove(path, ec);
        if (ec)
        {
            throw StoreError(minishare::ErrorCode::LocalIOError, "Could not delete " + name + ": " + ec.message());
        }
        if (!removed)
        {
            throw StoreError(minishare::ErrorCode::NotFound, not_found_message(name));
        }
    }

    StagedFile FileStore::stage(const std::string &name) const
    {
        auto final_path = resolve(name);
        auto temp_path = staging_ / (name + "." + generate_token() + kStagingSuffix);
        return StagedFile(std::move(temp_path), std::move(final_path));
    }

    void FileStore::purge_staging() const
    {
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(staging_, ec))
        {
            std::error_code remove_ec;
            std::filesystem::remove(entry.path(), remove_ec);
            if (!remove_ec)
            {
                spdlog::info("Discarded stale upload {}", entry.path().filename().string());
            }
        }
    }

} // namespace minishare::server
