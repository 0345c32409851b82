#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "minishare/error_codes.hpp"
#include "minishare/protocol.hpp"

namespace minishare::server
{

    class StoreError : public minishare::Error
    {
    public:
        using Error::Error;
    };

    // Upload target written under the staging directory. Renamed into the
    // store by commit(); removed on destruction otherwise.
    class StagedFile
    {
    public:
        StagedFile(std::filesystem::path temp_path, std::filesystem::path final_path);
        ~StagedFile();

        StagedFile(StagedFile &&other) noexcept;
        StagedFile(const StagedFile &) = delete;
        StagedFile &operator=(const StagedFile &) = delete;
        StagedFile &operator=(StagedFile &&) = delete;

        const std::filesystem::path &path() const noexcept { return temp_path_; }

        void commit();

    private:
        std::filesystem::path temp_path_;
        std::filesystem::path final_path_;
        bool done_{false};
    };

    // A stored file opened for reading. The size is taken from the open
    // handle, so a later delete or replace of the name does not affect it.
    struct OpenedFile
    {
        minishare::protocol::FileEntry entry;
        std::ifstream stream;
    };

    // Flat directory of named regular files. Every name is checked against
    // protocol::is_valid_file_name before it touches the disk.
    class FileStore
    {
    public:
        explicit FileStore(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return root_; }

        std::filesystem::path resolve(const std::string &name) const;

        bool exists(const std::string &name) const;

        minishare::protocol::FileEntry stat(const std::string &name) const;

        std::vector<minishare::protocol::FileEntry> list() const;

        // Throws StoreError(NotFound) when name is not a regular file and
        // StoreError(LocalIOError) when it exists but cannot be read.
        OpenedFile open(const std::string &name) const;

        void remove(const std::string &name) const;

        StagedFile stage(const std::string &name) const;

    private:
        void purge_staging() const;

        std::filesystem::path root_;
        std::filesystem::path staging_;
    };

} // namespace minishare::server
