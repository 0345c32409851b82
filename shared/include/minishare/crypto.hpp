/**
 * MiniShare - Checksum helpers built on libsodium (BLAKE2b).
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>

namespace minishare::crypto
{

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Incremental digest of a byte stream; finish() may be called once.
    class StreamHasher
    {
    public:
        StreamHasher();
        ~StreamHasher();

        StreamHasher(const StreamHasher &) = delete;
        StreamHasher &operator=(const StreamHasher &) = delete;

        void update(std::span<const std::byte> data);
        std::string finish();

    private:
        struct State;
        std::unique_ptr<State> state_;
        bool finished_{false};
    };

} // namespace minishare::crypto
