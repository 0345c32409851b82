/**
 * MiniShare - Wire encoding of text and numeric frames.
 *
 * A text frame is a 4 byte big-endian length followed by that many UTF-8
 * bytes. A numeric frame is a fixed 8 byte big-endian unsigned integer.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace minishare::protocol
{

    constexpr std::size_t kTextHeaderSize = sizeof(std::uint32_t);
    constexpr std::size_t kNumericFrameSize = sizeof(std::uint64_t);
    constexpr std::size_t kMaxTextFrameSize = 1024 * 1024;

    std::uint32_t read_u32_be(std::span<const std::uint8_t, kTextHeaderSize> buffer) noexcept;
    void write_u32_be(std::uint32_t value, std::span<std::uint8_t, kTextHeaderSize> buffer) noexcept;

    std::uint64_t read_u64_be(std::span<const std::uint8_t, kNumericFrameSize> buffer) noexcept;
    void write_u64_be(std::uint64_t value, std::span<std::uint8_t, kNumericFrameSize> buffer) noexcept;

    struct DecodedText
    {
        std::string text;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_text_frame(std::string_view text);

    // Returns nullopt while the buffer does not yet hold a complete frame.
    // Throws std::length_error when the announced length exceeds kMaxTextFrameSize.
    std::optional<DecodedText> try_decode_text_frame(std::span<const std::uint8_t> buffer);

} // namespace minishare::protocol
