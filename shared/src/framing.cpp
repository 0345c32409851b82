#include "minishare/framing.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace minishare::protocol
{

    std::uint32_t read_u32_be(std::span<const std::uint8_t, kTextHeaderSize> buffer) noexcept
    {
        return (static_cast<std::uint32_t>(buffer[0]) << 24) |
               (static_cast<std::uint32_t>(buffer[1]) << 16) |
               (static_cast<std::uint32_t>(buffer[2]) << 8) |
               static_cast<std::uint32_t>(buffer[3]);
    }

    void write_u32_be(std::uint32_t value, std::span<std::uint8_t, kTextHeaderSize> buffer) noexcept
    {
        buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
        buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
        buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
        buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
    }

    std::uint64_t read_u64_be(std::span<const std::uint8_t, kNumericFrameSize> buffer) noexcept
    {
        std::uint64_t value = 0;
        for (const auto byte : buffer)
        {
            value = (value << 8) | static_cast<std::uint64_t>(byte);
        }
        return value;
    }

    void write_u64_be(std::uint64_t value, std::span<std::uint8_t, kNumericFrameSize> buffer) noexcept
    {
        for (std::size_t i = 0; i < kNumericFrameSize; ++i)
        {
            buffer[kNumericFrameSize - 1 - i] = static_cast<std::uint8_t>(value & 0xFF);
            value >>= 8;
        }
    }

    std::vector<std::uint8_t> encode_text_frame(std::string_view text)
    {
        if (text.size() > kMaxTextFrameSize)
        {
            throw std::length_error("Text too large to frame");
        }
        std::vector<std::uint8_t> frame(kTextHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()), std::span<std::uint8_t>(frame).first<kTextHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kTextHeaderSize));
        return frame;
    }

    std::optional<DecodedText> try_decode_text_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kTextHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = read_u32_be(buffer.first<kTextHeaderSize>());
        if (payload_size > kMaxTextFrameSize)
        {
            throw std::length_error("Text frame exceeds maximum size");
        }
        if (buffer.size() < kTextHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kTextHeaderSize);
        DecodedText result{
            .text = std::string(payload_begin, payload_begin + payload_size),
            .bytes_consumed = kTextHeaderSize + payload_size,
        };
        return result;
    }

} // namespace minishare::protocol
