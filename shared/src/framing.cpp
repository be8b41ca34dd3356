#include "chunkvault/framing.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace chunkvault::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

        void check_payload_size(std::size_t size)
        {
            if (size > kMaxFramePayload)
            {
                throw std::length_error("Frame payload of " + std::to_string(size) + " bytes exceeds limit");
            }
        }
    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        check_payload_size(text.size());
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()),
                     std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = read_u32_be(buffer.first<kFrameHeaderSize>());
        check_payload_size(payload_size);
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize);
        const std::string payload(payload_begin, payload_begin + payload_size);
        DecodedFrame result{
            .message = nlohmann::json::parse(payload),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
        return result;
    }

    std::uint32_t decode_frame_header(const std::array<std::uint8_t, kFrameHeaderSize> &header)
    {
        const auto payload_size = read_u32_be(header);
        check_payload_size(payload_size);
        return payload_size;
    }

} // namespace chunkvault::protocol
