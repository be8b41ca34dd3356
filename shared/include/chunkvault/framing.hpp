/**
 * ChunkVault - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkvault::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Upper bound on a single frame payload. A base64 chunk of the largest
    // accepted size plus its envelope fits comfortably below it.
    inline constexpr std::uint32_t kMaxFramePayload = 64u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

    // Throws std::length_error when the announced payload exceeds kMaxFramePayload.
    std::uint32_t decode_frame_header(const std::array<std::uint8_t, kFrameHeaderSize> &header);

} // namespace chunkvault::protocol
