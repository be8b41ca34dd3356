#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "chunkvault/framing.hpp"

namespace chunkvault::client
{

    // Room left in a frame for the envelope around the base64 chunk data.
    inline constexpr std::uint64_t kChunkEnvelopeAllowance = 64u * 1024u;

    // Largest chunk whose UPLOAD_CHUNK request still fits in one frame.
    inline constexpr std::uint64_t kMaxChunkSize =
        (chunkvault::protocol::kMaxFramePayload - kChunkEnvelopeAllowance) / 4 * 3;

    // Number of chunks needed for file_size bytes. An empty file still takes one chunk.
    // Throws std::length_error when the count does not fit in 32 bits.
    std::uint32_t chunk_count(std::uint64_t file_size, std::uint64_t chunk_size);

    // Indices in [0, total) not present in received.
    std::vector<std::uint32_t> pending_chunks(std::uint32_t total, const std::vector<std::uint32_t> &received);

    // Delay before retry number attempt (1-based): 1s, 2s, 4s, ...
    std::chrono::seconds backoff_delay(std::uint32_t attempt);

    // <random hex>_<unix seconds>
    std::string generate_file_id();

} // namespace chunkvault::client
