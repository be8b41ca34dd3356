/**
 * ChunkVault - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkvault
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        ValidationError = 3,
        ChecksumConflict = 4,
        ChunkCorrupted = 5,
        SessionNotFound = 6,
        SessionStateConflict = 7,
        IncompleteUpload = 8,
        FinalChecksumMismatch = 9,
        StorageIOError = 10,
        AuthenticationRequired = 11,
        Unsupported = 12,
        InternalError = 13
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace chunkvault
