/**
 * ChunkVault - Upload session states and chunk acceptance outcomes.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace chunkvault
{

    // Forward-only lifecycle: Initiated -> InProgress -> CompletePendingMerge -> Merged,
    // or any non-terminal state -> Failed/Expired. Failed sessions may still expire.
    enum class SessionStatus : std::uint8_t
    {
        Initiated,
        InProgress,
        CompletePendingMerge,
        Merged,
        Failed,
        Expired
    };

    std::string_view to_string(SessionStatus status) noexcept;
    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept;

    // Merged, Failed and Expired sessions accept no further chunk writes.
    constexpr bool accepts_writes(SessionStatus status) noexcept
    {
        return status == SessionStatus::Initiated || status == SessionStatus::InProgress ||
               status == SessionStatus::CompletePendingMerge;
    }

    bool is_valid_transition(SessionStatus from, SessionStatus to) noexcept;

    enum class ChunkOutcome : std::uint8_t
    {
        Accepted,
        DuplicateIgnored,
        ChecksumConflict,
        SessionClosed
    };

    std::string_view to_string(ChunkOutcome outcome) noexcept;
    std::optional<ChunkOutcome> chunk_outcome_from_string(std::string_view value) noexcept;

} // namespace chunkvault
