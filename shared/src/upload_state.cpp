#include "chunkvault/upload_state.hpp"

#include <array>

namespace chunkvault
{

    namespace
    {

        struct StatusMapping
        {
            SessionStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 6> kStatusMappings{{
            {SessionStatus::Initiated, "INITIATED"},
            {SessionStatus::InProgress, "IN_PROGRESS"},
            {SessionStatus::CompletePendingMerge, "COMPLETE_PENDING_MERGE"},
            {SessionStatus::Merged, "MERGED"},
            {SessionStatus::Failed, "FAILED"},
            {SessionStatus::Expired, "EXPIRED"},
        }};

        struct OutcomeMapping
        {
            ChunkOutcome outcome;
            std::string_view label;
        };

        constexpr std::array<OutcomeMapping, 4> kOutcomeMappings{{
            {ChunkOutcome::Accepted, "ACCEPTED"},
            {ChunkOutcome::DuplicateIgnored, "DUPLICATE_IGNORED"},
            {ChunkOutcome::ChecksumConflict, "CHECKSUM_CONFLICT"},
            {ChunkOutcome::SessionClosed, "SESSION_CLOSED"},
        }};

    } // namespace

    std::string_view to_string(SessionStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    bool is_valid_transition(SessionStatus from, SessionStatus to) noexcept
    {
        switch (to)
        {
        case SessionStatus::InProgress:
            return from == SessionStatus::Initiated;
        case SessionStatus::CompletePendingMerge:
            return from == SessionStatus::InProgress;
        case SessionStatus::Merged:
            return from == SessionStatus::CompletePendingMerge;
        case SessionStatus::Failed:
            return accepts_writes(from);
        case SessionStatus::Expired:
            return accepts_writes(from) || from == SessionStatus::Failed;
        case SessionStatus::Initiated:
            return false;
        }
        return false;
    }

    std::string_view to_string(ChunkOutcome outcome) noexcept
    {
        for (const auto &mapping : kOutcomeMappings)
        {
            if (mapping.outcome == outcome)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ChunkOutcome> chunk_outcome_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kOutcomeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.outcome;
            }
        }
        return std::nullopt;
    }

} // namespace chunkvault
