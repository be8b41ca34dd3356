#include "chunkvault/error_codes.hpp"

#include <algorithm>
#include <array>

namespace chunkvault
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 14> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::ValidationError, "validation_error"},
            {ErrorCode::ChecksumConflict, "checksum_conflict"},
            {ErrorCode::ChunkCorrupted, "chunk_corrupted"},
            {ErrorCode::SessionNotFound, "session_not_found"},
            {ErrorCode::SessionStateConflict, "session_state_conflict"},
            {ErrorCode::IncompleteUpload, "incomplete_upload"},
            {ErrorCode::FinalChecksumMismatch, "final_checksum_mismatch"},
            {ErrorCode::StorageIOError, "storage_io_error"},
            {ErrorCode::AuthenticationRequired, "authentication_required"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        const auto it = std::find_if(kDescriptions.begin(), kDescriptions.end(),
                                     [code](const ErrorCodeDescription &entry)
                                     { return entry.code == code; });
        return it != kDescriptions.end() ? it->description : std::string_view("unknown");
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        // Codes from a newer peer degrade to InternalError.
        const auto it = std::find_if(kDescriptions.begin(), kDescriptions.end(),
                                     [value](const ErrorCodeDescription &entry)
                                     { return to_int(entry.code) == value; });
        return it != kDescriptions.end() ? it->code : ErrorCode::InternalError;
    }

} // namespace chunkvault
