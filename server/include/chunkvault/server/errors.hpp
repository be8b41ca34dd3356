#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    // Raised by blob store implementations when the underlying storage fails.
    class StorageError : public std::runtime_error
    {
    public:
        explicit StorageError(std::string message);

        chunkvault::ErrorCode code() const noexcept { return chunkvault::ErrorCode::StorageIOError; }
    };

    class UploadError : public std::runtime_error
    {
    public:
        static constexpr std::size_t kMaxReportedMissing = 64;

        UploadError(chunkvault::ErrorCode code, std::string message);

        // Keeps at most kMaxReportedMissing indices; missing_count() has the full total.
        static UploadError incomplete(const std::string &file_id, std::vector<std::uint32_t> missing);
        static UploadError corrupted(const std::string &file_id, std::uint32_t index);

        chunkvault::ErrorCode code() const noexcept { return code_; }

        const std::vector<std::uint32_t> &missing_indices() const noexcept { return missing_indices_; }
        std::size_t missing_count() const noexcept { return missing_count_; }
        std::optional<std::uint32_t> chunk_index() const noexcept { return chunk_index_; }

    private:
        chunkvault::ErrorCode code_;
        std::vector<std::uint32_t> missing_indices_;
        std::size_t missing_count_{};
        std::optional<std::uint32_t> chunk_index_;
    };

} // namespace chunkvault::server
