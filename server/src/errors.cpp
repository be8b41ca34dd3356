#include "chunkvault/server/errors.hpp"

#include <sstream>

namespace chunkvault::server
{

    StorageError::StorageError(std::string message) : std::runtime_error(std::move(message)) {}

    UploadError::UploadError(chunkvault::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    UploadError UploadError::incomplete(const std::string &file_id, std::vector<std::uint32_t> missing)
    {
        const auto count = missing.size();
        if (missing.size() > kMaxReportedMissing)
        {
            missing.resize(kMaxReportedMissing);
        }
        std::ostringstream oss;
        oss << "Upload " << file_id << " is missing " << count << " chunk(s):";
        for (const auto index : missing)
        {
            oss << ' ' << index;
        }
        if (count > missing.size())
        {
            oss << " and " << count - missing.size() << " more";
        }
        UploadError error(chunkvault::ErrorCode::IncompleteUpload, oss.str());
        error.missing_indices_ = std::move(missing);
        error.missing_count_ = count;
        return error;
    }

    UploadError UploadError::corrupted(const std::string &file_id, std::uint32_t index)
    {
        UploadError error(chunkvault::ErrorCode::ChunkCorrupted,
                          "Stored chunk " + std::to_string(index) + " of upload " + file_id +
                              " no longer matches its recorded checksum");
        error.chunk_index_ = index;
        return error;
    }

} // namespace chunkvault::server
