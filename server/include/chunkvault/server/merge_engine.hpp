#pragma once

#include <cstdint>
#include <shared_mutex>
#include <string>

#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/lock_table.hpp"
#include "chunkvault/server/session_registry.hpp"

namespace chunkvault::server
{

    // Per-file_id sections: chunk writers share them, merge and sweep take them exclusively.
    using SessionLocks = LockTable<std::shared_mutex>;

    struct MergeResult
    {
        std::string file_id;
        std::string final_key;
        std::string final_path;
        std::string final_checksum;
        std::uint64_t size{};
    };

    class MergeEngine
    {
    public:
        MergeEngine(SessionRegistry &registry, BlobStore &blobs, SessionLocks &locks);

        // Verifies every chunk, concatenates them in index order and publishes
        // the artifact under files/<category>/<filename>. Throws UploadError
        // (SessionNotFound, SessionStateConflict, IncompleteUpload,
        // ChunkCorrupted, FinalChecksumMismatch) or StorageError.
        MergeResult merge(const std::string &file_id);

    private:
        MergeResult merge_locked(const std::string &file_id);
        void discard_staging(const std::string &staging_key) noexcept;
        void release_chunks(const UploadSession &session) noexcept;

        SessionRegistry &registry_;
        BlobStore &blobs_;
        SessionLocks &locks_;
    };

} // namespace chunkvault::server
