#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/cleanup_sweeper.hpp"
#include "chunkvault/server/lock_table.hpp"
#include "chunkvault/server/merge_engine.hpp"
#include "chunkvault/server/session_registry.hpp"

namespace chunkvault::server
{

    struct UploadServiceOptions
    {
        std::uint64_t max_chunk_size{16u * 1024u * 1024u};
        std::uint32_t max_total_chunks{1u << 20};
        std::chrono::seconds session_ttl{std::chrono::hours{24}};
        RetentionPolicy retention{RetentionPolicy::KeepExpired};
        Clock clock;
    };

    struct ChunkUpload
    {
        std::string file_id;
        std::string owner_id;
        std::uint32_t index{};
        std::uint32_t total_chunks{};
        std::string filename;
        std::string category;
        std::string checksum;
        std::span<const std::byte> data;
        std::optional<std::string> expected_final_checksum;
    };

    struct UploadStatus
    {
        std::string file_id;
        std::string owner_id;
        SessionStatus status{SessionStatus::Initiated};
        std::vector<std::uint32_t> received_indices;
        std::uint32_t total_expected{};
    };

    // Entry point for the hosting process: validates requests and routes them
    // to the registry, blob store, merge engine and sweeper.
    class UploadService
    {
    public:
        UploadService(SessionRegistry &registry, BlobStore &blobs, UploadServiceOptions options = {});

        UploadSession register_upload(const SessionDescriptor &descriptor);

        ChunkOutcome receive_chunk(const ChunkUpload &chunk);

        // Throws UploadError(SessionNotFound) for unknown uploads.
        UploadStatus upload_status(const std::string &file_id) const;

        MergeResult merge_upload(const std::string &file_id);

        // Throws UploadError(ValidationError) for a negative ttl.
        std::size_t cleanup_stale(std::chrono::seconds ttl);

        std::size_t cleanup_stale() { return cleanup_stale(options_.session_ttl); }

        SweepReport sweep(std::chrono::system_clock::time_point now, std::chrono::seconds ttl);

        const UploadServiceOptions &options() const noexcept { return options_; }

        SessionLocks &session_locks() noexcept { return session_locks_; }

    private:
        void validate(const SessionDescriptor &descriptor) const;

        SessionRegistry &registry_;
        BlobStore &blobs_;
        UploadServiceOptions options_;
        SessionLocks session_locks_;
        LockTable<std::mutex> chunk_locks_;
        MergeEngine merge_engine_;
        CleanupSweeper sweeper_;
    };

} // namespace chunkvault::server
