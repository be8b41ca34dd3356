#include "chunkvault/server/upload_service.hpp"

#include <shared_mutex>

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/errors.hpp"

namespace chunkvault::server
{

    namespace
    {

        void require(bool condition, const std::string &message)
        {
            if (!condition)
            {
                throw UploadError(chunkvault::ErrorCode::ValidationError, message);
            }
        }

    } // namespace

    UploadService::UploadService(SessionRegistry &registry, BlobStore &blobs, UploadServiceOptions options)
        : registry_(registry),
          blobs_(blobs),
          options_(std::move(options)),
          merge_engine_(registry_, blobs_, session_locks_),
          sweeper_(registry_, blobs_, session_locks_, options_.retention)
    {
        if (!options_.clock)
        {
            options_.clock = []
            { return std::chrono::system_clock::now(); };
        }
    }

    UploadSession UploadService::register_upload(const SessionDescriptor &descriptor)
    {
        validate(descriptor);
        return registry_.create_or_get(descriptor);
    }

    ChunkOutcome UploadService::receive_chunk(const ChunkUpload &chunk)
    {
        const SessionDescriptor descriptor{
            .file_id = chunk.file_id,
            .owner_id = chunk.owner_id,
            .total_chunks = chunk.total_chunks,
            .filename = chunk.filename,
            .category = chunk.category,
            .expected_final_checksum = chunk.expected_final_checksum,
        };
        validate(descriptor);
        require(chunk.index < chunk.total_chunks, "chunk_index must be below total_chunks");
        require(crypto::is_sha256_hex(chunk.checksum), "checksum must be a hex SHA-256 digest");
        require(chunk.data.size() <= options_.max_chunk_size,
                "chunk of " + std::to_string(chunk.data.size()) + " bytes exceeds the " +
                    std::to_string(options_.max_chunk_size) + " byte limit");

        // Bytes that do not match their own checksum are never stored.
        const auto actual = crypto::sha256_hex(chunk.data);
        if (!crypto::digests_equal(actual, chunk.checksum))
        {
            spdlog::warn("Upload {}: checksum mismatch on chunk {} (expected {}, got {})", chunk.file_id,
                         chunk.index, chunk.checksum, actual);
            return ChunkOutcome::ChecksumConflict;
        }

        registry_.create_or_get(descriptor);

        const auto section = session_locks_.acquire(chunk.file_id);
        std::shared_lock session_lock(*section);
        const auto key = blob_keys::chunk_key(chunk.file_id, chunk.index);
        const auto slot = chunk_locks_.acquire(key);
        std::lock_guard chunk_lock(*slot);

        const auto precheck = registry_.check_chunk(chunk.file_id, chunk.index, chunk.checksum);
        if (precheck != ChunkOutcome::Accepted)
        {
            if (precheck == ChunkOutcome::ChecksumConflict)
            {
                spdlog::warn("Upload {}: chunk {} already stored with a different checksum", chunk.file_id,
                             chunk.index);
            }
            else
            {
                spdlog::debug("Upload {}: chunk {} {}", chunk.file_id, chunk.index, to_string(precheck));
            }
            return precheck;
        }

        blobs_.put(key, chunk.data);
        const auto outcome = registry_.record_chunk(chunk.file_id, chunk.index, chunk.data.size(), chunk.checksum);
        spdlog::debug("Upload {}: chunk {} ({} bytes) {}", chunk.file_id, chunk.index, chunk.data.size(),
                      to_string(outcome));
        return outcome;
    }

    UploadStatus UploadService::upload_status(const std::string &file_id) const
    {
        const auto session = registry_.find(file_id);
        if (!session)
        {
            throw UploadError(chunkvault::ErrorCode::SessionNotFound, "Upload " + file_id + " not found");
        }
        return UploadStatus{
            .file_id = session->file_id,
            .owner_id = session->owner_id,
            .status = session->status,
            .received_indices = session->usable_indices(),
            .total_expected = session->expected_total_chunks,
        };
    }

    MergeResult UploadService::merge_upload(const std::string &file_id)
    {
        return merge_engine_.merge(file_id);
    }

    std::size_t UploadService::cleanup_stale(std::chrono::seconds ttl)
    {
        return sweep(options_.clock(), ttl).reclaimed;
    }

    SweepReport UploadService::sweep(std::chrono::system_clock::time_point now, std::chrono::seconds ttl)
    {
        require(ttl >= std::chrono::seconds::zero(), "ttl must not be negative");
        return sweeper_.sweep(now, ttl);
    }

    void UploadService::validate(const SessionDescriptor &descriptor) const
    {
        require(blob_keys::is_safe_segment(descriptor.file_id), "file_id is missing or contains unsafe characters");
        require(!descriptor.owner_id.empty(), "owner_id is required");
        require(descriptor.total_chunks > 0, "total_chunks must be positive");
        require(descriptor.total_chunks <= options_.max_total_chunks,
                "total_chunks exceeds the limit of " + std::to_string(options_.max_total_chunks));
        require(blob_keys::is_safe_segment(descriptor.filename), "filename is missing or contains unsafe characters");
        require(blob_keys::is_safe_segment(descriptor.category), "category is missing or contains unsafe characters");
        if (descriptor.expected_final_checksum)
        {
            require(crypto::is_sha256_hex(*descriptor.expected_final_checksum),
                    "final_checksum must be a hex SHA-256 digest");
        }
    }

} // namespace chunkvault::server
