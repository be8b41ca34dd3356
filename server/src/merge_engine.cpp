#include "chunkvault/server/merge_engine.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/errors.hpp"

namespace chunkvault::server
{

    MergeEngine::MergeEngine(SessionRegistry &registry, BlobStore &blobs, SessionLocks &locks)
        : registry_(registry), blobs_(blobs), locks_(locks) {}

    MergeResult MergeEngine::merge(const std::string &file_id)
    {
        const auto section = locks_.acquire(file_id);
        std::unique_lock lock(*section);
        return merge_locked(file_id);
    }

    MergeResult MergeEngine::merge_locked(const std::string &file_id)
    {
        auto found = registry_.find(file_id);
        if (!found)
        {
            throw UploadError(chunkvault::ErrorCode::SessionNotFound, "Upload " + file_id + " not found");
        }
        auto session = std::move(*found);
        if (!accepts_writes(session.status))
        {
            throw UploadError(chunkvault::ErrorCode::SessionStateConflict,
                              "Upload " + file_id + " is " + std::string(to_string(session.status)));
        }

        auto missing = session.missing_indices();
        if (!missing.empty())
        {
            throw UploadError::incomplete(file_id, std::move(missing));
        }
        if (session.status != SessionStatus::CompletePendingMerge)
        {
            session = registry_.transition(file_id, SessionStatus::CompletePendingMerge);
        }

        const auto staging = blob_keys::staging_key(file_id);
        blobs_.remove(staging);

        crypto::Sha256Stream running;
        try
        {
            for (std::uint32_t index = 0; index < session.expected_total_chunks; ++index)
            {
                const auto &record = session.received.at(index);
                const auto data = blobs_.get(blob_keys::chunk_key(file_id, index));
                if (!data || data->size() != record.size ||
                    !crypto::digests_equal(crypto::sha256_hex(*data), record.checksum))
                {
                    spdlog::warn("Upload {}: chunk {} failed re-verification", file_id, index);
                    registry_.flag_for_reupload(file_id, index);
                    throw UploadError::corrupted(file_id, index);
                }
                blobs_.append(staging, *data);
                running.update(*data);
            }
        }
        catch (...)
        {
            discard_staging(staging);
            throw;
        }

        const auto total_size = running.bytes_consumed();
        const auto final_checksum = running.finish();

        if (session.expected_final_checksum &&
            !crypto::digests_equal(*session.expected_final_checksum, final_checksum))
        {
            discard_staging(staging);
            registry_.transition(file_id, SessionStatus::Failed);
            spdlog::warn("Upload {}: assembled checksum {} differs from expected {}", file_id, final_checksum,
                         *session.expected_final_checksum);
            throw UploadError(chunkvault::ErrorCode::FinalChecksumMismatch,
                              "Assembled file checksum does not match the expected checksum for upload " + file_id);
        }

        const auto final_key = blob_keys::artifact_key(session.category, session.expected_filename);
        if (blobs_.exists(final_key))
        {
            spdlog::warn("Upload {}: replacing existing artifact {}", file_id, final_key);
        }
        try
        {
            blobs_.publish(staging, final_key);
        }
        catch (...)
        {
            discard_staging(staging);
            throw;
        }
        const auto merged = registry_.mark_merged(file_id, final_checksum, final_key, total_size);
        release_chunks(merged);

        spdlog::info("Upload {} merged into {} ({} bytes, sha256 {})", file_id, final_key, total_size,
                     final_checksum);
        return MergeResult{
            .file_id = file_id,
            .final_key = final_key,
            .final_path = blobs_.locate(final_key),
            .final_checksum = final_checksum,
            .size = total_size,
        };
    }

    void MergeEngine::discard_staging(const std::string &staging_key) noexcept
    {
        try
        {
            blobs_.remove(staging_key);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Could not discard staging blob {}: {}", staging_key, ex.what());
        }
    }

    void MergeEngine::release_chunks(const UploadSession &session) noexcept
    {
        // Best effort: the sweeper reclaims leftovers of merged sessions.
        for (const auto &[index, record] : session.received)
        {
            const auto key = blob_keys::chunk_key(session.file_id, index);
            try
            {
                blobs_.remove(key);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Upload {}: leaving chunk blob {} for the sweeper: {}", session.file_id, key, ex.what());
            }
        }
    }

} // namespace chunkvault::server
