#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/merge_engine.hpp"
#include "chunkvault/server/session_registry.hpp"

namespace chunkvault::server
{

    enum class RetentionPolicy : std::uint8_t
    {
        // Swept sessions stay in the registry as Expired.
        KeepExpired,
        // Swept sessions are erased from the registry.
        RemoveRecord
    };

    struct SweepReport
    {
        std::size_t reclaimed{};
        std::size_t skipped_busy{};
        std::size_t failures{};
        std::size_t orphan_blobs_removed{};
    };

    // Wire TTLs are unsigned; values past the range of std::chrono::seconds
    // saturate to its maximum, which never reclaims an active session.
    std::chrono::seconds ttl_from_seconds(std::uint64_t seconds) noexcept;

    class CleanupSweeper
    {
    public:
        CleanupSweeper(SessionRegistry &registry, BlobStore &blobs, SessionLocks &locks,
                       RetentionPolicy retention = RetentionPolicy::KeepExpired);

        // Reclaims sessions idle for longer than ttl and every Failed session.
        // Merged sessions keep their record; only leftover chunk blobs are removed.
        // Throws std::invalid_argument for a negative ttl.
        SweepReport sweep(std::chrono::system_clock::time_point now, std::chrono::seconds ttl);

    private:
        bool is_reclaimable(const UploadSession &session, std::chrono::system_clock::time_point now,
                            std::chrono::seconds ttl) const;
        void reclaim(const std::string &file_id, std::chrono::system_clock::time_point now, std::chrono::seconds ttl,
                     SweepReport &report);
        void remove_orphans(const UploadSession &session, SweepReport &report);
        void remove_stale_staging(SweepReport &report);
        std::size_t remove_chunk_blobs(const UploadSession &session);

        SessionRegistry &registry_;
        BlobStore &blobs_;
        SessionLocks &locks_;
        RetentionPolicy retention_;
    };

} // namespace chunkvault::server
