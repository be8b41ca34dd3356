#include "chunkvault/server/cleanup_sweeper.hpp"

#include <limits>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace chunkvault::server
{

    namespace
    {
        constexpr std::string_view kStagingSuffix = ".merging";
    } // namespace

    std::chrono::seconds ttl_from_seconds(std::uint64_t seconds) noexcept
    {
        constexpr auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::chrono::seconds::rep>::max());
        if (seconds > limit)
        {
            return std::chrono::seconds::max();
        }
        return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds));
    }

    CleanupSweeper::CleanupSweeper(SessionRegistry &registry, BlobStore &blobs, SessionLocks &locks,
                                   RetentionPolicy retention)
        : registry_(registry), blobs_(blobs), locks_(locks), retention_(retention) {}

    SweepReport CleanupSweeper::sweep(std::chrono::system_clock::time_point now, std::chrono::seconds ttl)
    {
        if (ttl < std::chrono::seconds::zero())
        {
            throw std::invalid_argument("sweep ttl must not be negative");
        }
        SweepReport report;
        for (const auto &session : registry_.list())
        {
            if (session.status == SessionStatus::Merged)
            {
                remove_orphans(session, report);
            }
            else if (is_reclaimable(session, now, ttl))
            {
                reclaim(session.file_id, now, ttl, report);
            }
        }
        remove_stale_staging(report);

        if (report.reclaimed > 0 || report.failures > 0 || report.orphan_blobs_removed > 0)
        {
            spdlog::info("Sweep reclaimed {} upload(s), removed {} orphan blob(s), {} failure(s), {} busy",
                         report.reclaimed, report.orphan_blobs_removed, report.failures, report.skipped_busy);
        }
        return report;
    }

    bool CleanupSweeper::is_reclaimable(const UploadSession &session, std::chrono::system_clock::time_point now,
                                        std::chrono::seconds ttl) const
    {
        if (session.status == SessionStatus::Failed)
        {
            return true;
        }
        if (!accepts_writes(session.status))
        {
            return false;
        }
        // Compare in seconds; ttl may be as large as seconds::max().
        const auto idle = std::chrono::duration_cast<std::chrono::seconds>(now - session.last_activity_at);
        return idle > ttl;
    }

    void CleanupSweeper::reclaim(const std::string &file_id, std::chrono::system_clock::time_point now,
                                 std::chrono::seconds ttl, SweepReport &report)
    {
        const auto section = locks_.acquire(file_id);
        std::unique_lock lock(*section, std::try_to_lock);
        if (!lock.owns_lock())
        {
            // A merge or chunk write holds the section, so the session is active.
            ++report.skipped_busy;
            return;
        }
        try
        {
            const auto current = registry_.find(file_id);
            if (!current || !is_reclaimable(*current, now, ttl))
            {
                return;
            }
            const auto removed = remove_chunk_blobs(*current);
            blobs_.remove(blob_keys::staging_key(file_id));
            if (retention_ == RetentionPolicy::RemoveRecord)
            {
                registry_.erase(file_id);
            }
            else
            {
                registry_.transition(file_id, SessionStatus::Expired);
            }
            ++report.reclaimed;
            spdlog::info("Reclaimed upload {} ({}, {} chunk blob(s))", file_id, to_string(current->status), removed);
        }
        catch (const std::exception &ex)
        {
            ++report.failures;
            spdlog::error("Failed to reclaim upload {}: {}", file_id, ex.what());
        }
    }

    void CleanupSweeper::remove_orphans(const UploadSession &session, SweepReport &report)
    {
        try
        {
            if (blobs_.list(blob_keys::chunk_prefix(session.file_id)).empty())
            {
                return;
            }
            const auto section = locks_.acquire(session.file_id);
            std::unique_lock lock(*section, std::try_to_lock);
            if (!lock.owns_lock())
            {
                ++report.skipped_busy;
                return;
            }
            report.orphan_blobs_removed += remove_chunk_blobs(session);
        }
        catch (const std::exception &ex)
        {
            ++report.failures;
            spdlog::error("Failed to remove leftover chunks of merged upload {}: {}", session.file_id, ex.what());
        }
    }

    void CleanupSweeper::remove_stale_staging(SweepReport &report)
    {
        std::vector<std::string> staged;
        try
        {
            staged = blobs_.list(std::string(blob_keys::kStagingPrefix));
        }
        catch (const std::exception &ex)
        {
            ++report.failures;
            spdlog::error("Failed to list staging blobs: {}", ex.what());
            return;
        }
        for (const auto &key : staged)
        {
            auto file_id = key.substr(blob_keys::kStagingPrefix.size());
            if (file_id.size() <= kStagingSuffix.size() || !file_id.ends_with(kStagingSuffix))
            {
                continue;
            }
            file_id.resize(file_id.size() - kStagingSuffix.size());

            // A merge keeps its section for the staging blob's whole life, so any
            // staging blob seen while holding the section is left over.
            const auto section = locks_.acquire(file_id);
            std::unique_lock lock(*section, std::try_to_lock);
            if (!lock.owns_lock())
            {
                continue;
            }
            try
            {
                blobs_.remove(key);
                ++report.orphan_blobs_removed;
            }
            catch (const std::exception &ex)
            {
                ++report.failures;
                spdlog::error("Failed to remove staging blob {}: {}", key, ex.what());
            }
        }
    }

    std::size_t CleanupSweeper::remove_chunk_blobs(const UploadSession &session)
    {
        std::set<std::string> keys;
        for (const auto &[index, record] : session.received)
        {
            keys.insert(blob_keys::chunk_key(session.file_id, index));
        }
        for (auto &key : blobs_.list(blob_keys::chunk_prefix(session.file_id)))
        {
            keys.insert(std::move(key));
        }
        std::size_t removed = 0;
        for (const auto &key : keys)
        {
            if (blobs_.exists(key))
            {
                blobs_.remove(key);
                ++removed;
            }
        }
        return removed;
    }

} // namespace chunkvault::server
