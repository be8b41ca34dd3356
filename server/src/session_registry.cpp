#include "chunkvault/server/session_registry.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/errors.hpp"

namespace chunkvault::server
{

    namespace
    {

        std::int64_t to_millis(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
        }

        std::chrono::system_clock::time_point from_millis(std::int64_t millis)
        {
            return std::chrono::system_clock::time_point{std::chrono::milliseconds{millis}};
        }

        nlohmann::json to_json(const UploadSession &session)
        {
            nlohmann::json chunks = nlohmann::json::array();
            for (const auto &[index, record] : session.received)
            {
                chunks.push_back({
                    {"index", index},
                    {"size", record.size},
                    {"checksum", record.checksum},
                    {"needs_reupload", record.needs_reupload},
                });
            }
            nlohmann::json json = {
                {"file_id", session.file_id},
                {"owner_id", session.owner_id},
                {"total_chunks", session.expected_total_chunks},
                {"chunks", chunks},
                {"status", to_string(session.status)},
                {"created_at", to_millis(session.created_at)},
                {"last_activity_at", to_millis(session.last_activity_at)},
                {"filename", session.expected_filename},
                {"category", session.category},
                {"final_size", session.final_size},
            };
            if (session.expected_final_checksum)
            {
                json["expected_final_checksum"] = *session.expected_final_checksum;
            }
            if (session.final_checksum)
            {
                json["final_checksum"] = *session.final_checksum;
            }
            if (session.final_key)
            {
                json["final_key"] = *session.final_key;
            }
            return json;
        }

        UploadSession session_from_json(const nlohmann::json &json)
        {
            UploadSession session{};
            session.file_id = json.at("file_id").get<std::string>();
            session.owner_id = json.at("owner_id").get<std::string>();
            session.expected_total_chunks = json.at("total_chunks").get<std::uint32_t>();
            for (const auto &chunk : json.value("chunks", nlohmann::json::array()))
            {
                ChunkRecord record{};
                record.size = chunk.value("size", 0ULL);
                record.checksum = chunk.at("checksum").get<std::string>();
                record.needs_reupload = chunk.value("needs_reupload", false);
                session.received[chunk.at("index").get<std::uint32_t>()] = record;
            }
            const auto status_label = json.at("status").get<std::string>();
            const auto status = session_status_from_string(status_label);
            if (!status)
            {
                throw std::runtime_error("Unknown session status: " + status_label);
            }
            session.status = *status;
            session.created_at = from_millis(json.value("created_at", 0LL));
            session.last_activity_at = from_millis(json.value("last_activity_at", 0LL));
            session.expected_filename = json.value("filename", std::string{});
            session.category = json.value("category", std::string{});
            session.final_size = json.value("final_size", 0ULL);
            if (auto it = json.find("expected_final_checksum"); it != json.end())
            {
                session.expected_final_checksum = it->get<std::string>();
            }
            if (auto it = json.find("final_checksum"); it != json.end())
            {
                session.final_checksum = it->get<std::string>();
            }
            if (auto it = json.find("final_key"); it != json.end())
            {
                session.final_key = it->get<std::string>();
            }
            return session;
        }

        UploadError not_found(const std::string &file_id)
        {
            return UploadError(chunkvault::ErrorCode::SessionNotFound, "Upload " + file_id + " not found");
        }

    } // namespace

    std::vector<std::uint32_t> UploadSession::missing_indices() const
    {
        std::vector<std::uint32_t> missing;
        for (std::uint32_t index = 0; index < expected_total_chunks; ++index)
        {
            auto it = received.find(index);
            if (it == received.end() || it->second.needs_reupload)
            {
                missing.push_back(index);
            }
        }
        return missing;
    }

    std::vector<std::uint32_t> UploadSession::usable_indices() const
    {
        std::vector<std::uint32_t> indices;
        indices.reserve(received.size());
        for (const auto &[index, record] : received)
        {
            if (!record.needs_reupload)
            {
                indices.push_back(index);
            }
        }
        return indices;
    }

    bool UploadSession::covers_all_chunks() const
    {
        return usable_indices().size() == expected_total_chunks;
    }

    LocalSessionRegistry::LocalSessionRegistry(RegistryOptions options) : options_(std::move(options))
    {
        if (!options_.clock)
        {
            options_.clock = []
            { return std::chrono::system_clock::now(); };
        }
        if (options_.journal_dir)
        {
            std::filesystem::create_directories(*options_.journal_dir);
            load_existing();
        }
    }

    UploadSession LocalSessionRegistry::create_or_get(const SessionDescriptor &descriptor)
    {
        if (!blob_keys::is_safe_segment(descriptor.file_id))
        {
            throw UploadError(chunkvault::ErrorCode::ValidationError, "Invalid file id");
        }
        if (descriptor.total_chunks == 0)
        {
            throw UploadError(chunkvault::ErrorCode::ValidationError, "total_chunks must be positive");
        }

        std::lock_guard lock(mutex_);
        if (auto it = sessions_.find(descriptor.file_id); it != sessions_.end())
        {
            const auto &existing = it->second;
            if (existing.owner_id != descriptor.owner_id)
            {
                throw not_found(descriptor.file_id);
            }
            if (existing.expected_total_chunks != descriptor.total_chunks)
            {
                throw UploadError(chunkvault::ErrorCode::ValidationError,
                                  "Upload " + descriptor.file_id + " expects " +
                                      std::to_string(existing.expected_total_chunks) + " chunks, not " +
                                      std::to_string(descriptor.total_chunks));
            }
            return existing;
        }

        const auto now = options_.clock();
        UploadSession session{};
        session.file_id = descriptor.file_id;
        session.owner_id = descriptor.owner_id;
        session.expected_total_chunks = descriptor.total_chunks;
        session.status = SessionStatus::Initiated;
        session.created_at = now;
        session.last_activity_at = now;
        session.expected_filename = descriptor.filename;
        session.category = descriptor.category;
        if (descriptor.expected_final_checksum)
        {
            session.expected_final_checksum = crypto::normalize_digest(*descriptor.expected_final_checksum);
        }
        commit_locked(session);
        spdlog::info("Registered upload {} for {} ({} chunks, {}/{})", session.file_id, session.owner_id,
                     session.expected_total_chunks, session.category, session.expected_filename);
        return session;
    }

    ChunkOutcome LocalSessionRegistry::check_chunk(const std::string &file_id, std::uint32_t index,
                                                   const std::string &checksum) const
    {
        std::lock_guard lock(mutex_);
        return classify_locked(require_locked(file_id), index, checksum);
    }

    ChunkOutcome LocalSessionRegistry::record_chunk(const std::string &file_id, std::uint32_t index,
                                                    std::uint64_t size, const std::string &checksum)
    {
        std::lock_guard lock(mutex_);
        const auto &current = require_locked(file_id);
        const auto outcome = classify_locked(current, index, checksum);
        if (outcome != ChunkOutcome::Accepted)
        {
            return outcome;
        }

        auto updated = current;
        updated.received[index] = ChunkRecord{.size = size, .checksum = crypto::normalize_digest(checksum)};
        updated.last_activity_at = options_.clock();
        if (updated.status == SessionStatus::Initiated)
        {
            updated.status = SessionStatus::InProgress;
        }
        if (updated.status == SessionStatus::InProgress && updated.covers_all_chunks())
        {
            updated.status = SessionStatus::CompletePendingMerge;
        }
        commit_locked(std::move(updated));
        return outcome;
    }

    std::optional<UploadSession> LocalSessionRegistry::find(const std::string &file_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(file_id);
        if (it != sessions_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    UploadSession LocalSessionRegistry::transition(const std::string &file_id, SessionStatus next)
    {
        std::lock_guard lock(mutex_);
        const auto &current = require_locked(file_id);
        if (current.status == next)
        {
            return current;
        }
        if (!is_valid_transition(current.status, next))
        {
            throw UploadError(chunkvault::ErrorCode::SessionStateConflict,
                              "Upload " + file_id + " cannot move from " + std::string(to_string(current.status)) +
                                  " to " + std::string(to_string(next)));
        }
        auto updated = current;
        updated.status = next;
        updated.last_activity_at = options_.clock();
        commit_locked(updated);
        return updated;
    }

    UploadSession LocalSessionRegistry::mark_merged(const std::string &file_id, const std::string &final_checksum,
                                                    const std::string &final_key, std::uint64_t final_size)
    {
        std::lock_guard lock(mutex_);
        const auto &current = require_locked(file_id);
        if (!is_valid_transition(current.status, SessionStatus::Merged))
        {
            throw UploadError(chunkvault::ErrorCode::SessionStateConflict,
                              "Upload " + file_id + " cannot be merged from " +
                                  std::string(to_string(current.status)));
        }
        auto updated = current;
        updated.status = SessionStatus::Merged;
        updated.final_checksum = final_checksum;
        updated.final_key = final_key;
        updated.final_size = final_size;
        updated.last_activity_at = options_.clock();
        commit_locked(updated);
        return updated;
    }

    void LocalSessionRegistry::flag_for_reupload(const std::string &file_id, std::uint32_t index)
    {
        std::lock_guard lock(mutex_);
        const auto &current = require_locked(file_id);
        auto it = current.received.find(index);
        if (it == current.received.end() || it->second.needs_reupload)
        {
            return;
        }
        auto updated = current;
        updated.received[index].needs_reupload = true;
        commit_locked(std::move(updated));
    }

    void LocalSessionRegistry::erase(const std::string &file_id)
    {
        std::lock_guard lock(mutex_);
        if (sessions_.find(file_id) == sessions_.end())
        {
            return;
        }
        remove_state(file_id);
        sessions_.erase(file_id);
    }

    std::vector<UploadSession> LocalSessionRegistry::list() const
    {
        std::lock_guard lock(mutex_);
        std::vector<UploadSession> result;
        result.reserve(sessions_.size());
        for (const auto &[file_id, session] : sessions_)
        {
            result.push_back(session);
        }
        return result;
    }

    const UploadSession &LocalSessionRegistry::require_locked(const std::string &file_id) const
    {
        auto it = sessions_.find(file_id);
        if (it == sessions_.end())
        {
            throw not_found(file_id);
        }
        return it->second;
    }

    ChunkOutcome LocalSessionRegistry::classify_locked(const UploadSession &session, std::uint32_t index,
                                                       const std::string &checksum) const
    {
        if (index >= session.expected_total_chunks)
        {
            throw UploadError(chunkvault::ErrorCode::ValidationError,
                              "Chunk index " + std::to_string(index) + " outside [0, " +
                                  std::to_string(session.expected_total_chunks) + ")");
        }
        if (!accepts_writes(session.status))
        {
            return ChunkOutcome::SessionClosed;
        }
        auto it = session.received.find(index);
        if (it == session.received.end())
        {
            return ChunkOutcome::Accepted;
        }
        const bool same_checksum = crypto::digests_equal(it->second.checksum, checksum);
        if (it->second.needs_reupload && same_checksum)
        {
            return ChunkOutcome::Accepted;
        }
        if (same_checksum)
        {
            return ChunkOutcome::DuplicateIgnored;
        }
        if (options_.conflict_policy == ConflictPolicy::OverwriteWhileInProgress &&
            (session.status == SessionStatus::Initiated || session.status == SessionStatus::InProgress))
        {
            return ChunkOutcome::Accepted;
        }
        return ChunkOutcome::ChecksumConflict;
    }

    void LocalSessionRegistry::commit_locked(UploadSession updated)
    {
        // Journal first so a failed write leaves the in-memory state untouched.
        persist_state(updated);
        auto file_id = updated.file_id;
        sessions_.insert_or_assign(std::move(file_id), std::move(updated));
    }

    void LocalSessionRegistry::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(*options_.journal_dir))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            try
            {
                std::ifstream in(entry.path());
                if (!in.is_open())
                {
                    spdlog::warn("Skipping unreadable session journal {}", entry.path().string());
                    continue;
                }
                nlohmann::json json;
                in >> json;
                auto session = session_from_json(json);
                auto file_id = session.file_id;
                sessions_[file_id] = std::move(session);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Skipping corrupt session journal {}: {}", entry.path().string(), ex.what());
            }
        }
        spdlog::info("Loaded {} upload session(s) from {}", sessions_.size(), options_.journal_dir->string());
    }

    std::filesystem::path LocalSessionRegistry::journal_path(const std::string &file_id) const
    {
        return *options_.journal_dir / (file_id + ".json");
    }

    void LocalSessionRegistry::persist_state(const UploadSession &session) const
    {
        if (!options_.journal_dir)
        {
            return;
        }
        const auto path = journal_path(session.file_id);
        auto temp = path;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            out << to_json(session).dump(2);
            out.flush();
            if (!out)
            {
                throw StorageError("Failed to journal upload " + session.file_id);
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp, path, ec);
        if (ec)
        {
            throw StorageError("Failed to journal upload " + session.file_id + ": " + ec.message());
        }
    }

    void LocalSessionRegistry::remove_state(const std::string &file_id) const
    {
        if (!options_.journal_dir)
        {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(journal_path(file_id), ec);
        if (ec)
        {
            throw StorageError("Failed to drop journal for upload " + file_id + ": " + ec.message());
        }
    }

} // namespace chunkvault::server
