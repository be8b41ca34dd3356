#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkvault/upload_state.hpp"

namespace chunkvault::server
{

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct ChunkRecord
    {
        std::uint64_t size{};
        std::string checksum;
        // Set when a merge found the stored bytes no longer match the checksum.
        bool needs_reupload{};
    };

    struct UploadSession
    {
        std::string file_id;
        std::string owner_id;
        std::uint32_t expected_total_chunks{};
        std::map<std::uint32_t, ChunkRecord> received;
        SessionStatus status{SessionStatus::Initiated};
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point last_activity_at{};
        std::string expected_filename;
        std::string category;
        std::optional<std::string> expected_final_checksum;
        std::optional<std::string> final_checksum;
        std::optional<std::string> final_key;
        std::uint64_t final_size{};

        // Indices in [0, expected_total_chunks) without a usable chunk.
        std::vector<std::uint32_t> missing_indices() const;

        // Received indices whose chunk is not awaiting re-upload, ascending.
        std::vector<std::uint32_t> usable_indices() const;

        bool covers_all_chunks() const;
    };

    struct SessionDescriptor
    {
        std::string file_id;
        std::string owner_id;
        std::uint32_t total_chunks{};
        std::string filename;
        std::string category;
        std::optional<std::string> expected_final_checksum;
    };

    enum class ConflictPolicy : std::uint8_t
    {
        Reject,
        // Allow a differing checksum to replace a chunk while the session is
        // Initiated or InProgress.
        OverwriteWhileInProgress
    };

    // Tracks upload sessions. Every operation is atomic with respect to the
    // others; failures surface as UploadError (or StorageError when journaling).
    class SessionRegistry
    {
    public:
        virtual ~SessionRegistry() = default;

        // Returns the existing session for descriptor.file_id or creates it in
        // Initiated status. A session owned by someone else is reported as not found.
        virtual UploadSession create_or_get(const SessionDescriptor &descriptor) = 0;

        // Classifies a write at index without mutating anything.
        virtual ChunkOutcome check_chunk(const std::string &file_id, std::uint32_t index,
                                         const std::string &checksum) const = 0;

        // Records the chunk when check_chunk would report Accepted; otherwise leaves state untouched.
        virtual ChunkOutcome record_chunk(const std::string &file_id, std::uint32_t index, std::uint64_t size,
                                          const std::string &checksum) = 0;

        virtual std::optional<UploadSession> find(const std::string &file_id) const = 0;

        virtual UploadSession transition(const std::string &file_id, SessionStatus next) = 0;

        virtual UploadSession mark_merged(const std::string &file_id, const std::string &final_checksum,
                                          const std::string &final_key, std::uint64_t final_size) = 0;

        virtual void flag_for_reupload(const std::string &file_id, std::uint32_t index) = 0;

        virtual void erase(const std::string &file_id) = 0;

        virtual std::vector<UploadSession> list() const = 0;
    };

    struct RegistryOptions
    {
        // When set, each session is journaled as JSON in this directory and reloaded on start-up.
        std::optional<std::filesystem::path> journal_dir;
        ConflictPolicy conflict_policy{ConflictPolicy::Reject};
        Clock clock;
    };

    class LocalSessionRegistry : public SessionRegistry
    {
    public:
        explicit LocalSessionRegistry(RegistryOptions options = {});

        UploadSession create_or_get(const SessionDescriptor &descriptor) override;
        ChunkOutcome check_chunk(const std::string &file_id, std::uint32_t index,
                                 const std::string &checksum) const override;
        ChunkOutcome record_chunk(const std::string &file_id, std::uint32_t index, std::uint64_t size,
                                  const std::string &checksum) override;
        std::optional<UploadSession> find(const std::string &file_id) const override;
        UploadSession transition(const std::string &file_id, SessionStatus next) override;
        UploadSession mark_merged(const std::string &file_id, const std::string &final_checksum,
                                  const std::string &final_key, std::uint64_t final_size) override;
        void flag_for_reupload(const std::string &file_id, std::uint32_t index) override;
        void erase(const std::string &file_id) override;
        std::vector<UploadSession> list() const override;

    private:
        const UploadSession &require_locked(const std::string &file_id) const;
        ChunkOutcome classify_locked(const UploadSession &session, std::uint32_t index,
                                     const std::string &checksum) const;
        void commit_locked(UploadSession updated);

        void load_existing();
        std::filesystem::path journal_path(const std::string &file_id) const;
        void persist_state(const UploadSession &session) const;
        void remove_state(const std::string &file_id) const;

        RegistryOptions options_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadSession> sessions_;
    };

} // namespace chunkvault::server
