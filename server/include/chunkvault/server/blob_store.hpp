#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault::server
{

    // Key-addressed byte storage. Keys are '/'-separated relative names; every
    // operation reports failures by throwing StorageError.
    class BlobStore
    {
    public:
        virtual ~BlobStore() = default;

        // Replaces the blob; readers observe either the old or the new content.
        virtual void put(const std::string &key, std::span<const std::byte> data) = 0;

        virtual void append(const std::string &key, std::span<const std::byte> data) = 0;

        virtual std::optional<std::vector<std::byte>> get(const std::string &key) const = 0;

        virtual std::optional<std::uint64_t> size(const std::string &key) const = 0;

        // Removing a missing key is not an error.
        virtual void remove(const std::string &key) = 0;

        virtual std::vector<std::string> list(const std::string &prefix) const = 0;

        // Moves temp_key onto final_key atomically, replacing any existing blob.
        virtual void publish(const std::string &temp_key, const std::string &final_key) = 0;

        // Location reported to callers for a published blob.
        virtual std::string locate(const std::string &key) const = 0;

        bool exists(const std::string &key) const { return size(key).has_value(); }
    };

    class FilesystemBlobStore : public BlobStore
    {
    public:
        explicit FilesystemBlobStore(std::filesystem::path root);

        void put(const std::string &key, std::span<const std::byte> data) override;
        void append(const std::string &key, std::span<const std::byte> data) override;
        std::optional<std::vector<std::byte>> get(const std::string &key) const override;
        std::optional<std::uint64_t> size(const std::string &key) const override;
        void remove(const std::string &key) override;
        std::vector<std::string> list(const std::string &prefix) const override;
        void publish(const std::string &temp_key, const std::string &final_key) override;
        std::string locate(const std::string &key) const override;

        const std::filesystem::path &root() const noexcept { return root_; }

    private:
        std::filesystem::path resolve(const std::string &key) const;

        std::filesystem::path root_;
    };

    class MemoryBlobStore : public BlobStore
    {
    public:
        void put(const std::string &key, std::span<const std::byte> data) override;
        void append(const std::string &key, std::span<const std::byte> data) override;
        std::optional<std::vector<std::byte>> get(const std::string &key) const override;
        std::optional<std::uint64_t> size(const std::string &key) const override;
        void remove(const std::string &key) override;
        std::vector<std::string> list(const std::string &prefix) const override;
        void publish(const std::string &temp_key, const std::string &final_key) override;
        std::string locate(const std::string &key) const override;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::vector<std::byte>> blobs_;
    };

    namespace blob_keys
    {

        // A segment may not be empty, '.', '..', or contain separators or control characters.
        bool is_safe_segment(std::string_view segment) noexcept;

        std::string chunk_prefix(const std::string &file_id);
        std::string chunk_key(const std::string &file_id, std::uint32_t index);
        std::string staging_key(const std::string &file_id);
        std::string artifact_key(const std::string &category, const std::string &filename);

        inline constexpr std::string_view kStagingPrefix = "staging/";

    } // namespace blob_keys

} // namespace chunkvault::server
