#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/errors.hpp"
#include "chunkvault/server/lock_table.hpp"
#include "chunkvault/server/session_registry.hpp"

using namespace chunkvault;
using namespace chunkvault::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::vector<std::byte> bytes_of(const std::string &text)
    {
        std::vector<std::byte> out;
        for (const char ch : text)
        {
            out.push_back(static_cast<std::byte>(ch));
        }
        return out;
    }

    template <typename Fn>
    std::optional<ErrorCode> upload_error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const UploadError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    SessionDescriptor descriptor(const std::string &file_id, std::uint32_t total, const std::string &owner = "alice")
    {
        return SessionDescriptor{
            .file_id = file_id,
            .owner_id = owner,
            .total_chunks = total,
            .filename = "data.bin",
            .category = "general",
        };
    }

    void exercise_blob_store(BlobStore &store)
    {
        const auto key = blob_keys::chunk_key("f1", 0);
        assert(key == "chunks/f1/0.part");
        assert(!store.exists(key));
        assert(!store.get(key).has_value());

        store.put(key, bytes_of("first"));
        assert(store.size(key) == 5u);
        store.put(key, bytes_of("second!"));
        assert(*store.get(key) == bytes_of("second!"));

        store.put(blob_keys::chunk_key("f1", 1), bytes_of("x"));
        store.put(blob_keys::chunk_key("f2", 0), bytes_of("y"));
        const auto listed = store.list(blob_keys::chunk_prefix("f1"));
        assert((listed == std::vector<std::string>{"chunks/f1/0.part", "chunks/f1/1.part"}));

        const auto staging = blob_keys::staging_key("f1");
        store.append(staging, bytes_of("ab"));
        store.append(staging, bytes_of("cd"));
        assert(*store.get(staging) == bytes_of("abcd"));

        const auto artifact = blob_keys::artifact_key("docs", "out.txt");
        store.publish(staging, artifact);
        assert(!store.exists(staging));
        assert(*store.get(artifact) == bytes_of("abcd"));
        assert(!store.locate(artifact).empty());

        store.remove(key);
        store.remove(key);
        assert(!store.exists(key));

        bool caught = false;
        try
        {
            store.put("chunks/../escape", bytes_of("z"));
        }
        catch (const StorageError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::StorageIOError);
        }
        assert(caught);

        caught = false;
        try
        {
            store.publish(blob_keys::staging_key("missing"), artifact);
        }
        catch (const StorageError &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_memory_blob_store()
    {
        MemoryBlobStore store;
        exercise_blob_store(store);
        assert(store.locate("files/a/b") == "mem://files/a/b");
    }

    void test_filesystem_blob_store()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_blob_test";
        cleanup_path(root);
        {
            FilesystemBlobStore store(root);
            exercise_blob_store(store);
            assert(store.locate("files/docs/out.txt") == (root / "files" / "docs" / "out.txt").string());

            // Emptied per-upload directories are pruned, the namespace directory stays.
            store.remove(blob_keys::chunk_key("f1", 1));
            store.remove(blob_keys::chunk_key("f2", 0));
            assert(!std::filesystem::exists(root / "chunks" / "f1"));
            assert(std::filesystem::exists(root / "chunks"));
        }
        cleanup_path(root);
    }

    void test_blob_key_segments()
    {
        assert(blob_keys::is_safe_segment("report.pdf"));
        assert(blob_keys::is_safe_segment("a1b2_1700000000"));
        assert(!blob_keys::is_safe_segment(""));
        assert(!blob_keys::is_safe_segment(".."));
        assert(!blob_keys::is_safe_segment("a/b"));
        assert(!blob_keys::is_safe_segment("a\\b"));
        assert(!blob_keys::is_safe_segment(std::string("a\nb")));
        assert(blob_keys::staging_key("f1") == "staging/f1.merging");
        assert(blob_keys::artifact_key("general", "x.bin") == "files/general/x.bin");
    }

    void test_registry_lifecycle()
    {
        LocalSessionRegistry registry;
        const auto created = registry.create_or_get(descriptor("f1", 3));
        assert(created.status == SessionStatus::Initiated);
        assert(created.received.empty());
        assert((created.missing_indices() == std::vector<std::uint32_t>{0, 1, 2}));

        const auto sum0 = crypto::sha256_hex(std::string_view("zero"));
        const auto sum1 = crypto::sha256_hex(std::string_view("one"));
        const auto sum2 = crypto::sha256_hex(std::string_view("two"));

        assert(registry.check_chunk("f1", 0, sum0) == ChunkOutcome::Accepted);
        assert(registry.record_chunk("f1", 0, 4, sum0) == ChunkOutcome::Accepted);
        assert(registry.find("f1")->status == SessionStatus::InProgress);

        // Idempotent re-delivery changes nothing.
        assert(registry.record_chunk("f1", 0, 4, sum0) == ChunkOutcome::DuplicateIgnored);
        assert(registry.find("f1")->received.size() == 1);

        // A different checksum at a filled index is a conflict and keeps the original.
        assert(registry.record_chunk("f1", 0, 3, sum1) == ChunkOutcome::ChecksumConflict);
        assert(registry.find("f1")->received.at(0).checksum == sum0);

        assert(upload_error_of([&]
                               { (void)registry.record_chunk("f1", 3, 1, sum0); }) == ErrorCode::ValidationError);

        registry.record_chunk("f1", 2, 3, sum2);
        assert(registry.find("f1")->status == SessionStatus::InProgress);
        registry.record_chunk("f1", 1, 3, sum1);
        const auto complete = *registry.find("f1");
        assert(complete.status == SessionStatus::CompletePendingMerge);
        assert(complete.covers_all_chunks());
        assert((complete.usable_indices() == std::vector<std::uint32_t>{0, 1, 2}));

        // Existing session: creation is idempotent.
        const auto again = registry.create_or_get(descriptor("f1", 3));
        assert(again.status == SessionStatus::CompletePendingMerge);
        assert(again.received.size() == 3);

        const auto merged = registry.mark_merged("f1", sum0, "files/general/data.bin", 11);
        assert(merged.status == SessionStatus::Merged);
        assert(merged.final_size == 11);
        assert(registry.record_chunk("f1", 0, 4, sum0) == ChunkOutcome::SessionClosed);
        assert(upload_error_of([&]
                               { (void)registry.transition("f1", SessionStatus::Expired); }) ==
               ErrorCode::SessionStateConflict);

        registry.erase("f1");
        assert(!registry.find("f1").has_value());
        assert(upload_error_of([&]
                               { (void)registry.check_chunk("f1", 0, sum0); }) == ErrorCode::SessionNotFound);
    }

    void test_registry_descriptor_checks()
    {
        LocalSessionRegistry registry;
        registry.create_or_get(descriptor("shared", 2, "alice"));
        assert(upload_error_of([&]
                               { (void)registry.create_or_get(descriptor("shared", 2, "bob")); }) ==
               ErrorCode::SessionNotFound);
        assert(upload_error_of([&]
                               { (void)registry.create_or_get(descriptor("shared", 5, "alice")); }) ==
               ErrorCode::ValidationError);
        assert(upload_error_of([&]
                               { (void)registry.create_or_get(descriptor("zero", 0)); }) ==
               ErrorCode::ValidationError);
        assert(upload_error_of([&]
                               { (void)registry.create_or_get(descriptor("../x", 1)); }) ==
               ErrorCode::ValidationError);
    }

    void test_registry_overwrite_policy()
    {
        LocalSessionRegistry registry(RegistryOptions{.conflict_policy = ConflictPolicy::OverwriteWhileInProgress});
        registry.create_or_get(descriptor("f1", 2));
        const auto old_sum = crypto::sha256_hex(std::string_view("old"));
        const auto new_sum = crypto::sha256_hex(std::string_view("new!"));
        registry.record_chunk("f1", 0, 3, old_sum);
        assert(registry.record_chunk("f1", 0, 4, new_sum) == ChunkOutcome::Accepted);
        assert(registry.find("f1")->received.at(0).checksum == new_sum);
        assert(registry.find("f1")->received.at(0).size == 4);

        // Once all chunks are present the session no longer allows replacement.
        registry.record_chunk("f1", 1, 3, old_sum);
        assert(registry.find("f1")->status == SessionStatus::CompletePendingMerge);
        assert(registry.record_chunk("f1", 1, 4, new_sum) == ChunkOutcome::ChecksumConflict);
    }

    void test_registry_reupload_flag()
    {
        LocalSessionRegistry registry;
        registry.create_or_get(descriptor("f1", 2));
        const auto sum = crypto::sha256_hex(std::string_view("chunk"));
        registry.record_chunk("f1", 0, 5, sum);
        registry.record_chunk("f1", 1, 5, sum);

        registry.flag_for_reupload("f1", 1);
        const auto flagged = *registry.find("f1");
        assert((flagged.missing_indices() == std::vector<std::uint32_t>{1}));
        assert((flagged.usable_indices() == std::vector<std::uint32_t>{0}));
        assert(!flagged.covers_all_chunks());

        assert(registry.record_chunk("f1", 1, 5, sum) == ChunkOutcome::Accepted);
        assert(registry.find("f1")->missing_indices().empty());
    }

    void test_registry_journal_reload()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_journal_test";
        cleanup_path(root);
        const auto sum = crypto::sha256_hex(std::string_view("chunk"));
        const auto final_sum = crypto::sha256_hex(std::string_view("whole"));
        {
            LocalSessionRegistry registry(RegistryOptions{.journal_dir = root});
            auto request = descriptor("f1", 2);
            request.expected_final_checksum = final_sum;
            registry.create_or_get(request);
            registry.record_chunk("f1", 1, 5, sum);
            registry.create_or_get(descriptor("gone", 1));
            registry.erase("gone");
        }
        assert(std::filesystem::exists(root / "f1.json"));
        assert(!std::filesystem::exists(root / "gone.json"));
        {
            std::ofstream junk(root / "broken.json");
            junk << "{ not json";
        }
        {
            LocalSessionRegistry registry(RegistryOptions{.journal_dir = root});
            const auto restored = registry.find("f1");
            assert(restored.has_value());
            assert(restored->status == SessionStatus::InProgress);
            assert(restored->owner_id == "alice");
            assert(restored->received.size() == 1);
            assert(restored->received.at(1).checksum == sum);
            assert(restored->expected_final_checksum == final_sum);
            assert(registry.list().size() == 1);
            assert(registry.record_chunk("f1", 1, 5, sum) == ChunkOutcome::DuplicateIgnored);
        }
        cleanup_path(root);
    }

    void test_registry_clock()
    {
        auto now = std::chrono::system_clock::time_point{} + std::chrono::hours{1000};
        LocalSessionRegistry registry(RegistryOptions{.clock = [&now]
                                                      { return now; }});
        registry.create_or_get(descriptor("f1", 2));
        assert(registry.find("f1")->created_at == now);
        now += std::chrono::minutes{5};
        registry.record_chunk("f1", 0, 1, crypto::sha256_hex(std::string_view("a")));
        const auto session = *registry.find("f1");
        assert(session.last_activity_at == now);
        assert(session.created_at == now - std::chrono::minutes{5});
    }

    void test_lock_table()
    {
        LockTable<std::mutex> table;
        const auto first = table.acquire("a");
        const auto same = table.acquire("a");
        const auto other = table.acquire("b");
        assert(first == same);
        assert(first != other);

        std::unique_lock held(*first);
        std::unique_lock attempt(*same, std::try_to_lock);
        assert(!attempt.owns_lock());
        std::unique_lock independent(*other, std::try_to_lock);
        assert(independent.owns_lock());

        for (int i = 0; i < 200; ++i)
        {
            (void)table.acquire("k" + std::to_string(i));
        }
        // Released entries are pruned; the held ones survive.
        assert(table.size() < 200);
        assert(table.acquire("a") == first);
    }

} // namespace

void run_server_component_tests()
{
    test_memory_blob_store();
    test_filesystem_blob_store();
    test_blob_key_segments();
    test_registry_lifecycle();
    test_registry_descriptor_checks();
    test_registry_overwrite_policy();
    test_registry_reupload_flag();
    test_registry_journal_reload();
    test_registry_clock();
    test_lock_table();
}
