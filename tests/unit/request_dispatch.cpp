#include <cassert>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/crypto.hpp"
#include "chunkvault/encoding/base64.hpp"
#include "chunkvault/protocol.hpp"
#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/request_dispatcher.hpp"
#include "chunkvault/server/session_registry.hpp"
#include "chunkvault/server/upload_service.hpp"

using namespace chunkvault;
using namespace chunkvault::protocol;
using namespace chunkvault::server;

namespace
{

    using namespace std::chrono_literals;

    struct Backend
    {
        Backend() : registry(RegistryOptions{}), service(registry, blobs) {}

        ServerServices services() { return ServerServices{service, 24h}; }

        MemoryBlobStore blobs;
        LocalSessionRegistry registry;
        UploadService service;
    };

    RequestEnvelope request(Command command, nlohmann::json payload)
    {
        RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = std::move(payload);
        envelope.request_id = "r1";
        return envelope;
    }

    RequestEnvelope identify(const std::string &owner)
    {
        return request(Command::Identify, IdentifyRequest{.owner_id = owner});
    }

    RequestEnvelope chunk_request(const std::string &file_id, std::uint32_t index, std::uint32_t total,
                                  const std::vector<std::byte> &data)
    {
        return request(Command::UploadChunk, UploadChunkRequest{
                                                 .file_id = file_id,
                                                 .index = index,
                                                 .total_chunks = total,
                                                 .filename = file_id + ".bin",
                                                 .category = "general",
                                                 .checksum = crypto::sha256_hex(data),
                                                 .data_base64 = encoding::encode_base64(data),
                                             });
    }

    RequestEnvelope file_request(Command command, const std::string &file_id)
    {
        return request(command, FileIdRequest{.file_id = file_id});
    }

    std::vector<std::byte> bytes(std::size_t size, unsigned seed)
    {
        std::vector<std::byte> out(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            out[i] = static_cast<std::byte>((i * 7 + seed) & 0xFF);
        }
        return out;
    }

    bool is_error(const ResponseEnvelope &response, ErrorCode code)
    {
        return response.kind == ResponseKind::Error && response.error == code;
    }

    void test_identity_required()
    {
        Backend backend;
        RequestDispatcher anonymous(backend.services(), "test");

        const std::vector<RequestEnvelope> upload_commands{
            request(Command::RegisterUpload, RegisterUploadRequest{.file_id = "f1",
                                                                   .total_chunks = 1,
                                                                   .filename = "f1.bin",
                                                                   .category = "general"}),
            chunk_request("f1", 0, 1, bytes(8, 1)),
            file_request(Command::UploadStatus, "f1"),
            file_request(Command::UploadMerge, "f1"),
            request(Command::UploadCleanup, CleanupRequest{}),
        };
        for (const auto &envelope : upload_commands)
        {
            const auto response = anonymous.dispatch(envelope);
            assert(is_error(response, ErrorCode::AuthenticationRequired));
            assert(response.request_id == envelope.request_id);
        }
        assert(backend.registry.list().empty());

        const auto ping = anonymous.dispatch(request(Command::Ping, nlohmann::json::object()));
        assert(ping.kind == ResponseKind::Ok);

        const auto empty_owner = anonymous.dispatch(identify(""));
        assert(is_error(empty_owner, ErrorCode::InvalidPayload));
        assert(!anonymous.owner_id());

        assert(anonymous.dispatch(identify("alice")).kind == ResponseKind::Ok);
        assert(anonymous.owner_id() == "alice");
        const auto status = anonymous.dispatch(file_request(Command::UploadStatus, "f1"));
        assert(status.kind == ResponseKind::Ok);
        assert(!status.payload.get<UploadStatusResponse>().exists);
    }

    void test_owner_isolation()
    {
        Backend backend;
        RequestDispatcher alice(backend.services(), "alice-conn");
        RequestDispatcher bob(backend.services(), "bob-conn");
        assert(alice.dispatch(identify("alice")).kind == ResponseKind::Ok);
        assert(bob.dispatch(identify("bob")).kind == ResponseKind::Ok);

        const auto data = bytes(16, 2);
        const auto accepted = alice.dispatch(chunk_request("shared", 0, 1, data));
        assert(accepted.kind == ResponseKind::Ok);
        assert(accepted.payload.get<UploadChunkResponse>().outcome == "ACCEPTED");

        const auto own = alice.dispatch(file_request(Command::UploadStatus, "shared")).payload.get<UploadStatusResponse>();
        assert(own.exists);
        assert(own.total_chunks == 1);
        assert((own.received_chunks == std::vector<std::uint32_t>{0}));

        const auto foreign_status = bob.dispatch(file_request(Command::UploadStatus, "shared"));
        assert(foreign_status.kind == ResponseKind::Ok);
        const auto foreign = foreign_status.payload.get<UploadStatusResponse>();
        assert(!foreign.exists);
        assert(foreign.received_chunks.empty());
        assert(foreign.progress == "0/0");

        assert(is_error(bob.dispatch(file_request(Command::UploadMerge, "shared")), ErrorCode::SessionNotFound));
        assert(is_error(bob.dispatch(chunk_request("shared", 0, 1, data)), ErrorCode::SessionNotFound));
        assert(backend.service.upload_status("shared").status == SessionStatus::CompletePendingMerge);

        const auto merged = alice.dispatch(file_request(Command::UploadMerge, "shared"));
        assert(merged.kind == ResponseKind::Ok);
        assert(merged.payload.get<MergeResponse>().final_checksum == crypto::sha256_hex(data));
        assert(merged.payload.get<MergeResponse>().size == data.size());
    }

    void test_outcome_mapping()
    {
        assert(outcome_error(ChunkOutcome::Accepted) == std::nullopt);
        assert(outcome_error(ChunkOutcome::DuplicateIgnored) == std::nullopt);
        assert(outcome_error(ChunkOutcome::ChecksumConflict) == ErrorCode::ChecksumConflict);
        assert(outcome_error(ChunkOutcome::SessionClosed) == ErrorCode::SessionStateConflict);

        Backend backend;
        RequestDispatcher alice(backend.services(), "alice-conn");
        alice.dispatch(identify("alice"));
        const auto data = bytes(16, 3);
        assert(alice.dispatch(chunk_request("f1", 0, 1, data)).kind == ResponseKind::Ok);

        const auto duplicate = alice.dispatch(chunk_request("f1", 0, 1, data));
        assert(duplicate.kind == ResponseKind::Ok);
        assert(duplicate.payload.get<UploadChunkResponse>().outcome == "DUPLICATE_IGNORED");

        auto tampered = chunk_request("f1", 0, 1, data);
        tampered.payload["checksum"] = crypto::sha256_hex(bytes(16, 4));
        const auto conflict = alice.dispatch(tampered);
        assert(is_error(conflict, ErrorCode::ChecksumConflict));
        assert(conflict.payload.at("chunk_index") == 0);

        assert(alice.dispatch(file_request(Command::UploadMerge, "f1")).kind == ResponseKind::Ok);
        const auto closed = alice.dispatch(chunk_request("f1", 0, 1, data));
        assert(is_error(closed, ErrorCode::SessionStateConflict));
    }

    void test_error_details()
    {
        Backend backend;
        RequestDispatcher alice(backend.services(), "alice-conn");
        alice.dispatch(identify("alice"));
        assert(alice.dispatch(chunk_request("f1", 1, 3, bytes(8, 5))).kind == ResponseKind::Ok);

        const auto incomplete = alice.dispatch(file_request(Command::UploadMerge, "f1"));
        assert(is_error(incomplete, ErrorCode::IncompleteUpload));
        assert(incomplete.payload.at("missing_count") == 2);
        assert((incomplete.payload.at("missing_chunks").get<std::vector<std::uint32_t>>() ==
                std::vector<std::uint32_t>{0, 2}));

        const auto oversized = alice.dispatch(request(Command::RegisterUpload,
                                                      RegisterUploadRequest{.file_id = "huge",
                                                                            .total_chunks = 0xFFFFFFFFu,
                                                                            .filename = "huge.bin",
                                                                            .category = "general"}));
        assert(is_error(oversized, ErrorCode::ValidationError));

        auto garbled = chunk_request("f1", 0, 3, bytes(8, 6));
        garbled.payload["data"] = "!!not base64!!";
        assert(is_error(alice.dispatch(garbled), ErrorCode::InvalidPayload));

        const auto malformed = alice.dispatch(request(Command::UploadStatus, nlohmann::json{{"file", 1}}));
        assert(is_error(malformed, ErrorCode::InvalidPayload));
    }

    void test_cleanup_ttl_from_wire()
    {
        Backend backend;
        RequestDispatcher alice(backend.services(), "alice-conn");
        alice.dispatch(identify("alice"));
        assert(alice.dispatch(chunk_request("f1", 0, 2, bytes(8, 7))).kind == ResponseKind::Ok);

        for (const std::uint64_t ttl : {std::numeric_limits<std::uint64_t>::max(), std::uint64_t{10'000'000'000},
                                        std::uint64_t{3600}})
        {
            const auto response = alice.dispatch(request(Command::UploadCleanup, CleanupRequest{.ttl_seconds = ttl}));
            assert(response.kind == ResponseKind::Ok);
            assert(response.payload.get<CleanupResponse>().reclaimed == 0);
        }
        assert(backend.service.upload_status("f1").status == SessionStatus::InProgress);
    }

} // namespace

void run_request_dispatch_tests()
{
    test_identity_required();
    test_owner_isolation();
    test_outcome_mapping();
    test_error_details();
    test_cleanup_ttl_from_wire();
}
