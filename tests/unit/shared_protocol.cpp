#include <algorithm>
#include <array>
#include <cctype>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/crypto.hpp"
#include "chunkvault/encoding/base64.hpp"
#include "chunkvault/error_codes.hpp"
#include "chunkvault/framing.hpp"
#include "chunkvault/protocol.hpp"
#include "chunkvault/upload_state.hpp"

using namespace chunkvault;
using namespace chunkvault::protocol;

void run_server_component_tests();
void run_merge_and_sweep_tests();
void run_request_dispatch_tests();
void run_client_plan_tests();

namespace
{

    constexpr const char *kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    constexpr const char *kEmptyDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    std::span<const std::byte> as_bytes(const std::string &text)
    {
        return std::as_bytes(std::span<const char>(text.data(), text.size()));
    }

    void test_request_roundtrip()
    {
        UploadChunkRequest chunk{
            .file_id = "a1b2_1700000000",
            .index = 2,
            .total_chunks = 3,
            .filename = "report.pdf",
            .category = "documents",
            .checksum = kAbcDigest,
            .data_base64 = "YWJj",
        };
        RequestEnvelope envelope{};
        envelope.command = Command::UploadChunk;
        envelope.payload = chunk;
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "UPLOAD_CHUNK");
        assert(json.at("payload").at("chunk_index") == 2);
        assert(json.at("payload").at("data") == "YWJj");
        assert(!json.at("payload").contains("final_checksum"));

        const auto decoded = json.get<RequestEnvelope>();
        assert(decoded.command == Command::UploadChunk);
        assert(decoded.request_id == envelope.request_id);
        const auto decoded_chunk = decoded.payload.get<UploadChunkRequest>();
        assert(decoded_chunk.file_id == chunk.file_id);
        assert(decoded_chunk.index == 2);
        assert(decoded_chunk.category == "documents");
        assert(!decoded_chunk.final_checksum.has_value());
    }

    void test_unknown_command_rejected()
    {
        const auto json = nlohmann::json{{"cmd", "DELETE_EVERYTHING"}, {"payload", nlohmann::json::object()}};
        bool caught = false;
        try
        {
            (void)json.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);
        assert(!command_from_string("upload_chunk").has_value());
        assert(command_from_string("UPLOAD_MERGE") == Command::UploadMerge);
    }

    void test_category_defaults_to_general()
    {
        const auto json = nlohmann::json{
            {"file_id", "f1"},
            {"total_chunks", 1},
            {"filename", "a.txt"},
        };
        const auto request = json.get<RegisterUploadRequest>();
        assert(request.category == "general");
        assert(!request.final_checksum.has_value());
    }

    void test_response_roundtrip()
    {
        UploadStatusResponse status{
            .exists = true,
            .file_id = "f1",
            .status = "IN_PROGRESS",
            .received_chunks = {0, 2},
            .total_chunks = 3,
            .progress = format_progress(2, 3),
        };
        assert(status.progress == "2/3");

        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Ok;
        envelope.payload = status;
        envelope.request_id = std::string("7");

        const auto decoded = nlohmann::json(envelope).get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Ok);
        assert(decoded.error == ErrorCode::Ok);
        const auto decoded_status = decoded.payload.get<UploadStatusResponse>();
        assert(decoded_status.exists);
        assert(decoded_status.received_chunks == status.received_chunks);
        assert(decoded_status.progress == "2/3");

        ResponseEnvelope failure{};
        failure.kind = ResponseKind::Error;
        failure.error = ErrorCode::IncompleteUpload;
        failure.message = "missing chunks";
        failure.payload = nlohmann::json{{"missing_chunks", {1}}};
        const auto decoded_failure = nlohmann::json(failure).get<ResponseEnvelope>();
        assert(decoded_failure.kind == ResponseKind::Error);
        assert(decoded_failure.error == ErrorCode::IncompleteUpload);
        assert(decoded_failure.payload.at("missing_chunks").at(0) == 1);
    }

    void test_error_codes()
    {
        for (std::uint16_t value = 0; value <= to_int(ErrorCode::InternalError); ++value)
        {
            assert(to_int(error_code_from_int(value)) == value);
        }
        assert(error_code_from_int(9999) == ErrorCode::InternalError);
        assert(!to_string(ErrorCode::ChunkCorrupted).empty());
    }

    void test_framing()
    {
        const nlohmann::json message{{"cmd", "PING"}, {"payload", nlohmann::json::object()}};
        const auto frame = encode_frame(message);
        assert(frame.size() > kFrameHeaderSize);

        // A partial frame is not decoded.
        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial.has_value());

        const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        assert(decoded->message == message);

        std::array<std::uint8_t, kFrameHeaderSize> header{};
        std::copy(frame.begin(), frame.begin() + kFrameHeaderSize, header.begin());
        assert(decode_frame_header(header) == frame.size() - kFrameHeaderSize);

        const std::array<std::uint8_t, kFrameHeaderSize> oversized{0xFF, 0xFF, 0xFF, 0xFF};
        bool caught = false;
        try
        {
            (void)decode_frame_header(oversized);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_base64()
    {
        const std::string text = "chunked upload";
        const auto encoded = encoding::encode_base64(as_bytes(text));
        assert(encoded == "Y2h1bmtlZCB1cGxvYWQ=");
        const auto decoded = encoding::decode_base64(encoded);
        assert(decoded.has_value());
        assert(std::string(reinterpret_cast<const char *>(decoded->data()), decoded->size()) == text);

        assert(encoding::encode_base64({}).empty());
        assert(!encoding::decode_base64("not*base64").has_value());
    }

    void test_sha256()
    {
        assert(crypto::sha256_hex(std::string_view("abc")) == kAbcDigest);
        assert(crypto::sha256_hex(std::string_view("")) == kEmptyDigest);

        const std::string first = "ab";
        const std::string second = "c";
        assert(crypto::sha256_hex(std::vector<std::span<const std::byte>>{as_bytes(first), as_bytes(second)}) ==
               kAbcDigest);

        crypto::Sha256Stream stream;
        stream.update(as_bytes(first));
        stream.update(as_bytes(second));
        assert(stream.bytes_consumed() == 3);
        assert(stream.finish() == kAbcDigest);
        bool caught = false;
        try
        {
            stream.update(as_bytes(first));
        }
        catch (const std::logic_error &)
        {
            caught = true;
        }
        assert(caught);

        std::istringstream input("abc");
        assert(crypto::hash_stream(input) == kAbcDigest);

        const auto file_path = std::filesystem::temp_directory_path() / "chunkvault_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file << "abc";
        }
        assert(crypto::hash_file(file_path) == kAbcDigest);
        std::filesystem::remove(file_path);

        assert(crypto::is_sha256_hex(kAbcDigest));
        assert(!crypto::is_sha256_hex("abc"));
        assert(!crypto::is_sha256_hex(std::string(64, 'g')));
        std::string upper = kAbcDigest;
        for (auto &ch : upper)
        {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        assert(crypto::is_sha256_hex(upper));
        assert(crypto::digests_equal(upper, kAbcDigest));
        assert(crypto::normalize_digest(upper) == kAbcDigest);
        assert(!crypto::digests_equal(kAbcDigest, kEmptyDigest));
    }

    void test_session_transitions()
    {
        assert(is_valid_transition(SessionStatus::Initiated, SessionStatus::InProgress));
        assert(is_valid_transition(SessionStatus::InProgress, SessionStatus::CompletePendingMerge));
        assert(is_valid_transition(SessionStatus::CompletePendingMerge, SessionStatus::Merged));
        assert(is_valid_transition(SessionStatus::InProgress, SessionStatus::Failed));
        assert(is_valid_transition(SessionStatus::Failed, SessionStatus::Expired));
        assert(is_valid_transition(SessionStatus::Initiated, SessionStatus::Expired));

        assert(!is_valid_transition(SessionStatus::Merged, SessionStatus::InProgress));
        assert(!is_valid_transition(SessionStatus::Merged, SessionStatus::Expired));
        assert(!is_valid_transition(SessionStatus::Expired, SessionStatus::InProgress));
        assert(!is_valid_transition(SessionStatus::Initiated, SessionStatus::Merged));
        assert(!is_valid_transition(SessionStatus::CompletePendingMerge, SessionStatus::InProgress));

        assert(accepts_writes(SessionStatus::CompletePendingMerge));
        assert(!accepts_writes(SessionStatus::Merged));
        assert(!accepts_writes(SessionStatus::Failed));

        assert(to_string(SessionStatus::CompletePendingMerge) == "COMPLETE_PENDING_MERGE");
        assert(session_status_from_string("EXPIRED") == SessionStatus::Expired);
        assert(!session_status_from_string("DONE").has_value());
        assert(chunk_outcome_from_string(to_string(ChunkOutcome::DuplicateIgnored)) == ChunkOutcome::DuplicateIgnored);
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_unknown_command_rejected();
        test_category_defaults_to_general();
        test_response_roundtrip();
        test_error_codes();
        test_framing();
        test_base64();
        test_sha256();
        test_session_transitions();
        run_server_component_tests();
        run_merge_and_sweep_tests();
        run_request_dispatch_tests();
        run_client_plan_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
