/**
 * ChunkVault - Shared protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::protocol
{

    enum class Command : std::uint8_t
    {
        Identify,
        RegisterUpload,
        UploadChunk,
        UploadStatus,
        UploadMerge,
        UploadCleanup,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    // The owner id is trusted: it comes from the authentication layer in front of the service.
    struct IdentifyRequest
    {
        std::string owner_id;
    };

    void to_json(nlohmann::json &json, const IdentifyRequest &request);
    void from_json(const nlohmann::json &json, IdentifyRequest &request);

    struct RegisterUploadRequest
    {
        std::string file_id;
        std::uint32_t total_chunks{};
        std::string filename;
        std::string category;
        std::optional<std::string> final_checksum{};
    };

    void to_json(nlohmann::json &json, const RegisterUploadRequest &request);
    void from_json(const nlohmann::json &json, RegisterUploadRequest &request);

    struct UploadChunkRequest
    {
        std::string file_id;
        std::uint32_t index{};
        std::uint32_t total_chunks{};
        std::string filename;
        std::string category;
        std::string checksum;
        std::string data_base64;
        std::optional<std::string> final_checksum{};
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadChunkResponse
    {
        std::string file_id;
        std::uint32_t index{};
        std::string outcome;
        std::string progress;
    };

    void to_json(nlohmann::json &json, const UploadChunkResponse &response);
    void from_json(const nlohmann::json &json, UploadChunkResponse &response);

    struct FileIdRequest
    {
        std::string file_id;
    };

    void to_json(nlohmann::json &json, const FileIdRequest &request);
    void from_json(const nlohmann::json &json, FileIdRequest &request);

    struct UploadStatusResponse
    {
        bool exists{};
        std::string file_id;
        std::string status;
        std::vector<std::uint32_t> received_chunks;
        std::uint32_t total_chunks{};
        std::string progress;
    };

    void to_json(nlohmann::json &json, const UploadStatusResponse &response);
    void from_json(const nlohmann::json &json, UploadStatusResponse &response);

    struct MergeResponse
    {
        std::string file_id;
        std::string final_path;
        std::string final_checksum;
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const MergeResponse &response);
    void from_json(const nlohmann::json &json, MergeResponse &response);

    struct CleanupRequest
    {
        std::optional<std::uint64_t> ttl_seconds{};
    };

    void to_json(nlohmann::json &json, const CleanupRequest &request);
    void from_json(const nlohmann::json &json, CleanupRequest &request);

    struct CleanupResponse
    {
        std::uint64_t reclaimed{};
        std::string message;
    };

    void to_json(nlohmann::json &json, const CleanupResponse &response);
    void from_json(const nlohmann::json &json, CleanupResponse &response);

    std::string format_progress(std::size_t received, std::uint32_t total);

} // namespace chunkvault::protocol
