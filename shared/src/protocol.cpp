#include "chunkvault/protocol.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace chunkvault::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 7> kCommandMappings{{
            {Command::Identify, "IDENTIFY"},
            {Command::RegisterUpload, "REGISTER_UPLOAD"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadStatus, "UPLOAD_STATUS"},
            {Command::UploadMerge, "UPLOAD_MERGE"},
            {Command::UploadCleanup, "UPLOAD_CLEANUP"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const IdentifyRequest &request)
    {
        json = {{"owner_id", request.owner_id}};
    }

    void from_json(const nlohmann::json &json, IdentifyRequest &request)
    {
        request.owner_id = json.at("owner_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const RegisterUploadRequest &request)
    {
        json = {
            {"file_id", request.file_id},
            {"total_chunks", request.total_chunks},
            {"filename", request.filename},
            {"category", request.category},
        };
        if (request.final_checksum)
        {
            json["final_checksum"] = *request.final_checksum;
        }
    }

    void from_json(const nlohmann::json &json, RegisterUploadRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
        request.total_chunks = json.at("total_chunks").get<std::uint32_t>();
        request.filename = json.at("filename").get<std::string>();
        request.category = json.value("category", std::string{"general"});
        request.final_checksum = optional_string(json, "final_checksum");
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"file_id", request.file_id},
            {"chunk_index", request.index},
            {"total_chunks", request.total_chunks},
            {"filename", request.filename},
            {"category", request.category},
            {"checksum", request.checksum},
            {"data", request.data_base64},
        };
        if (request.final_checksum)
        {
            json["final_checksum"] = *request.final_checksum;
        }
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
        request.index = json.at("chunk_index").get<std::uint32_t>();
        request.total_chunks = json.at("total_chunks").get<std::uint32_t>();
        request.filename = json.at("filename").get<std::string>();
        request.category = json.value("category", std::string{"general"});
        request.checksum = json.at("checksum").get<std::string>();
        request.data_base64 = json.at("data").get<std::string>();
        request.final_checksum = optional_string(json, "final_checksum");
    }

    void to_json(nlohmann::json &json, const UploadChunkResponse &response)
    {
        json = {
            {"file_id", response.file_id},
            {"chunk_index", response.index},
            {"outcome", response.outcome},
            {"progress", response.progress},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkResponse &response)
    {
        response.file_id = json.at("file_id").get<std::string>();
        response.index = json.at("chunk_index").get<std::uint32_t>();
        response.outcome = json.at("outcome").get<std::string>();
        response.progress = json.value("progress", std::string{});
    }

    void to_json(nlohmann::json &json, const FileIdRequest &request)
    {
        json = {{"file_id", request.file_id}};
    }

    void from_json(const nlohmann::json &json, FileIdRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadStatusResponse &response)
    {
        json = {
            {"exists", response.exists},
            {"file_id", response.file_id},
            {"status", response.status},
            {"received_chunks", response.received_chunks},
            {"total_chunks", response.total_chunks},
            {"progress", response.progress},
        };
    }

    void from_json(const nlohmann::json &json, UploadStatusResponse &response)
    {
        response.exists = json.value("exists", false);
        response.file_id = json.value("file_id", std::string{});
        response.status = json.value("status", std::string{});
        response.received_chunks = json.value("received_chunks", std::vector<std::uint32_t>{});
        response.total_chunks = json.value("total_chunks", 0u);
        response.progress = json.value("progress", std::string{});
    }

    void to_json(nlohmann::json &json, const MergeResponse &response)
    {
        json = {
            {"file_id", response.file_id},
            {"final_path", response.final_path},
            {"final_checksum", response.final_checksum},
            {"size", response.size},
        };
    }

    void from_json(const nlohmann::json &json, MergeResponse &response)
    {
        response.file_id = json.at("file_id").get<std::string>();
        response.final_path = json.at("final_path").get<std::string>();
        response.final_checksum = json.at("final_checksum").get<std::string>();
        response.size = json.value("size", 0ULL);
    }

    void to_json(nlohmann::json &json, const CleanupRequest &request)
    {
        json = nlohmann::json::object();
        if (request.ttl_seconds)
        {
            json["ttl_seconds"] = *request.ttl_seconds;
        }
    }

    void from_json(const nlohmann::json &json, CleanupRequest &request)
    {
        if (auto it = json.find("ttl_seconds"); it != json.end() && !it->is_null())
        {
            request.ttl_seconds = it->get<std::uint64_t>();
        }
        else
        {
            request.ttl_seconds.reset();
        }
    }

    void to_json(nlohmann::json &json, const CleanupResponse &response)
    {
        json = {
            {"reclaimed", response.reclaimed},
            {"message", response.message},
        };
    }

    void from_json(const nlohmann::json &json, CleanupResponse &response)
    {
        response.reclaimed = json.value("reclaimed", 0ULL);
        response.message = json.value("message", std::string{});
    }

    std::string format_progress(std::size_t received, std::uint32_t total)
    {
        return std::to_string(received) + "/" + std::to_string(total);
    }

} // namespace chunkvault::protocol
