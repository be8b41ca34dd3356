#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkvault/error_codes.hpp"
#include "chunkvault/protocol.hpp"
#include "chunkvault/server/upload_service.hpp"

namespace chunkvault::server
{

    struct ServerServices
    {
        UploadService &uploads;
        std::chrono::seconds session_ttl;
    };

    // Maps a chunk outcome that the client must treat as a failure to its
    // wire error code.
    std::optional<chunkvault::ErrorCode> outcome_error(ChunkOutcome outcome) noexcept;

    chunkvault::protocol::ResponseEnvelope make_error_response(chunkvault::ErrorCode code, std::string message,
                                                               std::optional<std::string> request_id = std::nullopt,
                                                               nlohmann::json payload = nlohmann::json::object());

    // Per-connection request handling. Upload commands require IDENTIFY first,
    // and uploads owned by someone else are reported as not found.
    class RequestDispatcher
    {
    public:
        RequestDispatcher(ServerServices services, std::string peer);

        chunkvault::protocol::ResponseEnvelope dispatch(const chunkvault::protocol::RequestEnvelope &envelope);

        const std::optional<std::string> &owner_id() const noexcept { return owner_id_; }

    private:
        chunkvault::protocol::ResponseEnvelope route(const chunkvault::protocol::RequestEnvelope &envelope);

        chunkvault::protocol::ResponseEnvelope handle_identify(const chunkvault::protocol::RequestEnvelope &envelope);
        chunkvault::protocol::ResponseEnvelope handle_register_upload(const chunkvault::protocol::RequestEnvelope &envelope);
        chunkvault::protocol::ResponseEnvelope handle_upload_chunk(const chunkvault::protocol::RequestEnvelope &envelope);
        chunkvault::protocol::ResponseEnvelope handle_upload_status(const chunkvault::protocol::RequestEnvelope &envelope);
        chunkvault::protocol::ResponseEnvelope handle_upload_merge(const chunkvault::protocol::RequestEnvelope &envelope);
        chunkvault::protocol::ResponseEnvelope handle_upload_cleanup(const chunkvault::protocol::RequestEnvelope &envelope);

        // Throws UploadError(SessionNotFound) unless the upload belongs to this connection.
        void require_owner(const std::string &file_id) const;

        ServerServices services_;
        std::string peer_;
        std::optional<std::string> owner_id_;
    };

} // namespace chunkvault::server
