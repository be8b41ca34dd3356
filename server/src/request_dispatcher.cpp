#include "chunkvault/server/request_dispatcher.hpp"

#include <spdlog/spdlog.h>

#include "chunkvault/encoding/base64.hpp"
#include "chunkvault/server/cleanup_sweeper.hpp"
#include "chunkvault/server/errors.hpp"
#include "chunkvault/upload_state.hpp"

namespace chunkvault::server
{

    namespace
    {

        chunkvault::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                                const std::optional<std::string> &request_id)
        {
            chunkvault::protocol::ResponseEnvelope envelope;
            envelope.kind = chunkvault::protocol::ResponseKind::Ok;
            envelope.payload = std::move(payload);
            envelope.error = chunkvault::ErrorCode::Ok;
            envelope.request_id = request_id;
            return envelope;
        }

        nlohmann::json error_detail(const UploadError &error)
        {
            nlohmann::json detail = nlohmann::json::object();
            if (error.missing_count() > 0)
            {
                detail["missing_chunks"] = error.missing_indices();
                detail["missing_count"] = error.missing_count();
            }
            if (error.chunk_index())
            {
                detail["chunk_index"] = *error.chunk_index();
            }
            return detail;
        }

        bool needs_identity(chunkvault::protocol::Command command)
        {
            switch (command)
            {
            case chunkvault::protocol::Command::RegisterUpload:
            case chunkvault::protocol::Command::UploadChunk:
            case chunkvault::protocol::Command::UploadStatus:
            case chunkvault::protocol::Command::UploadMerge:
            case chunkvault::protocol::Command::UploadCleanup:
                return true;
            default:
                return false;
            }
        }

    } // namespace

    std::optional<chunkvault::ErrorCode> outcome_error(ChunkOutcome outcome) noexcept
    {
        switch (outcome)
        {
        case ChunkOutcome::ChecksumConflict:
            return chunkvault::ErrorCode::ChecksumConflict;
        case ChunkOutcome::SessionClosed:
            return chunkvault::ErrorCode::SessionStateConflict;
        default:
            return std::nullopt;
        }
    }

    chunkvault::protocol::ResponseEnvelope make_error_response(chunkvault::ErrorCode code, std::string message,
                                                               std::optional<std::string> request_id,
                                                               nlohmann::json payload)
    {
        chunkvault::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkvault::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.payload = std::move(payload);
        envelope.request_id = std::move(request_id);
        return envelope;
    }

    RequestDispatcher::RequestDispatcher(ServerServices services, std::string peer)
        : services_(services), peer_(std::move(peer)) {}

    chunkvault::protocol::ResponseEnvelope RequestDispatcher::dispatch(
        const chunkvault::protocol::RequestEnvelope &envelope)
    {
        if (needs_identity(envelope.command) && !owner_id_)
        {
            return make_error_response(chunkvault::ErrorCode::AuthenticationRequired, "Identify first",
                                       envelope.request_id);
        }
        try
        {
            return route(envelope);
        }
        catch (const UploadError &error)
        {
            return make_error_response(error.code(), error.what(), envelope.request_id, error_detail(error));
        }
        catch (const StorageError &error)
        {
            spdlog::error("{}: storage failure: {}", peer_, error.what());
            return make_error_response(error.code(), error.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            return make_error_response(chunkvault::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{}: {} failed: {}", peer_, chunkvault::protocol::to_string(envelope.command), ex.what());
            return make_error_response(chunkvault::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    chunkvault::protocol::ResponseEnvelope RequestDispatcher::route(const chunkvault::protocol::RequestEnvelope &envelope)
    {
        switch (envelope.command)
        {
        case chunkvault::protocol::Command::Identify:
            return handle_identify(envelope);
        case chunkvault::protocol::Command::RegisterUpload:
            return handle_register_upload(envelope);
        case chunkvault::protocol::Command::UploadChunk:
            return handle_upload_chunk(envelope);
        case chunkvault::protocol::Command::UploadStatus:
            return handle_upload_status(envelope);
        case chunkvault::protocol::Command::UploadMerge:
            return handle_upload_merge(envelope);
        case chunkvault::protocol::Command::UploadCleanup:
            return handle_upload_cleanup(envelope);
        case chunkvault::protocol::Command::Ping:
            return make_ok_response({{"pong", true}}, envelope.request_id);
        default:
            return make_error_response(chunkvault::ErrorCode::Unsupported, "Command not supported",
                                       envelope.request_id);
        }
    }

    chunkvault::protocol::ResponseEnvelope RequestDispatcher::handle_identify(
        const chunkvault::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<chunkvault::protocol::IdentifyRequest>();
        if (request.owner_id.empty())
        {
            return make_error_response(chunkvault::ErrorCode::InvalidPayload, "owner_id is required",
                                       envelope.request_id);
        }
        owner_id_ = request.owner_id;
        spdlog::info("Connection {} identified as {}", peer_, *owner_id_);
        return make_ok_response({{"owner_id", *owner_id_}}, envelope.request_id);
    }

    chunkvault::protocol::ResponseEnvelope RequestDispatcher::handle_register_upload(
        const chunkvault::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<chunkvault::protocol::RegisterUploadRequest>();
        const auto session = services_.uploads.register_upload(SessionDescriptor{
            .file_id = request.file_id,
            .owner_id = *owner_id_,
            .total_chunks = request.total_chunks,
            .filename = request.filename,
            .category = request.category,
            .expected_final_checksum = request.final_checksum,
        });
        const auto received = session.usable_indices();
        chunkvault::protocol::UploadStatusResponse response{
            .exists = true,
            .file_id = session.file_id,
            .status = std::string(to_string(session.status)),
            .received_chunks = received,
            .total_chunks = session.expected_total_chunks,
            .progress = chunkvault::protocol::format_progress(received.size(), session.expected_total_chunks),
        };
        return make_ok_response(response, envelope.request_id);
    }

    chunkvault::protocol::ResponseEnvelope RequestDispatcher::handle_upload_chunk(
        const chunkvault::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<chunkvault::protocol::UploadChunkRequest>();
        const auto data = chunkvault::encoding::decode_base64(request.data_base64);
        if (!data)
        {
            return make_error_response(chunkvault::ErrorCode::InvalidPayload, "Invalid chunk data",
                                       envelope.request_id);
        }
        const auto outcome = services_.uploads.receive_chunk(ChunkUpload{
            .file_id = request.file_id,
            .owner_id = *owner_id_,
            .index = request.index,
            .total_chunks = request.total_chunks,
            .filename = request.filename,
            .category = request.category,
            .checksum = request.checksum,
            .data = *data,
            .expected_final_checksum = request.final_checksum,
        });
        if (const auto code = outcome_error(outcome))
        {
            if (*code == chunkvault::ErrorCode::ChecksumConflict)
            {
                return make_error_response(*code, "Checksum mismatch for chunk " + std::to_string(request.index),
                                           envelope.request_id, {{"chunk_index", request.index}});
            }
            return make_error_response(*code, "Upload " + request.file_id + " no longer accepts chunks",
                                       envelope.request_id);
        }
        const auto status = services_.uploads.upload_status(request.file_id);
        chunkvault::protocol::UploadChunkResponse response{
            .file_id = request.file_id,
            .index = request.index,
            .outcome = std::string(to_string(outcome)),
            .progress = chunkvault::protocol::format_progress(status.received_indices.size(), status.total_expected),
        };
        return make_ok_response(response, envelope.request_id);
    }

    chunkvault::protocol::ResponseEnvelope RequestDispatcher::handle_upload_status(
        const chunkvault::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<chunkvault::protocol::FileIdRequest>();
        chunkvault::protocol::UploadStatusResponse response{
            .exists = false,
            .file_id = request.file_id,
            .progress = "0/0",
        };
        try
        {
            const auto status = services_.uploads.upload_status(request.file_id);
            if (status.owner_id == *owner_id_)
            {
                response.exists = true;
                response.status = std::string(to_string(status.status));
                response.received_chunks = status.received_indices;
                response.total_chunks = status.total_expected;
                response.progress = chunkvault::protocol::format_progress(status.received_indices.size(),
                                                                          status.total_expected);
            }
        }
        catch (const UploadError &error)
        {
            if (error.code() != chunkvault::ErrorCode::SessionNotFound)
            {
                throw;
            }
        }
        return make_ok_response(response, envelope.request_id);
    }

    chunkvault::protocol::ResponseEnvelope RequestDispatcher::handle_upload_merge(
        const chunkvault::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<chunkvault::protocol::FileIdRequest>();
        require_owner(request.file_id);
        const auto result = services_.uploads.merge_upload(request.file_id);
        chunkvault::protocol::MergeResponse response{
            .file_id = result.file_id,
            .final_path = result.final_path,
            .final_checksum = result.final_checksum,
            .size = result.size,
        };
        auto ok = make_ok_response(response, envelope.request_id);
        ok.message = "File merged successfully";
        return ok;
    }

    chunkvault::protocol::ResponseEnvelope RequestDispatcher::handle_upload_cleanup(
        const chunkvault::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<chunkvault::protocol::CleanupRequest>();
        const auto ttl = request.ttl_seconds ? ttl_from_seconds(*request.ttl_seconds) : services_.session_ttl;
        const auto reclaimed = services_.uploads.cleanup_stale(ttl);
        chunkvault::protocol::CleanupResponse response{
            .reclaimed = reclaimed,
            .message = "Reclaimed " + std::to_string(reclaimed) + " stale upload(s)",
        };
        return make_ok_response(response, envelope.request_id);
    }

    void RequestDispatcher::require_owner(const std::string &file_id) const
    {
        if (services_.uploads.upload_status(file_id).owner_id != *owner_id_)
        {
            throw UploadError(chunkvault::ErrorCode::SessionNotFound, "Upload " + file_id + " not found");
        }
    }

} // namespace chunkvault::server
