#include "chunkvault/client/uploader.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <span>
#include <thread>
#include <vector>

#include "chunkvault/client/upload_plan.hpp"
#include "chunkvault/crypto.hpp"
#include "chunkvault/encoding/base64.hpp"
#include "chunkvault/framing.hpp"

namespace chunkvault::client
{

    RemoteError::RemoteError(chunkvault::ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    Uploader::Uploader(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          socket_(io_context_) {}

    int Uploader::run()
    {
        try
        {
            connect();
            identify();
            switch (config_.command)
            {
            case ClientCommand::Upload:
                upload_file(config_.target);
                break;
            case ClientCommand::Status:
                print_status(config_.target);
                break;
            case ClientCommand::Merge:
                merge(config_.target);
                break;
            case ClientCommand::Cleanup:
                cleanup();
                break;
            }
        }
        catch (const RemoteError &ex)
        {
            std::cerr << "ERROR: " << chunkvault::to_string(ex.code()) << ": " << ex.what() << std::endl;
            logger_.error("remote", chunkvault::to_string(ex.code()), ' ', ex.what());
            return 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.error("fatal", ex.what());
            return 1;
        }
        return 0;
    }

    void Uploader::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        logger_.log("info", "connected to ", config_.host, ':', config_.port);
    }

    void Uploader::reconnect()
    {
        asio::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        socket_ = asio::ip::tcp::socket(io_context_);
        connect();
        identify();
    }

    void Uploader::identify()
    {
        chunkvault::protocol::IdentifyRequest request{.owner_id = config_.owner_id};
        call(chunkvault::protocol::Command::Identify, request);
        logger_.log("info", "identified as ", config_.owner_id);
    }

    std::string Uploader::next_request_id()
    {
        return std::to_string(++request_counter_);
    }

    chunkvault::protocol::ResponseEnvelope Uploader::rpc(chunkvault::protocol::Command command,
                                                         const nlohmann::json &payload)
    {
        chunkvault::protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        const auto frame = chunkvault::protocol::encode_frame(nlohmann::json(envelope));
        asio::write(socket_, asio::buffer(frame));

        std::array<std::uint8_t, chunkvault::protocol::kFrameHeaderSize> header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = chunkvault::protocol::decode_frame_header(header);
        std::vector<char> buffer(size);
        asio::read(socket_, asio::buffer(buffer.data(), buffer.size()));

        nlohmann::json json_response;
        try
        {
            json_response = nlohmann::json::parse(std::string(buffer.begin(), buffer.end()));
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.log("rpc", "parse_error size=", size, " msg=", ex.what());
            throw std::runtime_error("Failed to decode server response");
        }
        auto response = json_response.get<chunkvault::protocol::ResponseEnvelope>();
        if (response.kind == chunkvault::protocol::ResponseKind::Error)
        {
            logger_.warn("rpc", "cmd=", chunkvault::protocol::to_string(command),
                        " error=", chunkvault::to_string(response.error), " msg=", response.message);
        }
        else
        {
            logger_.log("rpc", "success cmd=", chunkvault::protocol::to_string(command));
        }
        return response;
    }

    nlohmann::json Uploader::call(chunkvault::protocol::Command command, const nlohmann::json &payload)
    {
        auto response = rpc(command, payload);
        if (response.kind == chunkvault::protocol::ResponseKind::Error)
        {
            throw RemoteError(response.error, response.message);
        }
        return std::move(response.payload);
    }

    chunkvault::protocol::UploadStatusResponse Uploader::fetch_status(const std::string &file_id)
    {
        chunkvault::protocol::FileIdRequest request{.file_id = file_id};
        return call(chunkvault::protocol::Command::UploadStatus, request)
            .get<chunkvault::protocol::UploadStatusResponse>();
    }

    void Uploader::send_chunk(const chunkvault::protocol::UploadChunkRequest &request)
    {
        for (std::uint32_t attempt = 1;; ++attempt)
        {
            try
            {
                const auto response = call(chunkvault::protocol::Command::UploadChunk, request)
                                          .get<chunkvault::protocol::UploadChunkResponse>();
                std::cout << "  chunk " << request.index << ' ' << response.outcome
                          << " (" << response.progress << ')' << std::endl;
                return;
            }
            catch (const asio::system_error &ex)
            {
                if (attempt >= config_.max_retries)
                {
                    throw;
                }
                const auto delay = backoff_delay(attempt);
                logger_.warn("retry", "chunk=", request.index, " attempt=", attempt,
                            " delay=", delay.count(), "s error=", ex.what());
                std::this_thread::sleep_for(delay);
                reconnect();
            }
        }
    }

    void Uploader::upload_file(const std::filesystem::path &path)
    {
        if (!std::filesystem::is_regular_file(path))
        {
            throw std::runtime_error("Not a regular file: " + path.string());
        }
        const auto file_size = std::filesystem::file_size(path);
        const auto total = chunk_count(file_size, config_.chunk_size);
        const auto file_id = config_.file_id.value_or(generate_file_id());
        const auto final_checksum = chunkvault::crypto::hash_file(path);
        const auto filename = path.filename().string();

        std::cout << "Uploading " << filename << " (" << file_size << " bytes, "
                  << total << " chunks) as " << file_id << std::endl;
        logger_.log("upload", "file=", path.string(), " id=", file_id, " chunks=", total);

        chunkvault::protocol::RegisterUploadRequest registration{
            .file_id = file_id,
            .total_chunks = total,
            .filename = filename,
            .category = config_.category,
            .final_checksum = final_checksum,
        };
        call(chunkvault::protocol::Command::RegisterUpload, registration);

        std::ifstream input(path, std::ios::binary);
        if (!input)
        {
            throw std::runtime_error("Failed to open " + path.string());
        }

        std::vector<std::byte> buffer(config_.chunk_size);
        const auto send_pending = [&]()
        {
            const auto status = fetch_status(file_id);
            const auto pending = pending_chunks(total, status.received_chunks);
            if (pending.size() < total)
            {
                std::cout << "Resuming: " << status.progress << " chunks already stored" << std::endl;
            }
            for (const auto index : pending)
            {
                input.clear();
                input.seekg(static_cast<std::streamoff>(static_cast<std::uint64_t>(index) * config_.chunk_size));
                input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                const auto count = static_cast<std::size_t>(input.gcount());
                if (input.bad())
                {
                    throw std::runtime_error("Failed to read " + path.string());
                }
                const std::span<const std::byte> data(buffer.data(), count);

                chunkvault::protocol::UploadChunkRequest request{
                    .file_id = file_id,
                    .index = index,
                    .total_chunks = total,
                    .filename = filename,
                    .category = config_.category,
                    .checksum = chunkvault::crypto::sha256_hex(data),
                    .data_base64 = chunkvault::encoding::encode_base64(data),
                    .final_checksum = final_checksum,
                };
                send_chunk(request);
            }
        };

        // A merge can report chunks that were lost or corrupted on the server; resend those and try again.
        for (std::uint32_t attempt = 1;; ++attempt)
        {
            send_pending();
            try
            {
                merge(file_id);
                return;
            }
            catch (const RemoteError &ex)
            {
                const bool recoverable = ex.code() == chunkvault::ErrorCode::ChunkCorrupted ||
                                         ex.code() == chunkvault::ErrorCode::IncompleteUpload;
                if (!recoverable || attempt >= config_.max_retries)
                {
                    throw;
                }
                logger_.warn("retry", "merge attempt=", attempt, " error=", ex.what());
            }
        }
    }

    void Uploader::merge(const std::string &file_id)
    {
        chunkvault::protocol::FileIdRequest request{.file_id = file_id};
        const auto response = call(chunkvault::protocol::Command::UploadMerge, request)
                                  .get<chunkvault::protocol::MergeResponse>();
        std::cout << "Merged " << response.file_id << " -> " << response.final_path << std::endl;
        std::cout << "  size: " << response.size << " bytes" << std::endl;
        std::cout << "  sha256: " << response.final_checksum << std::endl;
        logger_.log("merge", "id=", response.file_id, " path=", response.final_path, " size=", response.size);
    }

    void Uploader::print_status(const std::string &file_id)
    {
        const auto status = fetch_status(file_id);
        if (!status.exists)
        {
            std::cout << "No upload " << file_id << std::endl;
            return;
        }
        std::cout << status.file_id << ": " << status.status << ' ' << status.progress << std::endl;
        const auto pending = pending_chunks(status.total_chunks, status.received_chunks);
        if (!pending.empty())
        {
            std::cout << "  missing:";
            for (const auto index : pending)
            {
                std::cout << ' ' << index;
            }
            std::cout << std::endl;
        }
    }

    void Uploader::cleanup()
    {
        chunkvault::protocol::CleanupRequest request{.ttl_seconds = config_.cleanup_ttl};
        const auto response = call(chunkvault::protocol::Command::UploadCleanup, request)
                                  .get<chunkvault::protocol::CleanupResponse>();
        std::cout << response.message << std::endl;
    }

} // namespace chunkvault::client
