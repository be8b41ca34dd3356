#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkvault/client/config.hpp"
#include "chunkvault/client/logger.hpp"
#include "chunkvault/error_codes.hpp"
#include "chunkvault/protocol.hpp"

namespace chunkvault::client
{

    // Raised for error responses; carries the server's error code.
    class RemoteError : public std::runtime_error
    {
    public:
        RemoteError(chunkvault::ErrorCode code, const std::string &message);

        chunkvault::ErrorCode code() const noexcept { return code_; }

    private:
        chunkvault::ErrorCode code_;
    };

    class Uploader
    {
    public:
        Uploader(ClientConfig config, Logger logger);

        int run();

    private:
        void connect();
        void reconnect();
        void identify();

        chunkvault::protocol::ResponseEnvelope rpc(chunkvault::protocol::Command command, const nlohmann::json &payload);
        nlohmann::json call(chunkvault::protocol::Command command, const nlohmann::json &payload);

        void upload_file(const std::filesystem::path &path);
        void send_chunk(const chunkvault::protocol::UploadChunkRequest &request);
        chunkvault::protocol::UploadStatusResponse fetch_status(const std::string &file_id);
        void merge(const std::string &file_id);
        void print_status(const std::string &file_id);
        void cleanup();

        std::string next_request_id();

        ClientConfig config_;
        Logger logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::uint64_t request_counter_{0};
    };

} // namespace chunkvault::client
