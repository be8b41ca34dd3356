#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/session_registry.hpp"
#include "chunkvault/server/upload_service.hpp"

namespace chunkvault::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_sweep();
        void run_sweep();
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer sweep_timer_;

        FilesystemBlobStore blobs_;
        LocalSessionRegistry registry_;
        UploadService uploads_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkvault::server
