#include "chunkvault/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/strand.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkvault/server/connection.hpp"

namespace chunkvault::server
{

    namespace
    {

        constexpr auto kSessionJournalDir = ".chunkvault/sessions";

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        RegistryOptions registry_options(const ServerConfig &config)
        {
            RegistryOptions options;
            options.conflict_policy = config.conflict_policy;
            if (config.persist_sessions)
            {
                options.journal_dir = config.root / kSessionJournalDir;
            }
            return options;
        }

        UploadServiceOptions service_options(const ServerConfig &config)
        {
            UploadServiceOptions options;
            options.max_chunk_size = config.max_chunk_size;
            options.max_total_chunks = config.max_total_chunks;
            options.session_ttl = config.session_ttl;
            options.retention = config.retention;
            return options;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          sweep_timer_(io_context_),
          blobs_(config_.root),
          registry_(registry_options(config_)),
          uploads_(registry_, blobs_, service_options(config_))
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, config_.port, config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_sweep();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{uploads_, config_.session_ttl};
            auto connection = std::make_shared<Connection>(std::move(socket), services);
            connection->start();
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::schedule_sweep()
    {
        if (config_.sweep_interval.count() <= 0)
        {
            spdlog::info("Periodic sweep disabled");
            return;
        }
        sweep_timer_.expires_after(config_.sweep_interval);
        sweep_timer_.async_wait([this](const std::error_code &ec)
                                {
            if (ec)
            {
                return;
            }
            run_sweep();
            schedule_sweep(); });
    }

    void Server::run_sweep()
    {
        try
        {
            const auto report = uploads_.sweep(std::chrono::system_clock::now(), config_.session_ttl);
            spdlog::debug("Periodic sweep finished: {} reclaimed, {} failure(s)", report.reclaimed, report.failures);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Periodic sweep failed: {}", ex.what());
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        sweep_timer_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace chunkvault::server
