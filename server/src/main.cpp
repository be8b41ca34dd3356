#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkvault/server/server.hpp"
#include "chunkvault/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ChunkVault server " << chunkvault::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>]\n"
                     "       [--session-ttl <seconds>] [--sweep-interval <seconds>] [--max-chunk-size <bytes>]\n"
                     "       [--max-total-chunks <N>] [--retention keep|remove] [--allow-chunk-overwrite]\n"
                     "       [--persist-sessions] [--log <FILE>] [--log-level <LEVEL>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::chrono::seconds parse_seconds(const std::string &arg, const std::string &value)
    {
        const auto seconds = std::stoll(value);
        if (seconds < 0)
        {
            throw std::out_of_range(arg + " must not be negative");
        }
        return std::chrono::seconds(seconds);
    }

    // Returns false for unknown flags and unrecognised policy names.
    bool apply_option(chunkvault::server::ServerConfig &config, const std::string &arg, const std::string &value)
    {
        using chunkvault::server::RetentionPolicy;
        if (arg == "--port")
        {
            config.port = static_cast<std::uint16_t>(std::stoi(value));
        }
        else if (arg == "--root")
        {
            config.root = std::filesystem::path(value);
        }
        else if (arg == "--address")
        {
            config.address = value;
        }
        else if (arg == "--threads")
        {
            config.worker_threads = static_cast<std::size_t>(std::stoul(value));
        }
        else if (arg == "--session-ttl")
        {
            config.session_ttl = parse_seconds(arg, value);
        }
        else if (arg == "--sweep-interval")
        {
            config.sweep_interval = parse_seconds(arg, value);
        }
        else if (arg == "--max-chunk-size")
        {
            config.max_chunk_size = std::stoull(value);
        }
        else if (arg == "--max-total-chunks")
        {
            const auto count = std::stoull(value);
            if (count == 0 || count > std::numeric_limits<std::uint32_t>::max())
            {
                throw std::out_of_range("--max-total-chunks must be between 1 and 4294967295");
            }
            config.max_total_chunks = static_cast<std::uint32_t>(count);
        }
        else if (arg == "--retention")
        {
            if (value == "keep")
            {
                config.retention = RetentionPolicy::KeepExpired;
            }
            else if (value == "remove")
            {
                config.retention = RetentionPolicy::RemoveRecord;
            }
            else
            {
                std::cerr << "Unknown retention policy: " << value << std::endl;
                return false;
            }
        }
        else if (arg == "--log")
        {
            config.log_file = std::filesystem::path(value);
        }
        else if (arg == "--log-level")
        {
            config.log_level = value;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
        return true;
    }

} // namespace

int main(int argc, char *argv[])
{
    using chunkvault::server::Server;
    using chunkvault::server::ServerConfig;

    ServerConfig config;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg == "--allow-chunk-overwrite")
            {
                config.conflict_policy = chunkvault::server::ConflictPolicy::OverwriteWhileInProgress;
                continue;
            }
            if (arg == "--persist-sessions")
            {
                config.persist_sessions = true;
                continue;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            if (!apply_option(config, arg, *value))
            {
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid argument value: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting ChunkVault server {} on {}:{}", chunkvault::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
