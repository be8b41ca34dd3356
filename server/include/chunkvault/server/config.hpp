#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "chunkvault/server/cleanup_sweeper.hpp"
#include "chunkvault/server/session_registry.hpp"

namespace chunkvault::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::chrono::seconds session_ttl{std::chrono::hours{24}};
        // Zero disables the periodic sweep.
        std::chrono::seconds sweep_interval{std::chrono::hours{1}};
        std::uint64_t max_chunk_size{16u * 1024u * 1024u};
        std::uint32_t max_total_chunks{1u << 20};
        RetentionPolicy retention{RetentionPolicy::KeepExpired};
        ConflictPolicy conflict_policy{ConflictPolicy::Reject};
        bool persist_sessions{false};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
    };

} // namespace chunkvault::server
