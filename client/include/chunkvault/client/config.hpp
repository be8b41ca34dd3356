#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkvault::client
{

    enum class ClientCommand
    {
        Upload,
        Status,
        Merge,
        Cleanup
    };

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::string owner_id;
        ClientCommand command{ClientCommand::Upload};
        // File path for uploads, file id for status and merge.
        std::string target;
        std::string category{"general"};
        std::uint64_t chunk_size{4u * 1024u * 1024u};
        std::optional<std::string> file_id;
        std::uint32_t max_retries{3};
        std::optional<std::uint64_t> cleanup_ttl;
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace chunkvault::client
