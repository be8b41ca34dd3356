#include "chunkvault/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

#include "chunkvault/client/upload_plan.hpp"

namespace chunkvault::client
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    std::string usage()
    {
        return "Usage: chunkvault_client <host>:<port> --owner <id> <command> [args]\n"
               "Commands:\n"
               "  upload <file>       Upload a file in chunks, resuming where possible\n"
               "  status <file_id>    Show which chunks the server holds\n"
               "  merge <file_id>     Assemble a fully uploaded file\n"
               "  cleanup             Reclaim stale uploads on the server\n"
               "Flags:\n"
               "  --category <name>   Destination category (default: general)\n"
               "  --chunk-size <n>    Chunk size in bytes (default: 4194304)\n"
               "  --file-id <id>      Reuse an upload id to resume it\n"
               "  --retries <n>       Attempts per chunk on network failure (default: 3)\n"
               "  --ttl <seconds>     Idle time after which cleanup reclaims uploads\n"
               "  --log <file>        Append client logs to file\n";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(usage());
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];
        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        config.port = static_cast<std::uint16_t>(std::stoi(endpoint.substr(colon_pos + 1)));

        std::optional<std::string> command;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--owner")
            {
                config.owner_id = require_value(index, argc, argv, arg);
            }
            else if (arg == "--category")
            {
                config.category = require_value(index, argc, argv, arg);
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = std::stoull(require_value(index, argc, argv, arg));
                if (config.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
                if (config.chunk_size > kMaxChunkSize)
                {
                    throw std::runtime_error("--chunk-size must not exceed " + std::to_string(kMaxChunkSize) +
                                             " bytes");
                }
            }
            else if (arg == "--file-id")
            {
                config.file_id = require_value(index, argc, argv, arg);
            }
            else if (arg == "--retries")
            {
                config.max_retries = static_cast<std::uint32_t>(std::stoul(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--ttl")
            {
                config.cleanup_ttl = std::stoull(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (!command)
            {
                command = arg;
            }
            else if (config.target.empty())
            {
                config.target = arg;
            }
            else
            {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
        }

        if (config.owner_id.empty())
        {
            throw std::runtime_error("--owner is required");
        }
        if (!command)
        {
            throw std::runtime_error(usage());
        }
        if (*command == "upload")
        {
            config.command = ClientCommand::Upload;
        }
        else if (*command == "status")
        {
            config.command = ClientCommand::Status;
        }
        else if (*command == "merge")
        {
            config.command = ClientCommand::Merge;
        }
        else if (*command == "cleanup")
        {
            config.command = ClientCommand::Cleanup;
        }
        else
        {
            throw std::runtime_error("Unknown command: " + *command);
        }
        if (config.command != ClientCommand::Cleanup && config.target.empty())
        {
            throw std::runtime_error(*command + " requires an argument");
        }
        return config;
    }

} // namespace chunkvault::client
