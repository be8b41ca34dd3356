#include <cassert>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkvault/client/config.hpp"
#include "chunkvault/client/upload_plan.hpp"

using namespace chunkvault::client;

namespace
{

    ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "chunkvault_client");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            (void)parse(std::move(args));
        }
        catch (const std::exception &)
        {
            return true;
        }
        return false;
    }

    void test_chunk_count()
    {
        assert(chunk_count(300, 100) == 3);
        assert(chunk_count(301, 100) == 4);
        assert(chunk_count(1, 100) == 1);
        assert(chunk_count(0, 100) == 1);
        bool caught = false;
        try
        {
            (void)chunk_count(10, 0);
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);

        assert(chunk_count(std::uint64_t{0xFFFFFFFF}, 1) == 0xFFFFFFFFu);
        caught = false;
        try
        {
            (void)chunk_count(std::uint64_t{0xFFFFFFFF} + 1, 1);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
        caught = false;
        try
        {
            (void)chunk_count(std::numeric_limits<std::uint64_t>::max(), 2);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_pending_chunks()
    {
        assert((pending_chunks(3, {}) == std::vector<std::uint32_t>{0, 1, 2}));
        assert((pending_chunks(3, {0, 2}) == std::vector<std::uint32_t>{1}));
        assert(pending_chunks(2, {1, 0, 7}).empty());
    }

    void test_backoff()
    {
        assert(backoff_delay(1) == std::chrono::seconds(1));
        assert(backoff_delay(2) == std::chrono::seconds(2));
        assert(backoff_delay(3) == std::chrono::seconds(4));
    }

    void test_file_id_shape()
    {
        const auto id = generate_file_id();
        const auto sep = id.find('_');
        assert(sep == 16);
        for (std::size_t i = 0; i < sep; ++i)
        {
            assert(std::isxdigit(static_cast<unsigned char>(id[i])));
        }
        for (std::size_t i = sep + 1; i < id.size(); ++i)
        {
            assert(std::isdigit(static_cast<unsigned char>(id[i])));
        }
        assert(generate_file_id() != id);
    }

    void test_parse_arguments()
    {
        const auto upload = parse({"localhost:9000", "--owner", "alice", "upload", "/tmp/a.bin",
                                   "--chunk-size", "1024", "--retries", "5"});
        assert(upload.host == "localhost");
        assert(upload.port == 9000);
        assert(upload.owner_id == "alice");
        assert(upload.command == ClientCommand::Upload);
        assert(upload.target == "/tmp/a.bin");
        assert(upload.chunk_size == 1024);
        assert(upload.max_retries == 5);
        assert(upload.category == "general");
        assert(!upload.file_id.has_value());

        const auto cleanup = parse({"127.0.0.1:9000", "cleanup", "--owner", "ops", "--ttl", "60"});
        assert(cleanup.command == ClientCommand::Cleanup);
        assert(cleanup.cleanup_ttl == 60u);

        assert(parse_fails({"localhost", "--owner", "alice", "status", "x"}));
        assert(parse_fails({"localhost:9000", "status", "x"}));
        assert(parse_fails({"localhost:9000", "--owner", "alice", "status"}));
        assert(parse_fails({"localhost:9000", "--owner", "alice", "delete", "x"}));
        assert(parse_fails({"localhost:9000", "--owner", "alice", "upload", "a", "--chunk-size", "0"}));
    }

    void test_chunk_size_fits_frame()
    {
        // Base64 grows data by 4/3; the largest chunk must still leave room for the envelope.
        assert((kMaxChunkSize + 2) / 3 * 4 + kChunkEnvelopeAllowance <= chunkvault::protocol::kMaxFramePayload);

        const auto largest = parse({"localhost:9000", "--owner", "alice", "upload", "a", "--chunk-size",
                                    std::to_string(kMaxChunkSize)});
        assert(largest.chunk_size == kMaxChunkSize);
        assert(parse_fails({"localhost:9000", "--owner", "alice", "upload", "a", "--chunk-size",
                            std::to_string(kMaxChunkSize + 1)}));
        assert(parse_fails({"localhost:9000", "--owner", "alice", "upload", "a", "--chunk-size",
                            std::to_string(48u * 1024u * 1024u)}));
    }

} // namespace

void run_client_plan_tests()
{
    test_chunk_count();
    test_pending_chunks();
    test_backoff();
    test_file_id_shape();
    test_parse_arguments();
    test_chunk_size_fits_frame();
}
