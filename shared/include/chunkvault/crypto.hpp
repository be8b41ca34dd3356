/**
 * ChunkVault - SHA-256 checksum helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault::crypto
{

    inline constexpr std::size_t kSha256HexLength = 64;

    void ensure_sodium_init();

    std::string sha256_hex(std::span<const std::byte> data);

    std::string sha256_hex(std::string_view data);

    // Digest of the concatenation of all ranges, computed without joining them.
    std::string sha256_hex(const std::vector<std::span<const std::byte>> &ranges);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    bool is_sha256_hex(std::string_view value) noexcept;

    std::string normalize_digest(std::string_view value);

    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept;

    // Incremental SHA-256 over a sequence of byte ranges.
    class Sha256Stream
    {
    public:
        Sha256Stream();
        ~Sha256Stream();

        Sha256Stream(const Sha256Stream &) = delete;
        Sha256Stream &operator=(const Sha256Stream &) = delete;
        Sha256Stream(Sha256Stream &&) noexcept;
        Sha256Stream &operator=(Sha256Stream &&) noexcept;

        void update(std::span<const std::byte> data);

        std::uint64_t bytes_consumed() const noexcept { return bytes_consumed_; }

        // Finalizes the digest; further updates throw.
        std::string finish();

    private:
        struct State;
        std::unique_ptr<State> state_;
        std::uint64_t bytes_consumed_{};
        bool finished_{false};
    };

} // namespace chunkvault::crypto
