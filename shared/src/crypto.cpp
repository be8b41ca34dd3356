#include "chunkvault/crypto.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace chunkvault::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    struct Sha256Stream::State
    {
        crypto_hash_sha256_state sha{};
    };

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string sha256_hex(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::vector<unsigned char> digest(crypto_hash_sha256_BYTES);
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return to_hex(digest);
    }

    std::string sha256_hex(std::string_view data)
    {
        return sha256_hex(std::as_bytes(std::span<const char>(data.data(), data.size())));
    }

    std::string sha256_hex(const std::vector<std::span<const std::byte>> &ranges)
    {
        Sha256Stream stream;
        for (const auto &range : ranges)
        {
            stream.update(range);
        }
        return stream.finish();
    }

    std::string hash_stream(std::istream &input)
    {
        Sha256Stream stream;
        std::vector<std::byte> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                stream.update(std::span<const std::byte>(buffer.data(), read_count));
            }
        }
        return stream.finish();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    bool is_sha256_hex(std::string_view value) noexcept
    {
        if (value.size() != kSha256HexLength)
        {
            return false;
        }
        return std::all_of(value.begin(), value.end(), [](char ch)
                           { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; });
    }

    std::string normalize_digest(std::string_view value)
    {
        std::string result(value);
        for (auto &ch : result)
        {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return result;
    }

    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < lhs.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i])))
            {
                return false;
            }
        }
        return true;
    }

    Sha256Stream::Sha256Stream() : state_(std::make_unique<State>())
    {
        ensure_initialized_once();
        if (crypto_hash_sha256_init(&state_->sha) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }
    }

    Sha256Stream::~Sha256Stream() = default;

    Sha256Stream::Sha256Stream(Sha256Stream &&) noexcept = default;

    Sha256Stream &Sha256Stream::operator=(Sha256Stream &&) noexcept = default;

    void Sha256Stream::update(std::span<const std::byte> data)
    {
        if (finished_ || !state_)
        {
            throw std::logic_error("Sha256Stream already finalized");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_hash_sha256_update(&state_->sha, reinterpret_cast<const unsigned char *>(data.data()),
                                      data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_update failed");
        }
        bytes_consumed_ += data.size();
    }

    std::string Sha256Stream::finish()
    {
        if (finished_ || !state_)
        {
            throw std::logic_error("Sha256Stream already finalized");
        }
        std::vector<unsigned char> digest(crypto_hash_sha256_BYTES);
        if (crypto_hash_sha256_final(&state_->sha, digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        finished_ = true;
        return to_hex(digest);
    }

} // namespace chunkvault::crypto
