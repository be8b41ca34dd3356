#include "chunkvault/client/upload_plan.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

#include "chunkvault/crypto.hpp"

namespace chunkvault::client
{

    std::uint32_t chunk_count(std::uint64_t file_size, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        if (file_size == 0)
        {
            return 1;
        }
        const auto count = file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
        if (count > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("file needs " + std::to_string(count) +
                                    " chunks; use a larger chunk size");
        }
        return static_cast<std::uint32_t>(count);
    }

    std::vector<std::uint32_t> pending_chunks(std::uint32_t total, const std::vector<std::uint32_t> &received)
    {
        std::vector<bool> present(total, false);
        for (const auto index : received)
        {
            if (index < total)
            {
                present[index] = true;
            }
        }
        std::vector<std::uint32_t> pending;
        for (std::uint32_t i = 0; i < total; ++i)
        {
            if (!present[i])
            {
                pending.push_back(i);
            }
        }
        return pending;
    }

    std::chrono::seconds backoff_delay(std::uint32_t attempt)
    {
        const auto exponent = std::min<std::uint32_t>(attempt == 0 ? 0 : attempt - 1, 10);
        return std::chrono::seconds(1u << exponent);
    }

    std::string generate_file_id()
    {
        chunkvault::crypto::ensure_sodium_init();
        std::array<unsigned char, 8> random{};
        randombytes_buf(random.data(), random.size());
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (const auto byte : random)
        {
            oss << std::setw(2) << static_cast<int>(byte);
        }
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
        oss << std::dec << '_' << now;
        return oss.str();
    }

} // namespace chunkvault::client
