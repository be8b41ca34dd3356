#include "chunkvault/server/blob_store.hpp"

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include "chunkvault/server/errors.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kTempMarker = ".tmp-";

        std::string random_suffix()
        {
            thread_local std::mt19937_64 rng{std::random_device{}()};
            std::uniform_int_distribution<std::uint64_t> dist;
            std::ostringstream oss;
            oss << std::hex << dist(rng);
            return oss.str();
        }

        void validate_key(const std::string &key)
        {
            if (key.empty() || key.front() == '/' || key.back() == '/')
            {
                throw StorageError("Invalid blob key: '" + key + "'");
            }
            std::size_t start = 0;
            while (start <= key.size())
            {
                const auto end = std::min(key.find('/', start), key.size());
                if (!blob_keys::is_safe_segment(std::string_view(key).substr(start, end - start)))
                {
                    throw StorageError("Invalid blob key: '" + key + "'");
                }
                start = end + 1;
            }
        }

        void write_file(const std::filesystem::path &path, std::span<const std::byte> data, std::ios::openmode mode)
        {
            std::ofstream out(path, std::ios::binary | mode);
            if (!out.is_open())
            {
                throw StorageError("Failed to open " + path.string() + " for writing");
            }
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out)
            {
                throw StorageError("Failed to write " + path.string());
            }
        }

        void ensure_parent(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec)
            {
                throw StorageError("Failed to create directory " + path.parent_path().string() + ": " + ec.message());
            }
        }

    } // namespace

    FilesystemBlobStore::FilesystemBlobStore(std::filesystem::path root) : root_(std::move(root))
    {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec)
        {
            throw StorageError("Failed to create blob root " + root_.string() + ": " + ec.message());
        }
    }

    void FilesystemBlobStore::put(const std::string &key, std::span<const std::byte> data)
    {
        const auto target = resolve(key);
        ensure_parent(target);
        auto temp = target;
        temp += kTempMarker + random_suffix();
        try
        {
            write_file(temp, data, std::ios::trunc);
        }
        catch (const StorageError &)
        {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw;
        }
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw StorageError("Failed to store blob " + key + ": " + ec.message());
        }
    }

    void FilesystemBlobStore::append(const std::string &key, std::span<const std::byte> data)
    {
        const auto target = resolve(key);
        ensure_parent(target);
        write_file(target, data, std::ios::app);
    }

    std::optional<std::vector<std::byte>> FilesystemBlobStore::get(const std::string &key) const
    {
        const auto target = resolve(key);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(target, ec))
        {
            return std::nullopt;
        }
        std::ifstream in(target, std::ios::binary);
        if (!in.is_open())
        {
            throw StorageError("Failed to open blob " + key);
        }
        std::vector<std::byte> data;
        in.seekg(0, std::ios::end);
        const auto length = in.tellg();
        if (length < 0)
        {
            throw StorageError("Failed to size blob " + key);
        }
        in.seekg(0, std::ios::beg);
        data.resize(static_cast<std::size_t>(length));
        in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (in.gcount() != static_cast<std::streamsize>(data.size()))
        {
            throw StorageError("Short read on blob " + key);
        }
        return data;
    }

    std::optional<std::uint64_t> FilesystemBlobStore::size(const std::string &key) const
    {
        const auto target = resolve(key);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(target, ec))
        {
            return std::nullopt;
        }
        const auto bytes = std::filesystem::file_size(target, ec);
        if (ec)
        {
            throw StorageError("Failed to stat blob " + key + ": " + ec.message());
        }
        return bytes;
    }

    void FilesystemBlobStore::remove(const std::string &key)
    {
        const auto target = resolve(key);
        std::error_code ec;
        std::filesystem::remove(target, ec);
        if (ec)
        {
            throw StorageError("Failed to remove blob " + key + ": " + ec.message());
        }
        // Drop per-upload directories emptied by the removal. Top-level
        // namespaces stay so concurrent writers never lose their parent.
        auto parent = target.parent_path();
        while (parent != root_ && parent.parent_path() != root_ && std::filesystem::is_empty(parent, ec) && !ec)
        {
            std::filesystem::remove(parent, ec);
            parent = parent.parent_path();
        }
    }

    std::vector<std::string> FilesystemBlobStore::list(const std::string &prefix) const
    {
        std::vector<std::string> keys;
        std::error_code ec;
        if (!std::filesystem::exists(root_, ec))
        {
            return keys;
        }
        const auto slash = prefix.rfind('/');
        const auto start_dir = slash == std::string::npos ? root_ : root_ / prefix.substr(0, slash);
        if (!std::filesystem::is_directory(start_dir, ec))
        {
            return keys;
        }
        for (auto it = std::filesystem::recursive_directory_iterator(start_dir, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
        {
            if (!it->is_regular_file())
            {
                continue;
            }
            auto key = it->path().lexically_relative(root_).generic_string();
            if (key.find(kTempMarker) != std::string::npos || key.rfind(prefix, 0) != 0)
            {
                continue;
            }
            keys.push_back(std::move(key));
        }
        if (ec)
        {
            throw StorageError("Failed to list blobs under " + prefix + ": " + ec.message());
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    void FilesystemBlobStore::publish(const std::string &temp_key, const std::string &final_key)
    {
        const auto source = resolve(temp_key);
        const auto destination = resolve(final_key);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(source, ec))
        {
            throw StorageError("Cannot publish missing blob " + temp_key);
        }
        ensure_parent(destination);
        std::filesystem::rename(source, destination, ec);
        if (ec)
        {
            throw StorageError("Failed to publish " + temp_key + " as " + final_key + ": " + ec.message());
        }
    }

    std::string FilesystemBlobStore::locate(const std::string &key) const
    {
        return resolve(key).string();
    }

    std::filesystem::path FilesystemBlobStore::resolve(const std::string &key) const
    {
        validate_key(key);
        return root_ / std::filesystem::path(key);
    }

    void MemoryBlobStore::put(const std::string &key, std::span<const std::byte> data)
    {
        validate_key(key);
        std::lock_guard lock(mutex_);
        blobs_[key].assign(data.begin(), data.end());
    }

    void MemoryBlobStore::append(const std::string &key, std::span<const std::byte> data)
    {
        validate_key(key);
        std::lock_guard lock(mutex_);
        auto &blob = blobs_[key];
        blob.insert(blob.end(), data.begin(), data.end());
    }

    std::optional<std::vector<std::byte>> MemoryBlobStore::get(const std::string &key) const
    {
        std::lock_guard lock(mutex_);
        auto it = blobs_.find(key);
        if (it == blobs_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::uint64_t> MemoryBlobStore::size(const std::string &key) const
    {
        std::lock_guard lock(mutex_);
        auto it = blobs_.find(key);
        if (it == blobs_.end())
        {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(it->second.size());
    }

    void MemoryBlobStore::remove(const std::string &key)
    {
        std::lock_guard lock(mutex_);
        blobs_.erase(key);
    }

    std::vector<std::string> MemoryBlobStore::list(const std::string &prefix) const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> keys;
        for (auto it = blobs_.lower_bound(prefix); it != blobs_.end() && it->first.rfind(prefix, 0) == 0; ++it)
        {
            keys.push_back(it->first);
        }
        return keys;
    }

    void MemoryBlobStore::publish(const std::string &temp_key, const std::string &final_key)
    {
        validate_key(final_key);
        std::lock_guard lock(mutex_);
        auto it = blobs_.find(temp_key);
        if (it == blobs_.end())
        {
            throw StorageError("Cannot publish missing blob " + temp_key);
        }
        auto data = std::move(it->second);
        blobs_.erase(it);
        blobs_[final_key] = std::move(data);
    }

    std::string MemoryBlobStore::locate(const std::string &key) const
    {
        return "mem://" + key;
    }

    namespace blob_keys
    {

        bool is_safe_segment(std::string_view segment) noexcept
        {
            if (segment.empty() || segment == "." || segment == "..")
            {
                return false;
            }
            return std::none_of(segment.begin(), segment.end(), [](char ch)
                                {
                const auto c = static_cast<unsigned char>(ch);
                return ch == '/' || ch == '\\' || c < 0x20 || c == 0x7F; });
        }

        std::string chunk_prefix(const std::string &file_id)
        {
            return "chunks/" + file_id + "/";
        }

        std::string chunk_key(const std::string &file_id, std::uint32_t index)
        {
            return chunk_prefix(file_id) + std::to_string(index) + ".part";
        }

        std::string staging_key(const std::string &file_id)
        {
            return std::string(kStagingPrefix) + file_id + ".merging";
        }

        std::string artifact_key(const std::string &category, const std::string &filename)
        {
            return "files/" + category + "/" + filename;
        }

    } // namespace blob_keys

} // namespace chunkvault::server
