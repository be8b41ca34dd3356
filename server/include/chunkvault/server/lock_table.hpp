#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkvault::server
{

    // Hands out one mutex per key. Entries live as long as some caller holds
    // the returned pointer and are pruned lazily afterwards.
    template <typename Mutex>
    class LockTable
    {
    public:
        std::shared_ptr<Mutex> acquire(const std::string &key)
        {
            std::lock_guard lock(mutex_);
            auto &slot = entries_[key];
            auto existing = slot.lock();
            if (!existing)
            {
                existing = std::make_shared<Mutex>();
                slot = existing;
            }
            if (entries_.size() >= next_prune_)
            {
                prune_locked();
            }
            return existing;
        }

        std::size_t size() const
        {
            std::lock_guard lock(mutex_);
            return entries_.size();
        }

    private:
        static constexpr std::size_t kMinPruneThreshold = 64;

        void prune_locked()
        {
            for (auto it = entries_.begin(); it != entries_.end();)
            {
                if (it->second.expired())
                {
                    it = entries_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
            next_prune_ = std::max(kMinPruneThreshold, entries_.size() * 2);
        }

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::weak_ptr<Mutex>> entries_;
        std::size_t next_prune_{kMinPruneThreshold};
    };

} // namespace chunkvault::server
