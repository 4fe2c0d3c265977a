#include "auth/lockout_tracker.hpp"

#include <unordered_map>

namespace auth
{

LockoutTracker::LockoutTracker(std::optional<Config::LockoutPolicy> pol, size_t threshold)
    : policy(pol)
    , prune_threshold(threshold)
{
}

bool LockoutTracker::is_locked(std::string_view localpart, clock::time_point now) const
{
    return seconds_to_unlock(localpart, now).has_value();
}

std::optional<std::chrono::seconds> LockoutTracker::seconds_to_unlock(std::string_view localpart,
                                                                      clock::time_point now) const
{
    if (!policy)
    {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mtx);
    auto it = entries.find(std::string(localpart));
    if (it == entries.end() || it->second.count < policy->attempts)
    {
        return std::nullopt;
    }

    auto unlock_at = it->second.last_failure + policy->locktime;
    if (now > unlock_at)
    {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(unlock_at - now);
}

void LockoutTracker::record_failure(std::string_view localpart, clock::time_point now)
{
    if (!policy)
    {
        return;
    }

    std::lock_guard<std::mutex> lock(mtx);
    if (entries.size() >= prune_threshold)
    {
        prune_locked(now);
    }
    auto& entry = entries[std::string(localpart)];
    ++entry.count;
    entry.last_failure = now;
}

void LockoutTracker::clear(std::string_view localpart)
{
    std::lock_guard<std::mutex> lock(mtx);
    entries.erase(std::string(localpart));
}

size_t LockoutTracker::prune(clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mtx);
    return prune_locked(now);
}

size_t LockoutTracker::prune_locked(clock::time_point now)
{
    if (!policy)
    {
        return 0;
    }
    return std::erase_if(entries, [&](const auto& kv) {
        return now > kv.second.last_failure + policy->locktime;
    });
}

uint32_t LockoutTracker::failures(std::string_view localpart) const
{
    std::lock_guard<std::mutex> lock(mtx);
    auto it = entries.find(std::string(localpart));
    return it == entries.end() ? 0 : it->second.count;
}

size_t LockoutTracker::size() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return entries.size();
}

}
