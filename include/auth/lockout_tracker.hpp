#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace auth
{

/**
 * Per-localpart failed login counter.
 * A localpart is locked once its count reaches policy.attempts and stays locked until
 * policy.locktime has passed since its last failure. Counts only reset on success (clear).
 * Without a policy the tracker never locks and never records.
 */
class LockoutTracker
{
public:
    using clock = std::chrono::system_clock;

    static constexpr size_t default_prune_threshold = 10000;

    explicit LockoutTracker(std::optional<Config::LockoutPolicy> policy,
                            size_t prune_threshold = default_prune_threshold);

    [[nodiscard]] bool enabled() const { return policy.has_value(); }
    [[nodiscard]] bool is_locked(std::string_view localpart, clock::time_point now) const;
    [[nodiscard]] std::optional<std::chrono::seconds> seconds_to_unlock(std::string_view localpart,
                                                                        clock::time_point now) const;

    void record_failure(std::string_view localpart, clock::time_point now);
    void clear(std::string_view localpart);

    // Drops entries whose last failure is older than the lock time. Returns how many were dropped.
    size_t prune(clock::time_point now);

    [[nodiscard]] uint32_t failures(std::string_view localpart) const;
    [[nodiscard]] size_t size() const;

private:
    struct Entry
    {
        uint32_t count = 0;
        clock::time_point last_failure{};
    };

    size_t prune_locked(clock::time_point now);

    std::optional<Config::LockoutPolicy> policy;
    size_t prune_threshold;
    mutable std::mutex mtx;
    std::unordered_map<std::string, Entry> entries;
};

}
