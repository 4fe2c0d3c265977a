#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <algorithm>
#include <format>
#include <ranges>
#include <string>
#include <vector>

struct AuthMetrics
{
    std::atomic<uint64_t> attempts{0};
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> locked_out{0};
    std::atomic<uint64_t> directory_errors{0};
    std::atomic<uint64_t> accounts_provisioned{0};
    std::atomic<uint64_t> threepid_conflicts{0};

    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

    AuthMetrics() = default;
};

template<>
struct std::formatter<AuthMetrics>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const AuthMetrics& m, std::format_context& fc) const
    {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - m.start_time).count();

        uint64_t attempts = m.attempts.load();
        uint64_t ok = m.accepted.load();
        uint64_t rejected = m.rejected.load();
        uint64_t locked = m.locked_out.load();

        std::vector<std::string> lines;

        lines.push_back(std::format("--- LDAP AUTHENTICATION ---"));
        lines.push_back(std::format("  Uptime:          {}s", uptime));
        lines.push_back(std::format("  Attempts:        {}", attempts));
        lines.push_back(std::format("  Accepted:        {}", ok));
        lines.push_back(std::format("  Rejected:        {}", rejected));
        lines.push_back(std::format("  Locked out:      {}", locked));
        lines.push_back(std::format("  Success Rate:    {:.1f}%", attempts > 0 ?
                    (ok * 100.0 / attempts) : 0.0));
        lines.push_back(std::format("  Dir. errors:     {}", m.directory_errors.load()));
        lines.push_back(std::format("  Provisioned:     {}", m.accounts_provisioned.load()));
        lines.push_back(std::format("  3pid conflicts:  {}", m.threepid_conflicts.load()));

        return std::ranges::copy(lines | std::views::join_with('\n'), fc.out()).out;
    }
};
