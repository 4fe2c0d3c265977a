#pragma once

#include "auth/account_store.hpp"
#include "auth/lockout_tracker.hpp"
#include "auth/profile_reconciler.hpp"
#include "config.hpp"
#include "directory/directory_client.hpp"
#include "directory/directory_session.hpp"
#include "logger/metrics.hpp"
#include "threadpool/threadpool.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace net = boost::asio;

namespace auth
{

/**
 * Password provider that checks credentials against an LDAP directory.
 *
 * simple mode binds directly as {uid}={localpart},{base}.
 * search mode binds as the configured service account, looks the user up and binds as the
 * entry found. Either way the user's attributes are then fetched and synced to the account store.
 *
 * Callers only ever learn accept/reject; reasons are logged.
 */
class LdapAuthProvider
{
public:
    struct AuthResult
    {
        enum class Status : uint8_t
        {
            Accepted,
            Rejected,
            LockedOut,
            Error,
        };

        Status status = Status::Rejected;
        std::optional<Identity> identity;
        std::string reason;

        [[nodiscard]] bool accepted() const { return status == Status::Accepted; }
    };

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // Throws std::invalid_argument when cfg names an unusable mode.
    LdapAuthProvider(Config::LdapCfg cfg,
                     directory::DirectoryClient& client,
                     AccountStore& store,
                     ThreadPool& tp,
                     Clock clock = [] { return std::chrono::system_clock::now(); });

    // Runs authenticate() on the worker pool.
    [[nodiscard]] net::awaitable<bool> check_password(std::string user_id, std::string password);

    // Blocking; performs directory I/O on the calling thread.
    [[nodiscard]] AuthResult authenticate(std::string_view user_id, std::string_view password);

    [[nodiscard]] const Config::LdapCfg& config() const { return cfg; }
    [[nodiscard]] LockoutTracker& lockouts() { return lockout; }
    [[nodiscard]] const AuthMetrics& metrics() const { return mts; }

private:
    struct BindFailure
    {
        directory::Failure failure;
        bool counts_against_user;
    };

    using BindOutcome = std::expected<directory::DirectorySession, BindFailure>;

    [[nodiscard]] BindOutcome bind_simple(std::string_view localpart, std::string_view password);
    [[nodiscard]] BindOutcome bind_search(std::string_view localpart, std::string_view password);
    [[nodiscard]] std::optional<std::string> user_filter() const;
    [[nodiscard]] std::vector<std::string> wanted_attributes() const;

    AuthResult reject(std::string reason);

    Config::LdapCfg cfg;
    std::reference_wrapper<directory::DirectoryClient> dir;
    std::reference_wrapper<ThreadPool> pool;
    Clock now;
    AuthMetrics mts;
    LockoutTracker lockout;
    ProfileReconciler reconciler;
};

}
