#include "auth/ldap_auth_provider.hpp"
#include "auth/user_id.hpp"
#include "directory/escape.hpp"
#include "directory/search_resolver.hpp"
#include "logger/logger.hpp"

#include <format>
#include <stdexcept>

namespace auth
{

LdapAuthProvider::LdapAuthProvider(Config::LdapCfg config,
                                   directory::DirectoryClient& client,
                                   AccountStore& store,
                                   ThreadPool& tp,
                                   Clock clock)
    : cfg(std::move(config))
    , dir(client)
    , pool(tp)
    , now(std::move(clock))
    , lockout(cfg.lockout)
    , reconciler(store, cfg.attributes, mts)
{
    switch (cfg.mode)
    {
        case Config::LdapMode::Simple:
            break;
        case Config::LdapMode::Search:
            if (!cfg.search)
            {
                throw std::invalid_argument("LDAP search mode requires bind_dn and bind_password");
            }
            break;
        default:
            throw std::invalid_argument(std::format("Invalid LDAP mode specified: {}",
                                                    static_cast<int>(cfg.mode)));
    }
}

net::awaitable<bool> LdapAuthProvider::check_password(std::string user_id, std::string password)
{
    try
    {
        auto result = co_await pool.get().async_submit(
            [this, user_id = std::move(user_id), password = std::move(password)] {
                return authenticate(user_id, password);
            });
        co_return result.accepted();
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("LDAP password check aborted: {}", e.what());
    }
    co_return false;
}

LdapAuthProvider::AuthResult LdapAuthProvider::authenticate(std::string_view user_id, std::string_view password)
{
    mts.attempts++;

    if (password.empty())
    {
        return reject("empty password");
    }

    auto normalized = normalize_user_id(user_id);
    auto localpart = extract_localpart(normalized);
    if (!localpart)
    {
        LOG_INFO("Rejecting login for malformed user id '{}'", normalized);
        return reject("malformed user id");
    }

    auto ts = now();
    if (auto remaining = lockout.seconds_to_unlock(*localpart, ts); remaining)
    {
        LOG_ERROR("User {} is locked by account lockout policy. This login attempt will fail. "
                  "Seconds to unlock: {}", normalized, remaining->count());
        mts.locked_out++;
        mts.rejected++;
        return AuthResult{AuthResult::Status::LockedOut, std::nullopt, "locked out"};
    }

    auto bound = cfg.mode == Config::LdapMode::Search
        ? bind_search(*localpart, password)
        : bind_simple(*localpart, password);
    if (!bound)
    {
        if (bound.error().failure.kind == directory::Failure::Kind::ProtocolError)
        {
            mts.directory_errors++;
        }
        if (bound.error().counts_against_user)
        {
            lockout.record_failure(*localpart, ts);
        }
        return reject(std::move(bound.error().failure.reason));
    }
    LOG_INFO("User {} authenticated against LDAP server as {}", normalized, bound->bound_dn());

    // The simple bind never saw the entry, so attributes are always fetched separately.
    auto filter = directory::build_filter(cfg.attributes.uid, *localpart, user_filter());
    auto entry = directory::find_unique_entry(*bound, cfg.base, filter, wanted_attributes());
    bound->close();
    if (!entry)
    {
        mts.directory_errors++;
        return reject(std::move(entry.error().reason));
    }
    if (!*entry)
    {
        LOG_WARN("LDAP auth for {} failed, no unique entry for attributes", normalized);
        return reject("attribute lookup did not resolve to one entry");
    }

    lockout.clear(*localpart);

    auto identity = reconciler.reconcile(normalized, *localpart, **entry);
    if (!identity)
    {
        mts.rejected++;
        return AuthResult{AuthResult::Status::Error, std::nullopt, std::move(identity.error())};
    }

    LOG_INFO("Auth based on LDAP data was successful: {}: {}", identity->user_id, *localpart);
    mts.accepted++;
    return AuthResult{AuthResult::Status::Accepted, std::move(*identity), {}};
}

LdapAuthProvider::BindOutcome LdapAuthProvider::bind_simple(std::string_view localpart, std::string_view password)
{
    auto bind_dn = std::format("{}={},{}", cfg.attributes.uid, directory::escape_dn_value(localpart), cfg.base);

    // Any failure of the user's own bind counts, including a failed StartTLS or a dropped connection.
    auto session = directory::DirectorySession::bind(dir.get(), cfg.uri, bind_dn, password, cfg.start_tls);
    if (!session)
    {
        return std::unexpected(BindFailure{std::move(session.error()), true});
    }
    return std::move(*session);
}

LdapAuthProvider::BindOutcome LdapAuthProvider::bind_search(std::string_view localpart, std::string_view password)
{
    const auto& sb = *cfg.search;

    auto service = directory::DirectorySession::bind(dir.get(), cfg.uri, sb.bind_dn, sb.bind_password, cfg.start_tls);
    if (!service)
    {
        // The service account failed, not the user: nothing is recorded against them.
        LOG_WARN("LDAP bind with bind_dn {} failed: {}", sb.bind_dn, service.error().reason);
        return std::unexpected(BindFailure{std::move(service.error()), false});
    }

    auto filter = directory::build_filter(cfg.attributes.uid, localpart, sb.filter);
    auto found = directory::find_unique_entry(*service, cfg.base, filter, {});
    service->close();
    if (!found)
    {
        return std::unexpected(BindFailure{std::move(found.error()), false});
    }
    if (!*found)
    {
        LOG_INFO("LDAP search did not resolve {} to a single entry", localpart);
        return std::unexpected(BindFailure{
            directory::Failure{directory::Failure::Kind::Rejected, "no unique entry"}, true});
    }

    auto user = directory::DirectorySession::bind(dir.get(), cfg.uri, (*found)->dn, password, cfg.start_tls);
    if (!user)
    {
        return std::unexpected(BindFailure{std::move(user.error()), true});
    }
    return std::move(*user);
}

std::optional<std::string> LdapAuthProvider::user_filter() const
{
    if (cfg.mode == Config::LdapMode::Search && cfg.search)
    {
        return cfg.search->filter;
    }
    return std::nullopt;
}

std::vector<std::string> LdapAuthProvider::wanted_attributes() const
{
    std::vector<std::string> wanted{cfg.attributes.uid, cfg.attributes.name};
    if (cfg.attributes.mail)
    {
        wanted.push_back(*cfg.attributes.mail);
    }
    if (cfg.attributes.msisdn)
    {
        wanted.push_back(*cfg.attributes.msisdn);
    }
    return wanted;
}

LdapAuthProvider::AuthResult LdapAuthProvider::reject(std::string reason)
{
    LOG_DEBUG("LDAP authentication rejected: {}", reason);
    mts.rejected++;
    return AuthResult{AuthResult::Status::Rejected, std::nullopt, std::move(reason)};
}

}
