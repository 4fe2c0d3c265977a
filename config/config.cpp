#include "config.hpp"

#include <fstream>
#include <sstream>
#include <format>
#include <vector>
#include <initializer_list>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

// Present keys are type checked; absent keys are reported together by require_keys.
std::expected<std::string, std::string> get_required_string(const json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("'{}' is required", key));
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    return std::string(it->value().as_string());
}

std::expected<std::optional<std::string>, std::string> get_optional_string(const json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null())
    {
        return std::optional<std::string>{};
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    if (it->value().as_string().empty())
    {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>(std::string(it->value().as_string()));
}

std::expected<void, std::string> require_keys(const json::object& obj, std::initializer_list<std::string_view> required)
{
    std::string missing;
    for (auto key : required)
    {
        if (!obj.contains(key))
        {
            if (!missing.empty())
            {
                missing += ", ";
            }
            missing += key;
        }
    }
    if (!missing.empty())
    {
        return std::unexpected(std::format("LDAP enabled but missing required config values: {}", missing));
    }
    return {};
}

std::expected<Config::LockoutPolicy, std::string> parse_lockout(const json::object& alp)
{
    // "attemps" is the historical spelling still found in deployed configs.
    const bool legacy = !alp.contains("attempts") && alp.contains("attemps");
    if (auto req = require_keys(alp, {legacy ? "attemps" : "attempts", "locktime_s"}); !req)
    {
        return std::unexpected(req.error());
    }

    Config::LockoutPolicy policy;
    if (auto attempts = get_uint<uint32_t>(alp, legacy ? "attemps" : "attempts", 1, 1000, 5); attempts)
    {
        policy.attempts = *attempts;
    }
    else
    {
        return std::unexpected(attempts.error());
    }
    if (auto locktime = get_uint<uint64_t>(alp, "locktime_s", 1, 86400 * 365, 300); locktime)
    {
        policy.locktime = std::chrono::seconds(*locktime);
    }
    else
    {
        return std::unexpected(locktime.error());
    }
    return policy;
}

} // namespace

std::string_view to_string(Config::LdapMode mode)
{
    switch (mode)
    {
        case Config::LdapMode::Simple: return "simple";
        case Config::LdapMode::Search: return "search";
    }
    return "unknown";
}

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

std::expected<Config, std::string> Config::load_from_string(std::string_view text)
{
    json::value jv;
    try
    {
        jv = json::parse(text);
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    return parse(jv);
}

std::expected<Config::LdapCfg, std::string> Config::parse_ldap(const json::object& obj)
{
    if (auto req = require_keys(obj, {"uri", "base", "attributes"}); !req)
    {
        return std::unexpected(req.error());
    }

    LdapCfg cfg;
    cfg.enabled = get_bool(obj, "enabled", false);
    cfg.start_tls = get_bool(obj, "start_tls", false);

    if (auto uri = get_required_string(obj, "uri"); uri)
    {
        cfg.uri = std::move(*uri);
    }
    else
    {
        return std::unexpected(uri.error());
    }
    if (auto base = get_required_string(obj, "base"); base)
    {
        cfg.base = std::move(*base);
    }
    else
    {
        return std::unexpected(base.error());
    }

    const auto& attr_val = obj.at("attributes");
    if (!attr_val.is_object())
    {
        return std::unexpected("'attributes' must be an object");
    }
    const auto& attrs = attr_val.as_object();
    if (auto req = require_keys(attrs, {"uid", "name"}); !req)
    {
        return std::unexpected(req.error());
    }
    if (auto uid = get_required_string(attrs, "uid"); uid)
    {
        cfg.attributes.uid = std::move(*uid);
    }
    else
    {
        return std::unexpected(uid.error());
    }
    if (auto name = get_required_string(attrs, "name"); name)
    {
        cfg.attributes.name = std::move(*name);
    }
    else
    {
        return std::unexpected(name.error());
    }
    if (auto mail = get_optional_string(attrs, "mail"); mail)
    {
        cfg.attributes.mail = std::move(*mail);
    }
    else
    {
        return std::unexpected(mail.error());
    }
    if (auto msisdn = get_optional_string(attrs, "msisdn"); msisdn)
    {
        cfg.attributes.msisdn = std::move(*msisdn);
    }
    else
    {
        return std::unexpected(msisdn.error());
    }

    cfg.mode = obj.contains("bind_dn") ? LdapMode::Search : LdapMode::Simple;
    if (auto it = obj.find("mode"); it != obj.end())
    {
        std::string mode = it->value().is_string() ? std::string(it->value().as_string()) : json::serialize(it->value());
        if (mode == "simple")
        {
            cfg.mode = LdapMode::Simple;
        }
        else if (mode == "search")
        {
            cfg.mode = LdapMode::Search;
        }
        else
        {
            return std::unexpected(std::format("Invalid LDAP mode specified: {}", mode));
        }
    }

    if (cfg.mode == LdapMode::Search)
    {
        if (auto req = require_keys(obj, {"bind_dn", "bind_password"}); !req)
        {
            return std::unexpected(req.error());
        }
        SearchBind sb;
        if (auto dn = get_required_string(obj, "bind_dn"); dn)
        {
            sb.bind_dn = std::move(*dn);
        }
        else
        {
            return std::unexpected(dn.error());
        }
        if (auto pw = get_required_string(obj, "bind_password"); pw)
        {
            sb.bind_password = std::move(*pw);
        }
        else
        {
            return std::unexpected(pw.error());
        }
        if (auto filter = get_optional_string(obj, "filter"); filter)
        {
            sb.filter = std::move(*filter);
        }
        else
        {
            return std::unexpected(filter.error());
        }
        cfg.search = std::move(sb);
    }

    if (auto it = obj.find("account_lockout_policy"); it != obj.end())
    {
        if (!it->value().is_object())
        {
            return std::unexpected("'account_lockout_policy' must be an object");
        }
        auto policy = parse_lockout(it->value().as_object());
        if (!policy)
        {
            return std::unexpected(policy.error());
        }
        cfg.lockout = *policy;
    }

    if (auto timeout = get_uint<uint64_t>(obj, "timeout_s", 1, 600, 10); timeout)
    {
        cfg.timeout = std::chrono::seconds(*timeout);
    }
    else
    {
        return std::unexpected(timeout.error());
    }

    return cfg;
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;

    auto ldap_it = root.find("ldap");
    if (ldap_it == root.end() || !ldap_it->value().is_object())
    {
        return std::unexpected("Config requires an 'ldap' object");
    }
    if (auto ldap = parse_ldap(ldap_it->value().as_object()); ldap)
    {
        config.ldp = std::move(*ldap);
    }
    else
    {
        return std::unexpected(ldap.error());
    }

    if (auto it = root.find("account_store"); it != root.end() && it->value().is_object())
    {
        const auto& st = it->value().as_object();
        config.store.path = get_string(st, "path", "accounts.db");
        config.store.server_name = get_string(st, "server_name", "localhost");
        if (config.store.server_name.empty())
        {
            return std::unexpected("'server_name' must not be empty");
        }
    }
    if (auto it = root.find("workers"); it != root.end() && it->value().is_object())
    {
        const auto& wrk = it->value().as_object();
        if (auto threads = get_uint<size_t>(wrk, "threads", 0, 256, 0); threads)
        {
            config.wrk.threads = *threads;
        }
        else
        {
            return std::unexpected(threads.error());
        }
    }
    if (auto it = root.find("logging"); it != root.end() && it->value().is_object())
    {
        const auto& log = it->value().as_object();
        config.log.level = get_string(log, "level", "info");
        config.log.file = get_string(log, "file", "");
        if (auto max_size = get_uint<size_t>(log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        config.log.enable_console = get_bool(log, "enable_console", true);
    }
    return config;
}
