#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <optional>
#include <cstdint>
#include <chrono>
#include <string_view>

namespace json = boost::json;

/**
 * Provider configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    enum class LdapMode : uint8_t
    {
        Simple,
        Search,
    };

    struct AttributeMap
    {
        std::string uid;
        std::string name;
        std::optional<std::string> mail;
        std::optional<std::string> msisdn;
    };

    // Service account used to look the user up before binding as them.
    struct SearchBind
    {
        std::string bind_dn;
        std::string bind_password;
        std::optional<std::string> filter;
    };

    struct LockoutPolicy
    {
        uint32_t attempts = 5;
        std::chrono::seconds locktime{300};
    };

    struct LdapCfg
    {
        bool enabled = false;
        LdapMode mode = LdapMode::Simple;
        std::string uri;
        bool start_tls = false;
        std::string base;
        AttributeMap attributes;
        std::optional<SearchBind> search;
        std::optional<LockoutPolicy> lockout;
        std::chrono::seconds timeout{10};
    };

    struct AccountStoreCfg
    {
        std::string path = "accounts.db";
        std::string server_name = "localhost";
    };

    struct WorkersCfg
    {
        size_t threads = 0;
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static std::expected<Config, std::string> load_from_string(std::string_view text);
    [[nodiscard]] static std::expected<LdapCfg, std::string> parse_ldap(const json::object& obj);

    [[nodiscard]] const LdapCfg& ldap() const { return ldp; }
    [[nodiscard]] const AccountStoreCfg& account_store() const { return store; }
    [[nodiscard]] const WorkersCfg& workers() const { return wrk; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    LdapCfg ldp;
    AccountStoreCfg store;
    WorkersCfg wrk;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};

[[nodiscard]] std::string_view to_string(Config::LdapMode mode);
