#include "auth/ldap_auth_provider.hpp"
#include "auth/sqlite_account_store.hpp"
#include "auth/user_id.hpp"
#include "config.hpp"
#include "directory/openldap_client.hpp"
#include "logger/logger.hpp"
#include "logger/metrics.hpp"
#include "threadpool/threadpool.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <print>
#include <string>
#include <string_view>
#include <vector>

void print_usage(const char* prog)
{
    std::println("Usage: {} [-c <config.json>] <command> [args]", prog);
    std::println("Commands:");
    std::println("  check <user_id> <password>   Authenticate against LDAP and sync the account");
    std::println("  list                         List local accounts");
    std::println("  show <user_id>               Show display name and threepids");
}

int cmd_check(const Config& config, auth::SqliteAccountStore& store, std::string_view user, std::string_view pass)
{
    if (!config.ldap().enabled)
    {
        std::println(stderr, "LDAP authentication is disabled in the configuration");
        return 1;
    }

    ThreadPool pool(default_worker_count(config.workers().threads));
    directory::OpenLdapClient client(config.ldap().timeout);
    auth::LdapAuthProvider provider(config.ldap(), client, store, pool);

    net::io_context ic;
    bool accepted = false;
    net::co_spawn(ic,
        [&]() -> net::awaitable<void>
        {
            accepted = co_await provider.check_password(std::string(user), std::string(pass));
        },
        net::detached
    );
    ic.run();

    LOG_DEBUG("{}", provider.metrics());

    if (accepted)
    {
        std::println("Accepted");
        return 0;
    }
    std::println("Rejected");
    return 2;
}

int cmd_list(auth::SqliteAccountStore& store)
{
    auto users = store.list_users();
    if (users.empty())
    {
        std::println("No users found");
        return 0;
    }

    std::println("{:<40} {:<20} {}", "User ID", "Localpart", "Created");
    std::println("{}", std::string(72, '-'));

    for (const auto& u : users)
    {
        std::println("{:<40} {:<20} {}", u.user_id, u.localpart, u.created_at);
    }

    return 0;
}

int cmd_show(auth::SqliteAccountStore& store, std::string_view user)
{
    auto user_id = auth::normalize_user_id(user);
    auto localpart = auth::extract_localpart(user_id);
    if (!localpart || !store.user_exists(user_id))
    {
        std::println(stderr, "User '{}' not found", user);
        return 1;
    }

    std::println("User:         {}", user_id);
    std::println("Display name: {}", store.get_display_name(*localpart).value_or("(none)"));
    for (const auto& t : store.list_threepids(user_id))
    {
        std::println("{:<13} {} (validated {})", t.medium + ":", t.address, t.validated_at);
    }
    return 0;
}

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path = "ldapauth.json";
    if (args.size() >= 2 && args[0] == "-c")
    {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty())
    {
        print_usage(argv[0]);
        return 1;
    }

    auto config = Config::load(config_path);
    if (!config)
    {
        std::println(stderr, "Failed to load {}: {}", config_path, config.error());
        return 1;
    }

    auto log_cfg = config->logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    auto store_res = auth::SqliteAccountStore::open(config->account_store().path, config->account_store().server_name);
    if (!store_res)
    {
        std::println(stderr, "Failed to open {}: {}", config->account_store().path, store_res.error());
        return 1;
    }
    auto& store = *store_res;
    if (!store.init_schema())
    {
        std::println(stderr, "Failed to initialize account store schema");
        return 1;
    }

    const std::string& cmd = args[0];
    int rc = 1;
    try
    {
        if (cmd == "check" && args.size() == 3)
        {
            rc = cmd_check(*config, store, args[1], args[2]);
        }
        else if (cmd == "list")
        {
            rc = cmd_list(store);
        }
        else if (cmd == "show" && args.size() == 2)
        {
            rc = cmd_show(store, args[1]);
        }
        else
        {
            print_usage(argv[0]);
        }
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Fatal: {}", e.what());
        rc = 1;
    }

    Logger::shutdown();
    return rc;
}
