#include <catch2/catch_test_macros.hpp>

#include "auth/ldap_auth_provider.hpp"
#include "fakes/fake_directory.hpp"
#include "fakes/memory_account_store.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace auth;
using namespace std::chrono_literals;
using Status = LdapAuthProvider::AuthResult::Status;

namespace {

constexpr auto base_dn = "dc=example,dc=org";
constexpr auto alice_dn = "uid=alice,dc=example,dc=org";
constexpr auto service_dn = "cn=svc,dc=example,dc=org";
constexpr auto person_filter = "(&(uid=alice)(objectClass=person))";

Config::LdapCfg simple_config()
{
    Config::LdapCfg cfg;
    cfg.enabled = true;
    cfg.mode = Config::LdapMode::Simple;
    cfg.uri = "ldap://ldap.example.org:389";
    cfg.base = base_dn;
    cfg.attributes.uid = "uid";
    cfg.attributes.name = "cn";
    cfg.attributes.mail = "mail";
    return cfg;
}

Config::LdapCfg search_config()
{
    auto cfg = simple_config();
    cfg.mode = Config::LdapMode::Search;
    cfg.search = Config::SearchBind{service_dn, "svcpass", "(objectClass=person)"};
    return cfg;
}

directory::AttributeValues alice_attributes()
{
    return {
        {"uid", {"alice"}},
        {"cn", {"Alice"}},
        {"mail", {"alice@example.org"}},
    };
}

// Fixed clock the tests move by hand.
struct ManualClock
{
    std::chrono::system_clock::time_point t{std::chrono::sys_days{std::chrono::year{2024} / 1 / 1}};

    LdapAuthProvider::Clock fn()
    {
        return [this] { return t; };
    }
};

}

TEST_CASE("LdapAuthProvider rejects an empty password without contacting the directory")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "");
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    LdapAuthProvider provider(simple_config(), dir, store, pool);

    auto result = provider.authenticate("@alice:example.org", "");

    CHECK(result.status == Status::Rejected);
    CHECK(dir.calls() == 0);
    CHECK(store.registrations == 0);
}

TEST_CASE("LdapAuthProvider rejects a user id without a localpart")
{
    fakes::FakeDirectory dir;
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    LdapAuthProvider provider(simple_config(), dir, store, pool);

    CHECK(provider.authenticate("@:example.org", "secret").status == Status::Rejected);
    CHECK(provider.authenticate("", "secret").status == Status::Rejected);
    CHECK(dir.calls() == 0);
}

TEST_CASE("LdapAuthProvider simple mode binds as the templated DN and syncs the profile")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    dir.add_entry("(uid=alice)", alice_dn, alice_attributes());
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    LdapAuthProvider provider(simple_config(), dir, store, pool);

    auto result = provider.authenticate("@Alice:Example.org", "secret");

    REQUIRE(result.accepted());
    REQUIRE(result.identity.has_value());
    CHECK(result.identity->user_id == "@alice:example.org");
    CHECK(result.identity->localpart == "alice");
    CHECK(result.identity->provisioned);

    CHECK(dir.bind_attempts == std::vector<std::string>{alice_dn});
    CHECK(dir.searches == std::vector<std::string>{"(uid=alice)"});
    CHECK(dir.requested_attributes.front() == std::vector<std::string>{"uid", "cn", "mail"});
    CHECK(dir.open_connections() == 0);
    CHECK(dir.leaked == 0);

    CHECK(store.registrations == 1);
    CHECK(store.display_name_writes == 1);
    CHECK(store.display_names["alice"] == "Alice");
    CHECK(store.get_user_id_by_threepid("email", "alice@example.org") == "@alice:example.org");
    CHECK(provider.metrics().accepted.load() == 1);
}

TEST_CASE("LdapAuthProvider issues StartTLS before binding when configured")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    dir.add_entry("(uid=alice)", alice_dn, alice_attributes());
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    auto cfg = simple_config();
    cfg.start_tls = true;
    LdapAuthProvider provider(cfg, dir, store, pool);

    REQUIRE(provider.authenticate("@alice:example.org", "secret").accepted());
    REQUIRE(dir.events.size() >= 4);
    CHECK(dir.events[0] == "connect:ldap://ldap.example.org:389");
    CHECK(dir.events[1] == "open");
    CHECK(dir.events[2] == "start_tls");
    CHECK(dir.events[3] == std::string("bind:") + alice_dn);
}

TEST_CASE("LdapAuthProvider does not provision an existing account twice")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    dir.add_entry("(uid=alice)", alice_dn, alice_attributes());
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    LdapAuthProvider provider(simple_config(), dir, store, pool);

    REQUIRE(provider.authenticate("@alice:example.org", "secret").accepted());
    auto again = provider.authenticate("@alice:example.org", "secret");

    REQUIRE(again.accepted());
    CHECK_FALSE(again.identity->provisioned);
    CHECK(store.registrations == 1);
    CHECK(store.threepid_writes == 1);
    CHECK(again.identity->emails == std::vector<std::string>{"alice@example.org"});
}

TEST_CASE("LdapAuthProvider counts a wrong password against the localpart")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    auto cfg = simple_config();
    cfg.lockout = Config::LockoutPolicy{3, 60s};
    LdapAuthProvider provider(cfg, dir, store, pool);

    auto result = provider.authenticate("@alice:example.org", "wrong");

    CHECK(result.status == Status::Rejected);
    CHECK(provider.lockouts().failures("alice") == 1);
    CHECK(dir.count("search:") == 0);
    CHECK(dir.open_connections() == 0);
    CHECK(store.registrations == 0);
}

TEST_CASE("LdapAuthProvider locks out after repeated failures without contacting the directory")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    dir.add_entry("(uid=alice)", alice_dn, alice_attributes());
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    ManualClock clock;
    auto cfg = simple_config();
    cfg.lockout = Config::LockoutPolicy{3, 60s};
    LdapAuthProvider provider(cfg, dir, store, pool, clock.fn());

    for (int i = 0; i < 3; ++i)
    {
        CHECK(provider.authenticate("@alice:example.org", "wrong").status == Status::Rejected);
        clock.t += 1s;
    }
    REQUIRE(provider.lockouts().failures("alice") == 3);

    auto calls_before = dir.calls();
    auto locked = provider.authenticate("@alice:example.org", "secret");

    CHECK(locked.status == Status::LockedOut);
    CHECK(dir.calls() == calls_before);
    CHECK(provider.metrics().locked_out.load() == 1);

    SECTION("the lock lifts once the lock time has passed and success resets the count")
    {
        clock.t += 61s;
        REQUIRE(provider.authenticate("@alice:example.org", "secret").accepted());
        CHECK(provider.lockouts().failures("alice") == 0);
    }
}

TEST_CASE("LdapAuthProvider lockout is per localpart")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    dir.add_user("uid=bob,dc=example,dc=org", "hunter2");
    dir.add_entry("(uid=bob)", "uid=bob,dc=example,dc=org", {{"uid", {"bob"}}, {"cn", {"Bob"}}});
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    ManualClock clock;
    auto cfg = simple_config();
    cfg.lockout = Config::LockoutPolicy{1, 300s};
    LdapAuthProvider provider(cfg, dir, store, pool, clock.fn());

    CHECK(provider.authenticate("@alice:example.org", "wrong").status == Status::Rejected);
    CHECK(provider.authenticate("@alice:example.org", "secret").status == Status::LockedOut);
    CHECK(provider.authenticate("@bob:example.org", "hunter2").accepted());
}

TEST_CASE("LdapAuthProvider without a lockout policy never locks")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    dir.add_entry("(uid=alice)", alice_dn, alice_attributes());
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    LdapAuthProvider provider(simple_config(), dir, store, pool);

    for (int i = 0; i < 20; ++i)
    {
        CHECK(provider.authenticate("@alice:example.org", "wrong").status == Status::Rejected);
    }
    CHECK(provider.authenticate("@alice:example.org", "secret").accepted());
}

TEST_CASE("LdapAuthProvider counts a directory error during the user bind as a failure")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    dir.throw_on_bind = true;
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    auto cfg = simple_config();
    cfg.lockout = Config::LockoutPolicy{2, 300s};
    LdapAuthProvider provider(cfg, dir, store, pool);

    CHECK(provider.authenticate("@alice:example.org", "secret").status == Status::Rejected);
    CHECK(provider.lockouts().failures("alice") == 1);
    CHECK(provider.metrics().directory_errors.load() == 1);
    CHECK(dir.open_connections() == 0);
}

TEST_CASE("LdapAuthProvider counts a failed StartTLS upgrade as a failure")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    dir.add_entry("(uid=alice)", alice_dn, alice_attributes());
    dir.fail_start_tls = true;
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    ManualClock clock;
    auto cfg = simple_config();
    cfg.start_tls = true;
    cfg.lockout = Config::LockoutPolicy{1, 300s};
    LdapAuthProvider provider(cfg, dir, store, pool, clock.fn());

    CHECK(provider.authenticate("@alice:example.org", "secret").status == Status::Rejected);
    CHECK(provider.lockouts().failures("alice") == 1);
    CHECK(dir.count("bind:") == 0);
    CHECK(dir.open_connections() == 0);

    dir.fail_start_tls = false;
    CHECK(provider.authenticate("@alice:example.org", "secret").status == Status::LockedOut);
}

TEST_CASE("LdapAuthProvider search mode counts a directory error during the user bind")
{
    fakes::FakeDirectory dir;
    dir.add_user(service_dn, "svcpass");
    dir.add_user("uid=alice,ou=people,dc=example,dc=org", "secret");
    dir.add_entry(person_filter, "uid=alice,ou=people,dc=example,dc=org", alice_attributes());
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    auto cfg = search_config();
    cfg.start_tls = true;
    cfg.lockout = Config::LockoutPolicy{3, 300s};

    // The service session upgrades fine; only the second connection's StartTLS fails.
    struct FailSecondUpgrade final : directory::DirectoryClient
    {
        fakes::FakeDirectory& inner;
        explicit FailSecondUpgrade(fakes::FakeDirectory& d) : inner(d) {}
        std::unique_ptr<directory::DirectoryConnection> connect(std::string_view uri,
                                                                std::string_view bind_dn,
                                                                std::string_view secret) override
        {
            inner.fail_start_tls = inner.connects >= 1;
            return inner.connect(uri, bind_dn, secret);
        }
    };
    FailSecondUpgrade client(dir);
    LdapAuthProvider provider(cfg, client, store, pool);

    CHECK(provider.authenticate("@alice:example.org", "secret").status == Status::Rejected);
    CHECK(provider.lockouts().failures("alice") == 1);
    CHECK(dir.bind_attempts == std::vector<std::string>{service_dn});
    CHECK(dir.open_connections() == 0);
}

TEST_CASE("LdapAuthProvider rejects when the attribute lookup finds nothing")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    auto cfg = simple_config();
    cfg.lockout = Config::LockoutPolicy{3, 300s};
    LdapAuthProvider provider(cfg, dir, store, pool);

    auto result = provider.authenticate("@alice:example.org", "secret");

    CHECK(result.status == Status::Rejected);
    CHECK(provider.lockouts().failures("alice") == 0);
    CHECK(store.registrations == 0);
    CHECK(dir.open_connections() == 0);
}

TEST_CASE("LdapAuthProvider reports an error when the account cannot be registered")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    dir.add_entry("(uid=alice)", alice_dn, alice_attributes());
    fakes::MemoryAccountStore store;
    store.fail_registration = true;
    ThreadPool pool(1);
    LdapAuthProvider provider(simple_config(), dir, store, pool);

    auto result = provider.authenticate("@alice:example.org", "secret");

    CHECK(result.status == Status::Error);
    CHECK_FALSE(result.accepted());
    CHECK(store.display_name_writes == 0);
}

TEST_CASE("LdapAuthProvider search mode resolves the DN with the service account")
{
    fakes::FakeDirectory dir;
    dir.add_user(service_dn, "svcpass");
    dir.add_user("uid=alice,ou=people,dc=example,dc=org", "secret");
    dir.add_entry(person_filter, "uid=alice,ou=people,dc=example,dc=org", alice_attributes());
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    LdapAuthProvider provider(search_config(), dir, store, pool);

    auto result = provider.authenticate("@alice:example.org", "secret");

    REQUIRE(result.accepted());
    CHECK(dir.bind_attempts == std::vector<std::string>{service_dn, "uid=alice,ou=people,dc=example,dc=org"});
    CHECK(dir.searches == std::vector<std::string>{person_filter, person_filter});
    CHECK(dir.requested_attributes.front().empty());
    CHECK(dir.open_connections() == 0);
    CHECK(dir.leaked == 0);
    CHECK(store.display_names["alice"] == "Alice");
}

TEST_CASE("LdapAuthProvider search mode rejects an ambiguous lookup")
{
    fakes::FakeDirectory dir;
    dir.add_user(service_dn, "svcpass");
    dir.add_user("uid=alice,ou=a,dc=example,dc=org", "secret");
    dir.add_entry(person_filter, "uid=alice,ou=a,dc=example,dc=org");
    dir.add_entry(person_filter, "uid=alice,ou=b,dc=example,dc=org");
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    auto cfg = search_config();
    cfg.lockout = Config::LockoutPolicy{3, 300s};
    LdapAuthProvider provider(cfg, dir, store, pool);

    auto result = provider.authenticate("@alice:example.org", "secret");

    CHECK(result.status == Status::Rejected);
    CHECK(dir.bind_attempts == std::vector<std::string>{service_dn});
    CHECK(provider.lockouts().failures("alice") == 1);
    CHECK(dir.open_connections() == 0);
}

TEST_CASE("LdapAuthProvider search mode ignores referrals when counting entries")
{
    fakes::FakeDirectory dir;
    dir.add_user(service_dn, "svcpass");
    dir.add_user("uid=alice,ou=people,dc=example,dc=org", "secret");
    dir.add_reference(person_filter);
    dir.add_entry(person_filter, "uid=alice,ou=people,dc=example,dc=org", alice_attributes());
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    LdapAuthProvider provider(search_config(), dir, store, pool);

    CHECK(provider.authenticate("@alice:example.org", "secret").accepted());
}

TEST_CASE("LdapAuthProvider search mode does not blame the user for a failed service bind")
{
    fakes::FakeDirectory dir;
    dir.add_user(service_dn, "rotated");
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    auto cfg = search_config();
    cfg.lockout = Config::LockoutPolicy{1, 300s};
    LdapAuthProvider provider(cfg, dir, store, pool);

    CHECK(provider.authenticate("@alice:example.org", "secret").status == Status::Rejected);
    CHECK(provider.lockouts().failures("alice") == 0);
    CHECK(dir.bind_attempts == std::vector<std::string>{service_dn});
    CHECK(dir.count("search:") == 0);
    CHECK(dir.open_connections() == 0);
}

TEST_CASE("LdapAuthProvider search mode counts a wrong user password")
{
    fakes::FakeDirectory dir;
    dir.add_user(service_dn, "svcpass");
    dir.add_user("uid=alice,ou=people,dc=example,dc=org", "secret");
    dir.add_entry(person_filter, "uid=alice,ou=people,dc=example,dc=org", alice_attributes());
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    auto cfg = search_config();
    cfg.lockout = Config::LockoutPolicy{3, 300s};
    LdapAuthProvider provider(cfg, dir, store, pool);

    CHECK(provider.authenticate("@alice:example.org", "wrong").status == Status::Rejected);
    CHECK(provider.lockouts().failures("alice") == 1);
    CHECK(dir.open_connections() == 0);
}

TEST_CASE("LdapAuthProvider escapes the localpart in filters")
{
    fakes::FakeDirectory dir;
    dir.add_user(service_dn, "svcpass");
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    LdapAuthProvider provider(search_config(), dir, store, pool);

    CHECK(provider.authenticate("@a*)(uid=*:example.org", "secret").status == Status::Rejected);
    REQUIRE(dir.searches.size() == 1);
    CHECK(dir.searches.front() == "(&(uid=a\\2a\\29\\28uid=\\2a)(objectClass=person))");
}

TEST_CASE("LdapAuthProvider refuses search mode without a service account")
{
    fakes::FakeDirectory dir;
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    auto cfg = simple_config();
    cfg.mode = Config::LdapMode::Search;

    CHECK_THROWS_AS(LdapAuthProvider(cfg, dir, store, pool), std::invalid_argument);
}

TEST_CASE("LdapAuthProvider check_password runs on the worker pool")
{
    fakes::FakeDirectory dir;
    dir.add_user(alice_dn, "secret");
    dir.add_entry("(uid=alice)", alice_dn, alice_attributes());
    fakes::MemoryAccountStore store;
    ThreadPool pool(2);
    LdapAuthProvider provider(simple_config(), dir, store, pool);

    net::io_context ic;
    std::vector<bool> outcomes;
    net::co_spawn(ic,
        [&]() -> net::awaitable<void>
        {
            outcomes.push_back(co_await provider.check_password("@alice:example.org", "secret"));
            outcomes.push_back(co_await provider.check_password("@alice:example.org", "wrong"));
        },
        net::detached
    );
    ic.run();

    CHECK(outcomes == std::vector<bool>{true, false});
    CHECK(dir.open_connections() == 0);
}

TEST_CASE("LdapAuthProvider check_password reports false once the pool is stopped")
{
    fakes::FakeDirectory dir;
    fakes::MemoryAccountStore store;
    ThreadPool pool(1);
    LdapAuthProvider provider(simple_config(), dir, store, pool);
    pool.stop();

    net::io_context ic;
    bool accepted = true;
    net::co_spawn(ic,
        [&]() -> net::awaitable<void>
        {
            accepted = co_await provider.check_password("@alice:example.org", "secret");
        },
        net::detached
    );
    ic.run();

    CHECK_FALSE(accepted);
    CHECK(dir.calls() == 0);
}
