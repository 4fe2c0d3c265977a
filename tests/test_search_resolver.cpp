#include <catch2/catch_test_macros.hpp>

#include "directory/search_resolver.hpp"
#include "fakes/fake_directory.hpp"

#include <string>
#include <vector>

using namespace directory;

namespace {

constexpr const char* uri = "ldap://ldap.example.org";
constexpr const char* base = "dc=example,dc=org";
constexpr const char* svc_dn = "cn=svc,dc=example,dc=org";

DirectorySession bind_service(fakes::FakeDirectory& dir)
{
    dir.add_user(svc_dn, "svcpass");
    auto session = DirectorySession::bind(dir, uri, svc_dn, "svcpass", false);
    REQUIRE(session.has_value());
    return std::move(*session);
}

}

TEST_CASE("build_filter produces an equality filter")
{
    CHECK(build_filter("uid", "alice") == "(uid=alice)");
}

TEST_CASE("build_filter combines with an extra filter")
{
    CHECK(build_filter("uid", "alice", std::string("(objectClass=person)")) == "(&(uid=alice)(objectClass=person))");
    CHECK(build_filter("uid", "alice", std::string("objectClass=person")) == "(&(uid=alice)(objectClass=person))");
    CHECK(build_filter("uid", "alice", std::string("")) == "(uid=alice)");
}

TEST_CASE("build_filter escapes the value")
{
    CHECK(build_filter("uid", "*") == "(uid=\\2a)");
}

TEST_CASE("find_unique_entry returns the single matching entry")
{
    fakes::FakeDirectory dir;
    auto session = bind_service(dir);
    dir.add_entry("(uid=alice)", "uid=alice,dc=example,dc=org",
                  AttributeValues{{"cn", {"Alice"}}, {"mail", {"alice@example.org", "a@example.org"}}});

    auto found = find_unique_entry(session, base, "(uid=alice)", {"uid", "cn", "mail"});

    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    const auto& entry = **found;
    CHECK(entry.dn == "uid=alice,dc=example,dc=org");
    CHECK(entry.first("CN") == "Alice");
    CHECK(entry.values("mail").size() == 2);
    CHECK(entry.values("telephoneNumber").empty());
    CHECK(dir.requested_attributes.back() == std::vector<std::string>{"uid", "cn", "mail"});
}

TEST_CASE("find_unique_entry yields nothing for zero entries")
{
    fakes::FakeDirectory dir;
    auto session = bind_service(dir);

    auto found = find_unique_entry(session, base, "(uid=nobody)", {});

    REQUIRE(found.has_value());
    CHECK_FALSE(found->has_value());
}

TEST_CASE("find_unique_entry refuses to pick one of several entries")
{
    fakes::FakeDirectory dir;
    auto session = bind_service(dir);
    dir.add_entry("(uid=dup)", "uid=dup,ou=a,dc=example,dc=org");
    dir.add_entry("(uid=dup)", "uid=dup,ou=b,dc=example,dc=org");

    auto found = find_unique_entry(session, base, "(uid=dup)", {});

    REQUIRE(found.has_value());
    CHECK_FALSE(found->has_value());
}

TEST_CASE("find_unique_entry ignores referrals")
{
    fakes::FakeDirectory dir;
    auto session = bind_service(dir);
    dir.add_reference("(uid=alice)");
    dir.add_entry("(uid=alice)", "uid=alice,dc=example,dc=org");
    dir.add_reference("(uid=alice)");

    auto found = find_unique_entry(session, base, "(uid=alice)", {});

    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    CHECK((*found)->dn == "uid=alice,dc=example,dc=org");
}

TEST_CASE("find_unique_entry converts search errors")
{
    fakes::FakeDirectory dir;
    auto session = bind_service(dir);
    dir.throw_on_search = true;

    auto found = find_unique_entry(session, base, "(uid=alice)", {});

    REQUIRE(!found.has_value());
    CHECK(found.error().kind == Failure::Kind::ProtocolError);
}
