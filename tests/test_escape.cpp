#include <catch2/catch_test_macros.hpp>

#include "directory/escape.hpp"

#include <string>

using namespace directory;

TEST_CASE("escape_filter_value leaves ordinary user names alone")
{
    CHECK(escape_filter_value("alice") == "alice");
    CHECK(escape_filter_value("j.doe-2") == "j.doe-2");
}

TEST_CASE("escape_filter_value escapes filter metacharacters")
{
    CHECK(escape_filter_value("*") == "\\2a");
    CHECK(escape_filter_value("a)(uid=*") == "a\\29\\28uid=\\2a");
    CHECK(escape_filter_value("back\\slash") == "back\\5cslash");
    CHECK(escape_filter_value(std::string("nul\0x", 5)) == "nul\\00x");
}

TEST_CASE("escape_dn_value escapes special characters")
{
    CHECK(escape_dn_value("alice") == "alice");
    CHECK(escape_dn_value("doe,john") == "doe\\,john");
    CHECK(escape_dn_value("a+b=c") == "a\\+b\\=c");
    CHECK(escape_dn_value("#hash") == "\\#hash");
    CHECK(escape_dn_value(" padded ") == "\\ padded\\ ");
}
