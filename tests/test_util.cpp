#include <catch2/catch.hpp>
#include "util.hpp"
#include <cstdlib>

using namespace sqlsession;

// ── timestamp_now ────────────────────────────────────────────────

TEST_CASE("timestamp_now: ISO 8601 UTC format", "[util]") {
    std::string ts = timestamp_now();
    REQUIRE(ts.size() == 20);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  hello \n") == "hello");
    REQUIRE(trim("\t") == "");
    REQUIRE(trim("a b") == "a b");
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~/x.db") == std::string(home) + "/x.db");
}

TEST_CASE("expand_home: leaves other paths alone", "[util]") {
    REQUIRE(expand_home("/abs/x.db") == "/abs/x.db");
    REQUIRE(expand_home("./rel.db") == "./rel.db");
    REQUIRE(expand_home(":memory:") == ":memory:");
    REQUIRE(expand_home("") == "");
}
