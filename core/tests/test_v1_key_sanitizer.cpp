#include <catch2/catch.hpp>

#include "bibkit/v1/key_sanitizer.hpp"

#include <algorithm>
#include <cctype>

using namespace bibkit::v1;

TEST_CASE("sanitize_key replaces whitespace runs deterministically", "[v1][keys]") {
    const std::string first = sanitize_key("Smith  2020 memory", 1);
    const std::string second = sanitize_key("Smith  2020 memory", 1);

    CHECK(first == "Smith_2020_memory");
    CHECK(first == second);
    CHECK(std::none_of(first.begin(), first.end(), [](unsigned char c) { return std::isspace(c) != 0; }));
}

TEST_CASE("sanitize_key keeps the allowed punctuation", "[v1][keys]") {
    CHECK(sanitize_key("  Hana KIKUCHI20252024-0217 ", 3) == "Hana_KIKUCHI20252024-0217");
    CHECK(sanitize_key("doe:2019.v2", 1) == "doe:2019.v2");
    CHECK(sanitize_key("_private_", 1) == "_private_");
}

TEST_CASE("sanitize_key collapses disallowed runs and trims introduced underscores", "[v1][keys]") {
    CHECK(sanitize_key("{weird}/key!", 1) == "weird_key");
    CHECK(sanitize_key("M\xC3\xBCller2020", 1) == "M_ller2020");
    CHECK(sanitize_key("a, b", 1) == "a_b");
}

TEST_CASE("sanitize_key falls back to a positional placeholder", "[v1][keys]") {
    CHECK(sanitize_key("", 4) == "entry_4");
    CHECK(sanitize_key("   ", 5) == "entry_5");
    CHECK(sanitize_key("!!!", 2) == "entry_2");
    CHECK(sanitize_key("", 7, "ref") == "ref7");
}

TEST_CASE("KeySanitizer disambiguates different raw keys in file order", "[v1][keys]") {
    KeySanitizer keys;
    DiagnosticList diagnostics;

    const auto a = keys.assign("Smith 2020", 1, 1, diagnostics);
    const auto b = keys.assign("Smith/2020", 2, 5, diagnostics);
    const auto c = keys.assign("Smith;2020", 3, 9, diagnostics);

    CHECK(a.key == "Smith_2020");
    CHECK(a.occurrence == 1);
    CHECK(b.key == "Smith_2020_2");
    CHECK(b.base == "Smith_2020");
    CHECK(c.key == "Smith_2020_3");

    REQUIRE(diagnostics.size() == 2);
    CHECK(diagnostics[0].kind == DiagnosticKind::KeyCollisionResolved);
    CHECK(diagnostics[0].source_line == 5);
    CHECK(diagnostics[0].entry_key == std::string("Smith_2020_2"));
    CHECK(diagnostics[0].severity() == Severity::Info);
}

TEST_CASE("KeySanitizer maps a repeated raw key to the same key", "[v1][keys]") {
    KeySanitizer keys;
    DiagnosticList diagnostics;

    const auto first = keys.assign("dup key", 1, 1, diagnostics);
    const auto again = keys.assign("  dup key", 2, 7, diagnostics);

    CHECK(first.key == "dup_key");
    CHECK(again.key == "dup_key");
    CHECK(diagnostics.empty());
}

TEST_CASE("KeySanitizer never reissues a generated suffix", "[v1][keys]") {
    KeySanitizer keys;
    DiagnosticList diagnostics;

    CHECK(keys.assign("a b", 1, 1, diagnostics).key == "a_b");
    CHECK(keys.assign("a/b", 2, 2, diagnostics).key == "a_b_2");
    // Literally spelled like the generated key: must not merge with "a/b".
    CHECK(keys.assign("a_b_2", 3, 3, diagnostics).key == "a_b_2_2");
}

TEST_CASE("KeySanitizer gives empty keys distinct placeholders", "[v1][keys]") {
    KeySanitizer keys("anon_");
    DiagnosticList diagnostics;

    CHECK(keys.assign("", 1, 1, diagnostics).key == "anon_1");
    CHECK(keys.assign(" ", 2, 2, diagnostics).key == "anon_2");
    CHECK(diagnostics.empty());

    keys.reset();
    CHECK(keys.assign("", 1, 1, diagnostics).key == "anon_1");
}
