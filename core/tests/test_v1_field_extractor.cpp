#include <catch2/catch.hpp>

#include "bibkit/v1/field_extractor.hpp"

#include <string>

using namespace bibkit::v1;

namespace {

EntryBlock block_of(std::string body, std::string key = "k") {
    EntryBlock block;
    block.entry_type = "article";
    block.raw_key = std::move(key);
    block.body = std::move(body);
    block.start_line = 1;
    block.body_line = 1;
    return block;
}

}  // namespace

TEST_CASE("find_matching_brace and find_closing_quote honour nesting", "[v1][extractor]") {
    CHECK(find_matching_brace("{a{b}c}", 0) == 6);
    CHECK(find_matching_brace("{a\\}b}", 0) == 5);
    CHECK(find_matching_brace("{a", 0) == std::string_view::npos);

    CHECK(find_closing_quote("\"a{\"}\"", 0) == 5);
    CHECK(find_closing_quote("\"open", 0) == std::string_view::npos);
}

TEST_CASE("extract_fields splits delimited and bare values", "[v1][extractor]") {
    DiagnosticList diagnostics;
    const auto entry = extract_fields(
        block_of(" title = {Deep {Nested} Learning}, year = 2020, journal = \"J. Res\"\n"), diagnostics);

    CHECK(diagnostics.empty());
    REQUIRE(entry.fields.size() == 3);
    CHECK(entry.fields[0].name == "title");
    CHECK(entry.fields[0].value == "{Deep {Nested} Learning}");
    CHECK(entry.fields[1].name == "year");
    CHECK(entry.fields[1].value == "2020");
    CHECK(entry.fields[2].name == "journal");
    CHECK(entry.fields[2].value == "\"J. Res\"");
    CHECK(entry.raw_key == "k");
}

TEST_CASE("extract_fields keeps '#' concatenations intact", "[v1][extractor]") {
    DiagnosticList diagnostics;
    const auto entry = extract_fields(block_of(" title = \"Part \" # acm # {II}, note = x"), diagnostics);

    CHECK(diagnostics.empty());
    REQUIRE(entry.fields.size() == 2);
    CHECK(entry.fields[0].value == "\"Part \" # acm # {II}");
    CHECK(entry.fields[1].value == "x");
}

TEST_CASE("extract_fields retains empty values and accepts a trailing comma", "[v1][extractor]") {
    DiagnosticList diagnostics;
    const auto entry = extract_fields(block_of(" number = { }, note = \"\",\n"), diagnostics);

    CHECK(diagnostics.empty());
    REQUIRE(entry.fields.size() == 2);
    CHECK(entry.fields[0].value == "{ }");
    CHECK(entry.fields[1].value == "\"\"");
}

TEST_CASE("extract_fields tracks the source line of each field", "[v1][extractor]") {
    DiagnosticList diagnostics;
    const auto entry = extract_fields(block_of("\n  title = {T},\n  year = {2020}\n"), diagnostics);

    REQUIRE(entry.fields.size() == 2);
    CHECK(entry.fields[0].line == 2);
    CHECK(entry.fields[1].line == 3);
}

TEST_CASE("extract_fields reports malformed fields and keeps the rest", "[v1][extractor]") {
    DiagnosticList diagnostics;

    SECTION("segment without '='") {
        const auto entry = extract_fields(block_of(" title = {T}, garbage, year = 2020"), diagnostics);
        REQUIRE(entry.fields.size() == 2);
        CHECK(entry.fields[0].name == "title");
        CHECK(entry.fields[1].name == "year");
    }

    SECTION("invalid field name") {
        const auto entry = extract_fields(block_of(" 9lives = {x}, title = {T}"), diagnostics);
        REQUIRE(entry.fields.size() == 1);
        CHECK(entry.fields[0].name == "title");
    }

    SECTION("text after a value") {
        const auto entry = extract_fields(block_of(" title = {T} junk, year = 2020"), diagnostics);
        REQUIRE(entry.fields.size() == 1);
        CHECK(entry.fields[0].name == "year");
    }

    SECTION("value that never closes") {
        const auto entry = extract_fields(block_of(" title = {T}, abstract = {never closed"), diagnostics);
        REQUIRE(entry.fields.size() == 1);
        CHECK(entry.fields[0].name == "title");
    }

    SECTION("quoted value with an unbalanced brace") {
        const auto entry = extract_fields(block_of(" title = \"a {b\""), diagnostics);
        CHECK(entry.fields.empty());
    }

    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].kind == DiagnosticKind::MalformedField);
    CHECK(diagnostics[0].entry_key == std::string("k"));
    CHECK_FALSE(diagnostics[0].is_fatal());
}

TEST_CASE("extract_fields drops only a quoted value with unbalanced braces", "[v1][extractor]") {
    DiagnosticList diagnostics;
    const std::string body = " note = \"an {unbalanced brace\", title = {Kept Title}, year = {2020}";

    CHECK(find_closing_quote(body, 8) == std::string_view::npos);
    CHECK(find_flat_quote(body, 8) == 29);

    const auto entry = extract_fields(block_of(body), diagnostics);

    REQUIRE(entry.fields.size() == 2);
    CHECK(entry.fields[0].name == "title");
    CHECK(entry.fields[0].value == "{Kept Title}");
    CHECK(entry.fields[1].name == "year");

    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].kind == DiagnosticKind::MalformedField);
    CHECK(diagnostics[0].message.find("'note'") != std::string::npos);
}
