#include <catch2/catch.hpp>

#include "bibkit/v1/validator.hpp"

#include <string>
#include <vector>

using namespace bibkit::v1;

namespace {

EntryIdentity identity_of(std::string key, std::size_t line = 1) {
    EntryIdentity identity;
    identity.key = std::move(key);
    identity.entry_type = "article";
    identity.source_line = line;
    return identity;
}

std::size_t count_kind(const DiagnosticList& diagnostics, DiagnosticKind kind) {
    std::size_t n = 0;
    for (const auto& d : diagnostics) {
        if (d.kind == kind) ++n;
    }
    return n;
}

}  // namespace

TEST_CASE("parse_year takes the first four-digit run", "[v1][validator]") {
    CHECK(parse_year("2020") == 2020);
    CHECK(parse_year("c. 1999?") == 1999);
    CHECK(parse_year("2019--2020") == 2019);
    CHECK(parse_year("12345") == 1234);
    CHECK_FALSE(parse_year("n.d.").has_value());
    CHECK_FALSE(parse_year("99").has_value());
}

TEST_CASE("split_authors splits on 'and' surrounded by whitespace", "[v1][validator]") {
    CHECK(split_authors("A. Smith and B. Jones") == std::vector<std::string>{"A. Smith", "B. Jones"});
    CHECK(split_authors("Ann Anderson AND Bob\nand  Carl") ==
          std::vector<std::string>{"Ann Anderson", "Bob", "Carl"});
    CHECK(split_authors("Sandy Andrews") == std::vector<std::string>{"Sandy Andrews"});
    CHECK(split_authors(" and Solo and ") == std::vector<std::string>{"Solo"});
    CHECK(split_authors("").empty());
}

TEST_CASE("split_authors keeps braced groups whole", "[v1][validator]") {
    CHECK(split_authors("{Procter and Gamble} and Ann Lee") ==
          std::vector<std::string>{"{Procter and Gamble}", "Ann Lee"});
    CHECK(split_authors("{A {and} B} and C") == std::vector<std::string>{"{A {and} B}", "C"});
}

TEST_CASE("clean_doi strips resolver prefixes", "[v1][validator]") {
    CHECK(clean_doi("10.1000/xyz") == "10.1000/xyz");
    CHECK(clean_doi(" https://doi.org/10.1000/xyz ") == "10.1000/xyz");
    CHECK(clean_doi("http://dx.doi.org/10.1000/abc") == "10.1000/abc");
    CHECK(clean_doi("DOI: 10.1000/abc") == "10.1000/abc");
}

TEST_CASE("validate_entry promotes known fields", "[v1][validator]") {
    const std::vector<NormalizedField> fields{
        {"title", "Deep Learning in Medicine"},
        {"author", "A. Smith and B. Jones"},
        {"year", "2020"},
        {"abstract", "A study."},
        {"doi", "doi:10.1/x"},
        {"journal", "Nature"},
    };
    DiagnosticList diagnostics;

    const auto paper = validate_entry(identity_of("Smith_2020", 4), fields, ValidationPolicy{}, diagnostics);

    REQUIRE(paper);
    CHECK(diagnostics.empty());
    CHECK(paper->key == "Smith_2020");
    CHECK(paper->title == "Deep Learning in Medicine");
    CHECK(paper->authors == std::vector<std::string>{"A. Smith", "B. Jones"});
    CHECK(paper->year == 2020);
    CHECK(paper->abstract == "A study.");
    CHECK(paper->doi == std::string("10.1/x"));
    CHECK(paper->source_line == 4);
    REQUIRE(paper->extra_fields.size() == 1);
    CHECK(paper->extra_fields.at("journal") == "Nature");
}

TEST_CASE("validate_entry rejects entries without a title", "[v1][validator]") {
    DiagnosticList diagnostics;

    SECTION("absent") {
        CHECK_FALSE(validate_entry(identity_of("k"), {{"author", "X"}}, ValidationPolicy{}, diagnostics));
    }
    SECTION("empty") {
        CHECK_FALSE(validate_entry(identity_of("k"), {{"title", ""}}, ValidationPolicy{}, diagnostics));
    }

    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].kind == DiagnosticKind::MissingRequiredField);
    CHECK(diagnostics[0].is_fatal());
}

TEST_CASE("validate_entry warns about missing recommended fields", "[v1][validator]") {
    DiagnosticList diagnostics;
    const auto paper = validate_entry(identity_of("k"), {{"title", "T"}, {"author", ""}}, ValidationPolicy{},
                                      diagnostics);

    REQUIRE(paper);
    CHECK(paper->authors.empty());
    CHECK_FALSE(paper->year.has_value());
    CHECK(paper->abstract.empty());
    CHECK(count_kind(diagnostics, DiagnosticKind::MissingRecommendedField) == 3);
}

TEST_CASE("validate_entry honours a custom recommended set", "[v1][validator]") {
    ValidationPolicy policy;
    policy.recommended_fields = {"doi"};
    DiagnosticList diagnostics;

    const auto paper = validate_entry(identity_of("k"), {{"title", "T"}}, policy, diagnostics);

    REQUIRE(paper);
    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].kind == DiagnosticKind::MissingRecommendedField);
}

TEST_CASE("validate_entry flags an unparseable year", "[v1][validator]") {
    DiagnosticList diagnostics;
    const auto paper = validate_entry(identity_of("k"),
                                      {{"title", "T"}, {"author", "A"}, {"year", "forthcoming"}, {"abstract", "x"}},
                                      ValidationPolicy{}, diagnostics);

    REQUIRE(paper);
    CHECK_FALSE(paper->year.has_value());
    CHECK(paper->extra_fields.at("year") == "forthcoming");
    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].kind == DiagnosticKind::FieldFormatWarning);
}

TEST_CASE("merge_duplicate_fields keeps the last value in first position", "[v1][validator]") {
    DiagnosticList diagnostics;
    const auto merged = merge_duplicate_fields(
        {{"title", "First"}, {"year", "2020"}, {"title", "Second"}}, {std::string("k"), 2}, diagnostics);

    REQUIRE(merged.size() == 2);
    CHECK(merged[0].name == "title");
    CHECK(merged[0].value == "Second");
    CHECK(merged[1].name == "year");
    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].kind == DiagnosticKind::DuplicateField);
}

TEST_CASE("make_paper builds a paper from extracted document text", "[v1][validator]") {
    const ContentNormalizer normalizer;
    DiagnosticList diagnostics;

    ExtractedDocument document;
    document.source_name = "My Paper (final).pdf";
    document.title = "  Extracted   {Title} ";
    document.authors = "Ada Lovelace and Charles Babbage";
    document.year = "Published 1843";
    document.abstract = "Notes on the engine.";
    document.body = "Full text\x01 here";

    const auto paper = make_paper(document, 1, normalizer, ValidationPolicy{}, diagnostics);

    REQUIRE(paper);
    CHECK(diagnostics.empty());
    CHECK(paper->key == "My_Paper_final_.pdf");
    CHECK(paper->entry_type == "document");
    CHECK(paper->title == "Extracted Title");
    CHECK(paper->authors.size() == 2);
    CHECK(paper->year == 1843);
    CHECK_FALSE(paper->doi.has_value());
    CHECK(paper->extra_fields.at("body") == "Full text here");
}

TEST_CASE("make_paper rejects a document without a title", "[v1][validator]") {
    const ContentNormalizer normalizer;
    DiagnosticList diagnostics;

    ExtractedDocument document;
    document.source_name = "";
    document.abstract = "Only an abstract";

    CHECK_FALSE(make_paper(document, 3, normalizer, ValidationPolicy{}, diagnostics));
    REQUIRE_FALSE(diagnostics.empty());
    CHECK(diagnostics[0].kind == DiagnosticKind::MissingRequiredField);
    CHECK(diagnostics[0].entry_key == std::string("document_3"));
}
