#include <catch2/catch.hpp>

#include "bibkit/v1/assembler.hpp"

using namespace bibkit::v1;

namespace {

Paper make(std::string key, std::string title, std::size_t line) {
    Paper paper;
    paper.key = std::move(key);
    paper.title = std::move(title);
    paper.source_line = line;
    return paper;
}

}  // namespace

TEST_CASE("Assembler keeps papers in order of first acceptance", "[v1][assembler]") {
    Assembler assembler;
    DiagnosticList diagnostics;

    assembler.add(make("a", "A", 1), diagnostics);
    assembler.add(make("b", "B", 5), diagnostics);
    assembler.add(make("c", "C", 9), diagnostics);

    CHECK(assembler.size() == 3);
    CHECK(assembler.contains("b"));
    CHECK(diagnostics.empty());

    const auto papers = std::move(assembler).finish();
    REQUIRE(papers.size() == 3);
    CHECK(papers[0].key == "a");
    CHECK(papers[2].key == "c");
}

TEST_CASE("Assembler replaces a duplicate key in place, last wins", "[v1][assembler]") {
    Assembler assembler;
    DiagnosticList diagnostics;

    assembler.add(make("dup", "First", 1), diagnostics);
    assembler.add(make("other", "Other", 4), diagnostics);
    assembler.add(make("dup", "Second", 8), diagnostics);

    REQUIRE(assembler.size() == 2);
    CHECK(assembler.papers()[0].key == "dup");
    CHECK(assembler.papers()[0].title == "Second");
    CHECK(assembler.papers()[0].source_line == 8);
    CHECK(assembler.papers()[1].key == "other");

    REQUIRE(diagnostics.size() == 1);
    const auto& d = diagnostics[0];
    CHECK(d.kind == DiagnosticKind::DuplicateKey);
    CHECK(d.entry_key == std::string("dup"));
    CHECK(d.source_line == 1);
    CHECK(d.related_line == std::size_t{8});
    CHECK(d.severity() == Severity::Warning);
}
