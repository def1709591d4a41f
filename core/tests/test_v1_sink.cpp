#include <catch2/catch.hpp>

#include "bibkit/v1/sink.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace bibkit::v1;

namespace {

class CollectingSink final : public PaperSink {
public:
    void accept(const Paper& paper) override { keys.push_back(paper.key); }
    void finish() override { finished = true; }

    std::vector<std::string> keys;
    bool finished = false;
};

const char* kTwoEntries =
    "@article{first, title={One}, author={A and B}, year={2001}, abstract={x}, doi={https://doi.org/10.1/a}}\n"
    "@book{second, title={Two}, publisher={Pub}}\n";

}  // namespace

TEST_CASE("Paper converts to JSON", "[v1][sink]") {
    Paper paper;
    paper.key = "k";
    paper.entry_type = "article";
    paper.title = "T";
    paper.authors = {"A", "B"};
    paper.year = 1999;
    paper.extra_fields["journal"] = "J";

    const nlohmann::json j = paper;

    CHECK(j.at("key") == "k");
    CHECK(j.at("authors").size() == 2);
    CHECK(j.at("year") == 1999);
    CHECK(j.at("doi").is_null());
    CHECK(j.at("extra_fields").at("journal") == "J");
    CHECK_FALSE(j.contains("source_text"));
}

TEST_CASE("Diagnostic converts to JSON with its code", "[v1][sink]") {
    Diagnostic diagnostic;
    diagnostic.kind = DiagnosticKind::DuplicateKey;
    diagnostic.entry_key = "dup";
    diagnostic.source_line = 3;
    diagnostic.related_line = 9;
    diagnostic.message = "m";

    const nlohmann::json j = diagnostic;

    CHECK(j.at("code") == "BIBKIT_W_DUPLICATE_KEY");
    CHECK(j.at("severity") == "warning");
    CHECK(j.at("entry_key") == "dup");
    CHECK(j.at("related_line") == 9);
}

TEST_CASE("JsonLinesSink writes one object per paper", "[v1][sink]") {
    const auto result = parse_bibtex(kTwoEntries);
    REQUIRE(result.papers.size() == 2);

    std::ostringstream out;
    JsonLinesSink sink(out);
    CHECK(publish(result, sink) == 2);
    CHECK(sink.written() == 2);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<nlohmann::json> objects;
    while (std::getline(lines, line)) {
        objects.push_back(nlohmann::json::parse(line));
    }

    REQUIRE(objects.size() == 2);
    CHECK(objects[0].at("key") == "first");
    CHECK(objects[0].at("doi") == "10.1/a");
    CHECK(objects[1].at("key") == "second");
    CHECK(objects[1].at("year").is_null());
    CHECK(objects[1].at("extra_fields").at("publisher") == "Pub");
}

TEST_CASE("publish hands papers over in order and finishes the sink", "[v1][sink]") {
    const auto result = parse_bibtex(kTwoEntries);
    CollectingSink sink;

    publish(result, sink);

    CHECK(sink.keys == std::vector<std::string>{"first", "second"});
    CHECK(sink.finished);
}
