#include <catch2/catch.hpp>

#include "bibkit/v1/parser/yaml_options.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace bibkit::v1;
using namespace bibkit::v1::parser;

namespace {

bool has_message(const std::vector<std::string>& messages, const std::string& fragment) {
    return std::any_of(messages.begin(), messages.end(),
                       [&](const std::string& m) { return m.find(fragment) != std::string::npos; });
}

}  // namespace

TEST_CASE("YAML options load every section", "[v1][yaml][config]") {
    const std::string content = R"(schema: bibkit-v1
version: 1
validation:
  recommended_fields: [Author, DOI]
normalization:
  expand_month_macros: false
  report_unsupported_escapes: false
  homogenize_fields: false
keys:
  placeholder_prefix: ref_
output:
  keep_source_text: true
)";

    YamlOptionsLoader loader;
    const EngineOptions options = loader.load_string(content);

    INFO((loader.errors().empty() ? std::string() : loader.errors().front()));
    REQUIRE(loader.ok());
    CHECK(options.recommended_fields == std::vector<std::string>{"author", "doi"});
    CHECK_FALSE(options.expand_month_macros);
    CHECK_FALSE(options.report_unsupported_escapes);
    CHECK_FALSE(options.homogenize_fields);
    CHECK(options.placeholder_prefix == "ref_");
    CHECK(options.keep_source_text);
}

TEST_CASE("YAML options default when sections are absent", "[v1][yaml][config]") {
    YamlOptionsLoader loader;
    const EngineOptions options = loader.load_string("schema: bibkit-v1\nversion: 1\n");

    REQUIRE(loader.ok());
    CHECK(options.recommended_fields == EngineOptions{}.recommended_fields);
    CHECK(options.expand_month_macros);
    CHECK(options.homogenize_fields);
    CHECK(options.placeholder_prefix == "entry_");
}

TEST_CASE("YAML options reject unknown fields in strict mode", "[v1][yaml][config]") {
    const std::string content = "schema: bibkit-v1\nversion: 1\nnormalization:\n  bogus: 1\n";

    YamlOptionsLoader strict;
    (void)strict.load_string(content);
    CHECK_FALSE(strict.ok());
    CHECK(has_message(strict.errors(), "[BIBKIT_CFG_E_UNKNOWN_FIELD] Unknown field at 'normalization.bogus'"));

    YamlOptionsLoader lenient(YamlOptionsLoaderOptions{false});
    (void)lenient.load_string(content);
    CHECK(lenient.ok());
    CHECK(has_message(lenient.warnings(), "normalization.bogus"));
}

TEST_CASE("YAML options report type mismatches and keep defaults", "[v1][yaml][config]") {
    const std::string content =
        "schema: bibkit-v1\nversion: 1\n"
        "normalization:\n  expand_month_macros: [1, 2]\n"
        "output:\n  keep_source_text: maybe\n"
        "validation:\n  recommended_fields: author\n";

    YamlOptionsLoader loader;
    const EngineOptions options = loader.load_string(content);

    CHECK(loader.errors().size() == 3);
    CHECK(has_message(loader.errors(), "[BIBKIT_CFG_E_TYPE_MISMATCH] Type mismatch at 'normalization.expand_month_macros'"));
    CHECK(has_message(loader.errors(), "'output.keep_source_text'"));
    CHECK(has_message(loader.errors(), "'validation.recommended_fields'"));
    CHECK(options.expand_month_macros);
    CHECK_FALSE(options.keep_source_text);
}

TEST_CASE("YAML options validate the schema header", "[v1][yaml][config]") {
    YamlOptionsLoader loader;

    (void)loader.load_string("schema: other\nversion: 1\n");
    CHECK(has_message(loader.errors(), "Unsupported schema: other"));

    (void)loader.load_string("schema: bibkit-v1\nversion: 2\n");
    CHECK(has_message(loader.errors(), "Unsupported schema version: 2"));

    (void)loader.load_string("schema: bibkit-v1\n");
    CHECK(has_message(loader.errors(), "Missing required field 'version'"));
}

TEST_CASE("YAML options reject a placeholder prefix that is not a valid key", "[v1][yaml][config]") {
    YamlOptionsLoader loader;
    const EngineOptions options =
        loader.load_string("schema: bibkit-v1\nversion: 1\nkeys:\n  placeholder_prefix: \"bad prefix\"\n");

    CHECK(has_message(loader.errors(), "BIBKIT_CFG_E_VALUE_INVALID"));
    CHECK(options.placeholder_prefix == "entry_");
}

TEST_CASE("YAML options surface syntax and I/O errors", "[v1][yaml][config]") {
    YamlOptionsLoader loader;

    (void)loader.load_string("schema: [unclosed\n");
    CHECK(has_message(loader.errors(), "YAML parse error"));

    (void)loader.load("/nonexistent/bibkit/options.yaml");
    CHECK(has_message(loader.errors(), "Cannot open file"));
}
