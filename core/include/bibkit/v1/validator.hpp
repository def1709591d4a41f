#pragma once

#include "bibkit/v1/diagnostics.hpp"
#include "bibkit/v1/entry.hpp"
#include "bibkit/v1/normalizer.hpp"
#include "bibkit/v1/paper.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bibkit::v1 {

struct ValidationPolicy {
    // Missing or empty -> MissingRecommendedField. `title` is always required.
    std::vector<std::string> recommended_fields{"author", "year", "abstract"};
};

/// Identity of an entry once its key is settled.
struct EntryIdentity {
    std::string key;
    std::string entry_type;
    std::size_t source_line = 0;
    std::string source_text;
};

/// First run of four digits anywhere in `value` ("c. 1999?" -> 1999).
[[nodiscard]] std::optional<int> parse_year(std::string_view value);

/// Split on a whitespace-surrounded "and" (any case) outside braces, so
/// "{Procter and Gamble}" stays one name; names are trimmed and empty names
/// dropped.
[[nodiscard]] std::vector<std::string> split_authors(std::string_view value);

/// Strip resolver prefixes ("https://doi.org/", "doi:") and whitespace.
[[nodiscard]] std::string clean_doi(std::string_view value);

/// Collapse repeated field names, keeping the last value in place of the
/// first occurrence. Each repeat raises DuplicateField.
[[nodiscard]] std::vector<NormalizedField> merge_duplicate_fields(std::vector<NormalizedField> fields,
                                                                  const DiagnosticContext& context,
                                                                  DiagnosticList& diagnostics);

/// Apply the required/recommended field policy and promote known fields.
/// Returns nullopt when the entry is rejected (no title).
[[nodiscard]] std::optional<Paper> validate_entry(const EntryIdentity& identity,
                                                  const std::vector<NormalizedField>& fields,
                                                  const ValidationPolicy& policy,
                                                  DiagnosticList& diagnostics);

/// Text obtained from a PDF (or any other non-BibTeX source) by an external
/// extractor. Turned into a Paper with the same rules as a .bib entry.
struct ExtractedDocument {
    std::string source_name;   // e.g. the uploaded file name; used to derive the key
    std::string title;
    std::string abstract;
    std::string authors;       // "A and B" form
    std::string year;
    std::string doi;
    std::string body;          // full text, kept under extra_fields["body"]
};

[[nodiscard]] std::optional<Paper> make_paper(const ExtractedDocument& document,
                                              std::size_t position,
                                              const ContentNormalizer& normalizer,
                                              const ValidationPolicy& policy,
                                              DiagnosticList& diagnostics);

}  // namespace bibkit::v1
