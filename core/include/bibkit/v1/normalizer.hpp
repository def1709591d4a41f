#pragma once

#include "bibkit/v1/diagnostics.hpp"
#include "bibkit/v1/entry.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bibkit::v1 {

/// @string macros of one run, keyed by lower-case name. Values are resolved
/// but not yet normalized.
using MacroTable = std::unordered_map<std::string, std::string>;

struct NormalizerOptions {
    bool expand_month_macros = true;         // bare jan..dec -> January..December
    bool report_unsupported_escapes = true;  // raise UnsupportedEscape for unknown macros
    bool homogenize_fields = true;           // authors -> author, urls -> link, ...
};

/// Full month name for a standard BibTeX month macro ("jan" -> "January").
[[nodiscard]] std::optional<std::string_view> month_name(std::string_view macro);

/// Usual spelling of a lower-case field name: plural and alias forms
/// ("authors", "keywords", "url", "xref") map to one name, anything else
/// is returned unchanged.
[[nodiscard]] std::string_view canonical_field_name(std::string_view name);

/// Turns raw field values into display-ready text.
///
/// resolve() removes value delimiters and expands '#' concatenations and
/// bare macro names; normalize() applies the fixed escape table, strips
/// grouping braces and control characters and collapses whitespace.
/// normalize() is idempotent.
class ContentNormalizer {
public:
    explicit ContentNormalizer(NormalizerOptions options = {});

    [[nodiscard]] std::string resolve(std::string_view raw_value,
                                      const MacroTable& macros,
                                      const DiagnosticContext& context,
                                      DiagnosticList& diagnostics) const;

    [[nodiscard]] std::string normalize(std::string_view text,
                                        const DiagnosticContext& context,
                                        DiagnosticList& diagnostics) const;

    // Same as above, diagnostics discarded.
    [[nodiscard]] std::string normalize(std::string_view text) const;

    // Split a resolved author list on top-level "and", then normalize each name.
    [[nodiscard]] std::vector<std::string> normalize_names(std::string_view resolved,
                                                           const DiagnosticContext& context,
                                                           DiagnosticList& diagnostics) const;

    [[nodiscard]] NormalizedField normalize_field(const RawField& field,
                                                  const MacroTable& macros,
                                                  const DiagnosticContext& context,
                                                  DiagnosticList& diagnostics) const;

    [[nodiscard]] const NormalizerOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::string resolve_bare(std::string_view token,
                                           const MacroTable& macros,
                                           const DiagnosticContext& context,
                                           DiagnosticList& diagnostics) const;

    NormalizerOptions options_;
};

}  // namespace bibkit::v1
