#pragma once

// =============================================================================
// BibKit v1 - Ingestion engine facade
// =============================================================================
// Runs Tokenizer -> KeySanitizer -> FieldExtractor -> ContentNormalizer ->
// Validator -> Assembler over one in-memory .bib buffer. Every run starts
// from empty accumulators; a BibEngine holds options only and can be shared
// between threads.
// =============================================================================

#include "bibkit/v1/diagnostics.hpp"
#include "bibkit/v1/key_sanitizer.hpp"
#include "bibkit/v1/paper.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace bibkit::v1 {

struct EngineOptions {
    std::vector<std::string> recommended_fields{"author", "year", "abstract"};
    bool expand_month_macros = true;
    bool report_unsupported_escapes = true;
    bool homogenize_fields = true;  // map alias field names such as "authors" to "author"
    bool keep_source_text = false;  // copy the verbatim entry into Paper::source_text
    std::string placeholder_prefix = std::string(kDefaultPlaceholderPrefix);
};

struct IngestResult {
    std::vector<Paper> papers;
    DiagnosticList diagnostics;

    [[nodiscard]] bool has_fatal() const noexcept;
    [[nodiscard]] std::size_t count(DiagnosticKind kind) const noexcept;
    [[nodiscard]] std::size_t count(Severity severity) const noexcept;

    /// Entries that produced no paper (missing title or never closed).
    [[nodiscard]] std::size_t rejected_entries() const noexcept;

    [[nodiscard]] const Paper* find(std::string_view key) const noexcept;
};

class BibEngine {
public:
    explicit BibEngine(EngineOptions options = {});

    /// Never throws on malformed input; problems come back as diagnostics.
    [[nodiscard]] IngestResult parse(std::string_view text) const;

    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

private:
    EngineOptions options_;
};

/// One-shot convenience over BibEngine.
[[nodiscard]] IngestResult parse_bibtex(std::string_view text, const EngineOptions& options = {});

}  // namespace bibkit::v1
