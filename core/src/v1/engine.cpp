#include "bibkit/v1/engine.hpp"

#include "bibkit/v1/assembler.hpp"
#include "bibkit/v1/field_extractor.hpp"
#include "bibkit/v1/normalizer.hpp"
#include "bibkit/v1/tokenizer.hpp"
#include "bibkit/v1/validator.hpp"

#include <algorithm>
#include <utility>

namespace bibkit::v1 {

namespace {

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
    });
}

std::string lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

void register_macros(const RawEntry& entry,
                     const ContentNormalizer& normalizer,
                     MacroTable& macros,
                     DiagnosticList& diagnostics) {
    for (const auto& field : entry.fields) {
        const DiagnosticContext context{std::nullopt, field.line};
        // Resolved against the table so far: later @string blocks may reuse earlier ones.
        std::string value = normalizer.resolve(field.value, macros, context, diagnostics);
        macros.insert_or_assign(lower(field.name), std::move(value));
    }
}

}  // namespace

bool IngestResult::has_fatal() const noexcept {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [](const Diagnostic& d) { return d.is_fatal(); });
}

std::size_t IngestResult::count(DiagnosticKind kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(
        diagnostics.begin(), diagnostics.end(), [kind](const Diagnostic& d) { return d.kind == kind; }));
}

std::size_t IngestResult::count(Severity severity) const noexcept {
    return static_cast<std::size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
                                                  [severity](const Diagnostic& d) {
                                                      return d.severity() == severity;
                                                  }));
}

std::size_t IngestResult::rejected_entries() const noexcept {
    return count(DiagnosticKind::MissingRequiredField) + count(DiagnosticKind::UnterminatedEntry);
}

const Paper* IngestResult::find(std::string_view key) const noexcept {
    const auto it = std::find_if(papers.begin(), papers.end(),
                                 [key](const Paper& p) { return p.key == key; });
    return it == papers.end() ? nullptr : &*it;
}

BibEngine::BibEngine(EngineOptions options)
    : options_(std::move(options)) {}

IngestResult BibEngine::parse(std::string_view text) const {
    IngestResult result;
    auto& diagnostics = result.diagnostics;

    if (is_blank(text)) {
        push_diagnostic(diagnostics, DiagnosticKind::EmptyInput, {},
                        "Input is empty or contains only whitespace");
        return result;
    }

    NormalizerOptions normalizer_options;
    normalizer_options.expand_month_macros = options_.expand_month_macros;
    normalizer_options.report_unsupported_escapes = options_.report_unsupported_escapes;
    normalizer_options.homogenize_fields = options_.homogenize_fields;
    const ContentNormalizer normalizer(normalizer_options);

    ValidationPolicy policy;
    policy.recommended_fields = options_.recommended_fields;

    Tokenizer tokenizer(text);
    KeySanitizer keys(options_.placeholder_prefix);
    Assembler assembler;
    MacroTable macros;
    std::size_t position = 0;
    std::size_t blocks_seen = 0;

    while (auto block = tokenizer.next(diagnostics)) {
        ++blocks_seen;
        RawEntry entry = extract_fields(*block, diagnostics);

        if (entry.entry_type == "string") {
            register_macros(entry, normalizer, macros, diagnostics);
            continue;
        }

        ++position;
        const SanitizedKey key = keys.assign(entry.raw_key, position, entry.start_line, diagnostics);
        const DiagnosticContext context{key.key, entry.start_line};

        std::vector<NormalizedField> fields;
        fields.reserve(entry.fields.size());
        for (const auto& field : entry.fields) {
            fields.push_back(normalizer.normalize_field(field, macros, {key.key, field.line}, diagnostics));
        }
        fields = merge_duplicate_fields(std::move(fields), context, diagnostics);

        EntryIdentity identity;
        identity.key = key.key;
        identity.entry_type = entry.entry_type;
        identity.source_line = entry.start_line;
        if (options_.keep_source_text) {
            identity.source_text = std::move(entry.source_text);
        }

        if (auto paper = validate_entry(identity, fields, policy, diagnostics)) {
            assembler.add(std::move(*paper), diagnostics);
        }
    }

    if (blocks_seen == 0 && result.count(DiagnosticKind::UnterminatedEntry) == 0) {
        push_diagnostic(diagnostics, DiagnosticKind::EmptyInput, {}, "Input contains no BibTeX entries");
    }

    result.papers = std::move(assembler).finish();
    return result;
}

IngestResult parse_bibtex(std::string_view text, const EngineOptions& options) {
    return BibEngine(options).parse(text);
}

}  // namespace bibkit::v1
