#pragma once

// =============================================================================
// BibKit v1 - Typed ingestion diagnostics
// =============================================================================
// Every problem found while ingesting a .bib buffer is reported as a
// Diagnostic. Diagnostics are entry-scoped and never stop the run; callers
// decide what to surface based on kind and severity.
// =============================================================================

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bibkit::v1 {

enum class DiagnosticKind {
    EmptyInput,
    UnterminatedEntry,
    TrailingText,
    MalformedField,
    DuplicateField,
    MissingRequiredField,
    MissingRecommendedField,
    FieldFormatWarning,
    UnsupportedEscape,
    UndefinedMacro,
    KeyCollisionResolved,
    DuplicateKey
};

enum class Severity {
    Info,
    Warning,
    Error
};

[[nodiscard]] inline constexpr const char* to_string(DiagnosticKind kind) noexcept {
    switch (kind) {
        case DiagnosticKind::EmptyInput: return "EmptyInput";
        case DiagnosticKind::UnterminatedEntry: return "UnterminatedEntry";
        case DiagnosticKind::TrailingText: return "TrailingText";
        case DiagnosticKind::MalformedField: return "MalformedField";
        case DiagnosticKind::DuplicateField: return "DuplicateField";
        case DiagnosticKind::MissingRequiredField: return "MissingRequiredField";
        case DiagnosticKind::MissingRecommendedField: return "MissingRecommendedField";
        case DiagnosticKind::FieldFormatWarning: return "FieldFormatWarning";
        case DiagnosticKind::UnsupportedEscape: return "UnsupportedEscape";
        case DiagnosticKind::UndefinedMacro: return "UndefinedMacro";
        case DiagnosticKind::KeyCollisionResolved: return "KeyCollisionResolved";
        case DiagnosticKind::DuplicateKey: return "DuplicateKey";
        default: return "Unknown";
    }
}

[[nodiscard]] inline constexpr const char* to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
        default: return "unknown";
    }
}

/// Fixed severity per kind. Error means an entry (or the whole input) was lost.
[[nodiscard]] inline constexpr Severity severity_of(DiagnosticKind kind) noexcept {
    switch (kind) {
        case DiagnosticKind::EmptyInput:
        case DiagnosticKind::UnterminatedEntry:
        case DiagnosticKind::MissingRequiredField:
            return Severity::Error;
        case DiagnosticKind::TrailingText:
        case DiagnosticKind::MalformedField:
        case DiagnosticKind::DuplicateField:
        case DiagnosticKind::MissingRecommendedField:
        case DiagnosticKind::FieldFormatWarning:
        case DiagnosticKind::UndefinedMacro:
        case DiagnosticKind::DuplicateKey:
            return Severity::Warning;
        case DiagnosticKind::UnsupportedEscape:
        case DiagnosticKind::KeyCollisionResolved:
            return Severity::Info;
        default:
            return Severity::Warning;
    }
}

/// Stable machine-readable code, e.g. "BIBKIT_E_UNTERMINATED_ENTRY".
[[nodiscard]] inline constexpr const char* code_of(DiagnosticKind kind) noexcept {
    switch (kind) {
        case DiagnosticKind::EmptyInput: return "BIBKIT_E_EMPTY_INPUT";
        case DiagnosticKind::UnterminatedEntry: return "BIBKIT_E_UNTERMINATED_ENTRY";
        case DiagnosticKind::TrailingText: return "BIBKIT_W_TRAILING_TEXT";
        case DiagnosticKind::MalformedField: return "BIBKIT_W_MALFORMED_FIELD";
        case DiagnosticKind::DuplicateField: return "BIBKIT_W_DUPLICATE_FIELD";
        case DiagnosticKind::MissingRequiredField: return "BIBKIT_E_MISSING_REQUIRED_FIELD";
        case DiagnosticKind::MissingRecommendedField: return "BIBKIT_W_MISSING_RECOMMENDED_FIELD";
        case DiagnosticKind::FieldFormatWarning: return "BIBKIT_W_FIELD_FORMAT";
        case DiagnosticKind::UnsupportedEscape: return "BIBKIT_I_UNSUPPORTED_ESCAPE";
        case DiagnosticKind::UndefinedMacro: return "BIBKIT_W_UNDEFINED_MACRO";
        case DiagnosticKind::KeyCollisionResolved: return "BIBKIT_I_KEY_COLLISION_RESOLVED";
        case DiagnosticKind::DuplicateKey: return "BIBKIT_W_DUPLICATE_KEY";
        default: return "BIBKIT_W_UNKNOWN";
    }
}

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::MalformedField;
    std::optional<std::string> entry_key;
    std::string message;
    std::size_t source_line = 0;               // 1-based, 0 when not tied to a line
    std::optional<std::size_t> related_line;   // second location (DuplicateKey)

    [[nodiscard]] Severity severity() const noexcept { return severity_of(kind); }
    [[nodiscard]] bool is_fatal() const noexcept { return severity() == Severity::Error; }

    // "[BIBKIT_W_DUPLICATE_KEY] line 12 (smith2020): ..."
    [[nodiscard]] std::string to_string() const;
};

using DiagnosticList = std::vector<Diagnostic>;

/// Where a stage is working when it raises a diagnostic.
struct DiagnosticContext {
    std::optional<std::string> entry_key;
    std::size_t line = 0;
};

void push_diagnostic(DiagnosticList& diagnostics,
                     DiagnosticKind kind,
                     const DiagnosticContext& context,
                     std::string message);

}  // namespace bibkit::v1
