#include "bibkit/v1/normalizer.hpp"

#include "bibkit/v1/escape_table.hpp"
#include "bibkit/v1/field_extractor.hpp"
#include "bibkit/v1/validator.hpp"

#include <algorithm>
#include <array>
#include <utility>
#include <vector>

namespace bibkit::v1 {

namespace {

constexpr std::size_t npos = std::string_view::npos;

constexpr std::array<std::pair<std::string_view, std::string_view>, 12> kMonths{{
    {"jan", "January"}, {"feb", "February"}, {"mar", "March"}, {"apr", "April"},
    {"may", "May"}, {"jun", "June"}, {"jul", "July"}, {"aug", "August"},
    {"sep", "September"}, {"oct", "October"}, {"nov", "November"}, {"dec", "December"},
}};

constexpr std::array<std::pair<std::string_view, std::string_view>, 9> kFieldAliases{{
    {"authors", "author"}, {"editors", "editor"}, {"keyw", "keyword"},
    {"keywords", "keyword"}, {"subjects", "subject"}, {"url", "link"},
    {"urls", "link"}, {"links", "link"}, {"xref", "crossref"},
}};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
    });
    return out;
}

std::size_t skip_space(std::string_view s, std::size_t i) {
    while (i < s.size() && is_space(s[i])) ++i;
    return i;
}

bool is_continuation(unsigned char c) {
    return c >= 0x80 && c <= 0xBF;
}

// Length of the well-formed UTF-8 sequence starting at `i`, or 0 when the
// byte at `i` cannot start one (stray continuation, bad lead, truncated,
// overlong or surrogate forms).
std::size_t utf8_sequence_length(std::string_view s, std::size_t i) {
    const auto lead = static_cast<unsigned char>(s[i]);
    std::size_t length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) low = 0xA0;
        if (lead == 0xED) high = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) low = 0x90;
        if (lead == 0xF4) high = 0x8F;
    } else {
        return 0;
    }
    if (i + length > s.size()) return 0;

    const auto second = static_cast<unsigned char>(s[i + 1]);
    if (second < low || second > high) return 0;
    for (std::size_t k = 2; k < length; ++k) {
        if (!is_continuation(static_cast<unsigned char>(s[i + k]))) return 0;
    }
    return length;
}

// Result of reading the argument of an accent command.
struct AccentArgument {
    std::optional<char> base;
    std::size_t end = 0;  // first offset after the argument
};

// Accepts `o`, `{o}`, `\i`, `{\i}`, with optional spaces before the argument.
AccentArgument read_accent_argument(std::string_view s, std::size_t pos) {
    AccentArgument arg;
    arg.end = pos;

    auto dotless = [&](std::size_t k) {
        return k + 1 < s.size() && s[k] == '\\' && (s[k + 1] == 'i' || s[k + 1] == 'j') &&
               !(k + 2 < s.size() && is_alpha(s[k + 2]));
    };

    std::size_t k = skip_space(s, pos);
    if (k >= s.size()) {
        return arg;
    }
    if (s[k] == '{') {
        std::size_t inner = skip_space(s, k + 1);
        char base = 0;
        if (dotless(inner)) {
            base = s[inner + 1];
            inner += 2;
        } else if (inner < s.size() && is_alpha(s[inner])) {
            base = s[inner];
            inner += 1;
        } else {
            return arg;
        }
        inner = skip_space(s, inner);
        if (inner < s.size() && s[inner] == '}') {
            arg.base = base;
            arg.end = inner + 1;
        }
        return arg;
    }
    if (dotless(k)) {
        arg.base = s[k + 1];
        arg.end = k + 2;
    } else if (is_alpha(s[k])) {
        arg.base = s[k];
        arg.end = k + 1;
    }
    return arg;
}

// Builds normalized text. A pending word break keeps an unknown control word
// from fusing with letters that follow it once braces are gone.
class TextBuilder {
public:
    explicit TextBuilder(std::size_t capacity) { out_.reserve(capacity); }

    void emit(std::string_view piece) {
        if (piece.empty()) return;
        if (word_break_ && is_alpha(piece.front())) out_.push_back(' ');
        word_break_ = false;
        out_.append(piece);
    }

    void emit(char c) { emit(std::string_view(&c, 1)); }

    void request_word_break() { word_break_ = true; }

    // Collapse space runs and trim.
    [[nodiscard]] std::string finish() const {
        std::string result;
        result.reserve(out_.size());
        bool pending_space = false;
        for (const char c : out_) {
            if (c == ' ') {
                pending_space = !result.empty();
                continue;
            }
            if (pending_space) {
                result.push_back(' ');
                pending_space = false;
            }
            result.push_back(c);
        }
        return result;
    }

private:
    std::string out_;
    bool word_break_ = false;
};

}  // namespace

std::optional<std::string_view> month_name(std::string_view macro) {
    const std::string lower = to_lower(macro);
    for (const auto& [abbrev, name] : kMonths) {
        if (abbrev == lower) return name;
    }
    return std::nullopt;
}

std::string_view canonical_field_name(std::string_view name) {
    for (const auto& [alias, canonical] : kFieldAliases) {
        if (alias == name) return canonical;
    }
    return name;
}

ContentNormalizer::ContentNormalizer(NormalizerOptions options)
    : options_(options) {}

std::string ContentNormalizer::resolve_bare(std::string_view token,
                                            const MacroTable& macros,
                                            const DiagnosticContext& context,
                                            DiagnosticList& diagnostics) const {
    if (token.empty() || !is_alpha(token.front())) {
        return std::string(token);
    }
    const auto it = macros.find(to_lower(token));
    if (it != macros.end()) {
        return it->second;
    }
    if (options_.expand_month_macros) {
        if (const auto month = month_name(token)) {
            return std::string(*month);
        }
    }
    push_diagnostic(diagnostics, DiagnosticKind::UndefinedMacro, context,
                    "Bare value '" + std::string(token) + "' is not a defined @string macro; kept verbatim");
    return std::string(token);
}

std::string ContentNormalizer::resolve(std::string_view raw,
                                       const MacroTable& macros,
                                       const DiagnosticContext& context,
                                       DiagnosticList& diagnostics) const {
    std::string out;
    std::size_t i = skip_space(raw, 0);
    while (i < raw.size()) {
        const char c = raw[i];
        std::size_t next = npos;
        if (c == '{') {
            const auto close = find_matching_brace(raw, i);
            if (close != npos) {
                out.append(raw.substr(i + 1, close - i - 1));
                next = close + 1;
            }
        } else if (c == '"') {
            const auto close = find_closing_quote(raw, i);
            if (close != npos) {
                out.append(raw.substr(i + 1, close - i - 1));
                next = close + 1;
            }
        } else {
            std::size_t end = i;
            while (end < raw.size() && !is_space(raw[end]) && raw[end] != '#') ++end;
            out += resolve_bare(raw.substr(i, end - i), macros, context, diagnostics);
            next = end;
        }

        if (next == npos) {
            // Unbalanced piece: the extractor never hands these over, keep the text.
            out.append(raw.substr(i));
            break;
        }
        i = skip_space(raw, next);
        if (i < raw.size() && raw[i] == '#') {
            i = skip_space(raw, i + 1);
        }
    }
    return out;
}

std::string ContentNormalizer::normalize(std::string_view s,
                                         const DiagnosticContext& context,
                                         DiagnosticList& diagnostics) const {
    TextBuilder text(s.size());
    std::vector<std::string> unsupported;

    auto report = [&](std::string command) {
        if (std::find(unsupported.begin(), unsupported.end(), command) == unsupported.end()) {
            unsupported.push_back(std::move(command));
        }
    };

    // Accent command `\<accent>` whose argument starts at `pos`.
    auto expand_accent = [&](char accent, std::size_t pos) -> std::size_t {
        const AccentArgument arg = read_accent_argument(s, pos);
        const bool letter_accent = is_alpha(accent);
        if (!arg.base) {
            // Nothing to put the accent on: drop the command.
            report(std::string("\\") + accent);
            return pos;
        }
        if (const auto replacement = escapes::find_accent(accent, *arg.base)) {
            text.emit(*replacement);
            return arg.end;
        }
        report(std::string("\\") + accent + *arg.base);
        text.emit(std::string("\\") + accent);
        if (letter_accent) text.request_word_break();
        text.emit(*arg.base);
        return arg.end;
    };

    std::size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];
        const auto u = static_cast<unsigned char>(c);

        if (c == '\\') {
            if (i + 1 >= s.size()) {
                report("\\");
                ++i;
                continue;
            }
            const char next = s[i + 1];

            if (is_alpha(next)) {
                std::size_t j = i + 1;
                while (j < s.size() && is_alpha(s[j])) ++j;
                const std::string_view name = s.substr(i + 1, j - i - 1);

                if (escapes::is_letter_accent(name)) {
                    i = expand_accent(name.front(), j);
                } else if (const auto symbol = escapes::find_symbol(name)) {
                    // Spaces after a control word end the word, as in TeX.
                    text.emit(*symbol);
                    i = skip_space(s, j);
                    if (s.substr(i, 2) == "{}") i += 2;
                } else if (escapes::is_formatting_command(name)) {
                    i = skip_space(s, j);
                } else if (escapes::is_declaration_command(name)) {
                    i = skip_space(s, j);
                } else {
                    report(std::string("\\") + std::string(name));
                    text.emit(std::string("\\") + std::string(name));
                    text.request_word_break();
                    i = j;
                }
                continue;
            }

            if (escapes::kSymbolAccents.find(next) != npos) {
                i = expand_accent(next, i + 2);
                continue;
            }
            if (next == '{' || next == '}') {
                // Literal braces stay escaped so a second pass sees the same text.
                text.emit(s.substr(i, 2));
                i += 2;
                continue;
            }
            if (const auto symbol = escapes::find_symbol(s.substr(i + 1, 1))) {
                text.emit(*symbol);
                i += 2;
                continue;
            }
            if (static_cast<unsigned char>(next) < 0x80 && static_cast<unsigned char>(next) >= 0x20 &&
                next != 0x7F) {
                report(std::string("\\") + next);
                text.emit(s.substr(i, 2));
                i += 2;
            } else {
                // A lone backslash is dropped: kept, it could fuse with later text.
                report("\\");
                ++i;
            }
            continue;
        }

        if (c == '{' || c == '}') {
            ++i;
        } else if (c == '~' || is_space(c)) {
            text.emit(' ');
            ++i;
        } else if (u < 0x20 || u == 0x7F) {
            ++i;
        } else if (u >= 0x80) {
            // Ill-formed bytes are dropped one at a time so the output is
            // valid UTF-8 and a second pass removes nothing more.
            const std::size_t length = utf8_sequence_length(s, i);
            if (length == 0) {
                ++i;
            } else if (u == 0xC2 && static_cast<unsigned char>(s[i + 1]) <= 0x9F) {
                i += 2;  // C1 control
            } else {
                text.emit(s.substr(i, length));
                i += length;
            }
        } else {
            text.emit(c);
            ++i;
        }
    }

    if (options_.report_unsupported_escapes) {
        for (const auto& command : unsupported) {
            push_diagnostic(diagnostics, DiagnosticKind::UnsupportedEscape, context,
                            "Unsupported escape '" + command + "' left as-is");
        }
    }
    return text.finish();
}

std::string ContentNormalizer::normalize(std::string_view text) const {
    DiagnosticList discarded;
    return normalize(text, {}, discarded);
}

std::vector<std::string> ContentNormalizer::normalize_names(std::string_view resolved,
                                                           const DiagnosticContext& context,
                                                           DiagnosticList& diagnostics) const {
    std::vector<std::string> names;
    for (const auto& raw_name : split_authors(resolved)) {
        std::string name = normalize(raw_name, context, diagnostics);
        if (!name.empty()) names.push_back(std::move(name));
    }
    return names;
}

NormalizedField ContentNormalizer::normalize_field(const RawField& field,
                                                   const MacroTable& macros,
                                                   const DiagnosticContext& context,
                                                   DiagnosticList& diagnostics) const {
    NormalizedField normalized;
    normalized.name = to_lower(field.name);
    if (options_.homogenize_fields) {
        normalized.name = std::string(canonical_field_name(normalized.name));
    }

    const std::string resolved = resolve(field.value, macros, context, diagnostics);
    if (normalized.name == "author") {
        normalized.names = normalize_names(resolved, context, diagnostics);
        for (const auto& name : normalized.names) {
            if (!normalized.value.empty()) normalized.value += " and ";
            normalized.value += name;
        }
    } else {
        normalized.value = normalize(resolved, context, diagnostics);
    }
    return normalized;
}

}  // namespace bibkit::v1
