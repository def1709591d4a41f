#include "bibkit/v1/field_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace bibkit::v1 {

namespace {

constexpr std::size_t npos = std::string_view::npos;

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-' || c == ':' ||
           c == '.' || c == '+';
}

std::size_t skip_space(std::string_view s, std::size_t i) {
    while (i < s.size() && is_space(s[i])) ++i;
    return i;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

// Position of the next top-level ',' at or after `i`, or the end of `s`.
std::size_t skip_to_comma(std::string_view s, std::size_t i) {
    int depth = 0;
    bool in_quote = false;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '\\') {
            ++i;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (depth > 0) --depth;
        } else if (c == '"' && depth == 0) {
            in_quote = !in_quote;
        } else if (c == ',' && depth == 0 && !in_quote) {
            return i;
        }
    }
    return s.size();
}

bool is_valid_name(std::string_view name) {
    return !name.empty() && std::isalpha(static_cast<unsigned char>(name.front())) != 0 &&
           std::all_of(name.begin(), name.end(), is_name_char);
}

std::string excerpt(std::string_view s) {
    constexpr std::size_t kMaxExcerpt = 32;
    std::string out(trim(s.substr(0, kMaxExcerpt)));
    std::replace_if(out.begin(), out.end(), is_space, ' ');
    if (s.size() > kMaxExcerpt) out += "...";
    return out;
}

}  // namespace

std::size_t find_matching_brace(std::string_view s, std::size_t open) {
    int depth = 0;
    for (std::size_t i = open; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '\\') {
            ++i;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) return i;
        }
    }
    return npos;
}

std::size_t find_closing_quote(std::string_view s, std::size_t open) {
    int depth = 0;
    for (std::size_t i = open + 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '\\') {
            ++i;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (depth > 0) --depth;
        } else if (c == '"' && depth == 0) {
            return i;
        }
    }
    return npos;
}

std::size_t find_flat_quote(std::string_view s, std::size_t open) {
    for (std::size_t i = open + 1; i < s.size(); ++i) {
        if (s[i] == '\\') {
            ++i;
        } else if (s[i] == '"') {
            return i;
        }
    }
    return npos;
}

ValueSpan scan_value(std::string_view body, std::size_t pos) {
    ValueSpan span;
    std::size_t i = skip_space(body, pos);
    span.begin = i;
    span.end = i;

    while (i < body.size()) {
        const char c = body[i];
        if (c == '{') {
            const auto close = find_matching_brace(body, i);
            if (close == npos) {
                span.end = body.size();
                span.closed = false;
                span.resume = body.size();
                return span;
            }
            i = close + 1;
        } else if (c == '"') {
            const auto close = find_closing_quote(body, i);
            if (close == npos) {
                // Braces inside the quotes do not balance: skip past the plain
                // closing quote and pick up at the next field.
                const auto flat = find_flat_quote(body, i);
                span.end = body.size();
                span.closed = false;
                span.resume = flat == npos ? body.size() : skip_to_comma(body, flat + 1);
                return span;
            }
            i = close + 1;
        } else if (c == ',' || c == '#') {
            break;
        } else {
            while (i < body.size() && !is_space(body[i]) && body[i] != ',' && body[i] != '#' &&
                   body[i] != '{' && body[i] != '"') {
                ++i;
            }
        }
        span.end = i;

        i = skip_space(body, i);
        if (i < body.size() && body[i] == '#') {
            i = skip_space(body, i + 1);
            continue;
        }
        break;
    }
    return span;
}

RawEntry extract_fields(const EntryBlock& block, DiagnosticList& diagnostics) {
    RawEntry entry;
    entry.entry_type = block.entry_type;
    entry.raw_key = block.raw_key;
    entry.start_line = block.start_line;
    entry.source_text = block.source_text;

    const std::string_view body = block.body;
    const std::string_view trimmed_key = trim(block.raw_key);
    const std::optional<std::string> key = trimmed_key.empty()
        ? std::nullopt
        : std::optional<std::string>(trimmed_key);

    std::size_t line = block.body_line;
    std::size_t counted = 0;
    auto line_at = [&](std::size_t offset) {
        line += static_cast<std::size_t>(std::count(body.begin() + static_cast<std::ptrdiff_t>(counted),
                                                    body.begin() + static_cast<std::ptrdiff_t>(offset), '\n'));
        counted = offset;
        return line;
    };

    std::size_t i = 0;
    while (i < body.size()) {
        while (i < body.size() && (is_space(body[i]) || body[i] == ',')) ++i;
        if (i >= body.size()) break;

        const std::size_t field_start = i;
        const DiagnosticContext context{key, line_at(field_start)};

        std::size_t j = i;
        while (j < body.size() && body[j] != '=' && body[j] != ',' && body[j] != '{' && body[j] != '"') {
            ++j;
        }

        if (j >= body.size() || body[j] == ',') {
            push_diagnostic(diagnostics, DiagnosticKind::MalformedField, context,
                            "Field text '" + excerpt(body.substr(i, j - i)) + "' has no '=' separator");
            i = j;
            continue;
        }
        if (body[j] != '=') {
            const auto stop = skip_to_comma(body, j);
            push_diagnostic(diagnostics, DiagnosticKind::MalformedField, context,
                            "Field name expected before '" + excerpt(body.substr(i, stop - i)) + "'");
            i = stop;
            continue;
        }

        const std::string_view name = trim(body.substr(i, j - i));
        const ValueSpan value = scan_value(body, j + 1);
        if (!value.closed) {
            push_diagnostic(diagnostics, DiagnosticKind::MalformedField, context,
                            "Value of field '" + std::string(name) +
                                "' has an unbalanced '{' or '\"' delimiter; field dropped");
            i = value.resume;
            continue;
        }

        const std::size_t after = skip_space(body, value.end);
        if (after < body.size() && body[after] != ',') {
            const auto stop = skip_to_comma(body, after);
            push_diagnostic(diagnostics, DiagnosticKind::MalformedField, context,
                            "Unexpected text '" + excerpt(body.substr(after, stop - after)) +
                                "' after value of field '" + std::string(name) + "'; field dropped");
            i = stop;
            continue;
        }
        i = after;

        if (!is_valid_name(name)) {
            push_diagnostic(diagnostics, DiagnosticKind::MalformedField, context,
                            "Invalid field name '" + excerpt(name) + "'; field dropped");
            continue;
        }

        RawField field;
        field.name = std::string(name);
        field.value = std::string(trim(body.substr(value.begin, value.end - value.begin)));
        field.line = context.line;
        entry.fields.push_back(std::move(field));
    }

    return entry;
}

}  // namespace bibkit::v1
