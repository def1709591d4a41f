#include "bibkit/v1/key_sanitizer.hpp"

#include <utility>

namespace bibkit::v1 {

namespace {

bool is_key_char(unsigned char c) {
    const bool ascii_alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    return ascii_alnum || c == '-' || c == '_' || c == ':' || c == '.';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

}  // namespace

std::string sanitize_key(std::string_view raw_key,
                         std::size_t position,
                         std::string_view placeholder_prefix) {
    const std::string_view trimmed = trim(raw_key);

    std::string out;
    out.reserve(trimmed.size());
    bool in_run = false;
    for (const char ch : trimmed) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_key_char(c)) {
            out.push_back(ch);
            in_run = false;
        } else if (!in_run) {
            out.push_back('_');
            in_run = true;
        }
    }

    // Only strip underscores the replacement itself introduced at the edges.
    if (!trimmed.empty() && !is_key_char(static_cast<unsigned char>(trimmed.back())) &&
        !out.empty() && out.back() == '_') {
        out.pop_back();
    }
    if (!trimmed.empty() && !is_key_char(static_cast<unsigned char>(trimmed.front())) &&
        !out.empty() && out.front() == '_') {
        out.erase(out.begin());
    }

    if (out.empty()) {
        out = std::string(placeholder_prefix) + std::to_string(position);
    }
    return out;
}

KeySanitizer::KeySanitizer(std::string placeholder_prefix)
    : placeholder_prefix_(std::move(placeholder_prefix)) {}

SanitizedKey KeySanitizer::assign(std::string_view raw_key,
                                  std::size_t position,
                                  std::size_t source_line,
                                  DiagnosticList& diagnostics) {
    const std::string trimmed(trim(raw_key));
    // Empty keys become positional placeholders and are never the same key twice.
    if (!trimmed.empty()) {
        const auto seen = assigned_.find(trimmed);
        if (seen != assigned_.end()) {
            return seen->second;
        }
    }

    SanitizedKey result;
    result.raw_key = trimmed;
    result.base = sanitize_key(trimmed, position, placeholder_prefix_);
    result.key = result.base;
    while (issued_.count(result.key) != 0) {
        ++result.occurrence;
        result.key = result.base + "_" + std::to_string(result.occurrence);
    }
    issued_.emplace(result.key, trimmed);

    if (result.occurrence > 1) {
        const auto owner = issued_.find(result.base);
        push_diagnostic(diagnostics, DiagnosticKind::KeyCollisionResolved,
                        {result.key, source_line},
                        "Citation key '" + trimmed + "' sanitizes to '" + result.base +
                            "', already taken by '" + owner->second + "'; renamed to '" +
                            result.key + "'");
    }
    if (!trimmed.empty()) {
        assigned_.emplace(trimmed, result);
    }
    return result;
}

}  // namespace bibkit::v1
