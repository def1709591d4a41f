#include "bibkit/v1/tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace bibkit::v1 {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool is_space(char c) {
    return is_blank(c) || c == '\n';
}

bool is_type_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) != 0 || c == '_' || c == '-';
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

}  // namespace

// -----------------------------------------------------------------------------
// LineIndex
// -----------------------------------------------------------------------------

LineIndex::LineIndex(std::string_view text) {
    line_starts_.push_back(0);
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') {
            line_starts_.push_back(i + 1);
        }
    }
}

std::size_t LineIndex::line_of(std::size_t offset) const {
    const auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    return static_cast<std::size_t>(it - line_starts_.begin());
}

// -----------------------------------------------------------------------------
// Tokenizer
// -----------------------------------------------------------------------------

Tokenizer::Tokenizer(std::string_view text)
    : text_(text), lines_(text) {}

std::optional<std::size_t> Tokenizer::find_entry_start(std::size_t from) const {
    bool line_start = true;
    for (std::size_t back = from; back > block_end_; --back) {
        const char c = text_[back - 1];
        if (c == '\n') break;
        if (!is_blank(c)) {
            line_start = false;
            break;
        }
    }

    // '%' comment lines and free text never carry a line-initial '@', so they
    // fall through this loop untouched.
    for (std::size_t i = from; i < text_.size(); ++i) {
        const char c = text_[i];
        if (c == '\n') {
            line_start = true;
            continue;
        }
        if (!line_start || is_blank(c)) {
            continue;
        }
        if (c == '@') {
            return i;
        }
        line_start = false;
    }
    return std::nullopt;
}

std::optional<Tokenizer::Header> Tokenizer::read_header(std::size_t at) const {
    std::size_t i = at + 1;
    while (i < text_.size() && is_blank(text_[i])) ++i;

    const std::size_t word_begin = i;
    if (i >= text_.size() || std::isalpha(static_cast<unsigned char>(text_[i])) == 0) {
        return std::nullopt;
    }
    while (i < text_.size() && is_type_char(text_[i])) ++i;
    const std::size_t word_end = i;

    while (i < text_.size() && is_space(text_[i])) ++i;
    if (i >= text_.size() || (text_[i] != '{' && text_[i] != '(')) {
        return std::nullopt;
    }

    Header header;
    header.at = at;
    header.open = i;
    header.entry_type = to_lower(text_.substr(word_begin, word_end - word_begin));
    return header;
}

std::optional<std::size_t> Tokenizer::find_header_on_line(std::size_t line_begin) const {
    std::size_t i = line_begin;
    while (i < text_.size() && is_blank(text_[i])) ++i;
    if (i < text_.size() && text_[i] == '@' && read_header(i)) {
        return i;
    }
    return std::nullopt;
}

std::optional<std::size_t> Tokenizer::find_close(std::size_t open, char closer,
                                                 std::size_t& scanned_to) const {
    int depth = 0;  // braces nested inside the entry, opener excluded
    bool in_quote = false;

    for (std::size_t i = open + 1; i < text_.size(); ++i) {
        const char c = text_[i];
        if (c == '\\') {
            ++i;  // escaped character never changes nesting
            continue;
        }
        if (c == '\n') {
            // A new entry header ends an unbalanced entry, so each byte is scanned once.
            if (const auto next_at = find_header_on_line(i + 1)) {
                scanned_to = *next_at;
                return std::nullopt;
            }
            continue;
        }
        if (in_quote) {
            if (c == '"') in_quote = false;
            continue;
        }
        switch (c) {
            case '"':
                if (depth == 0) in_quote = true;
                break;
            case '{':
                ++depth;
                break;
            case '}':
                if (depth == 0) {
                    if (closer == '}') return i;
                } else {
                    --depth;
                }
                break;
            case ')':
                if (closer == ')' && depth == 0) return i;
                break;
            default:
                break;
        }
    }
    scanned_to = text_.size();
    return std::nullopt;
}

std::optional<std::size_t> Tokenizer::find_key_end(std::size_t begin, std::size_t end) const {
    int depth = 0;
    for (std::size_t i = begin; i < end; ++i) {
        const char c = text_[i];
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (depth > 0) --depth;
        } else if (depth == 0 && c == ',') {
            return i;
        } else if (depth == 0 && (c == '=' || c == '"')) {
            // A field starts before any comma: the entry has no key.
            return std::nullopt;
        }
    }
    return end;
}

std::size_t Tokenizer::skip_comment_block(const Header& header) const {
    const char opener = text_[header.open];
    const char closer = opener == '{' ? '}' : ')';
    int depth = 0;
    for (std::size_t i = header.open; i < text_.size(); ++i) {
        const char c = text_[i];
        if (c == opener) {
            ++depth;
        } else if (c == closer) {
            if (--depth == 0) return i + 1;
        }
    }
    const auto eol = text_.find('\n', header.open);
    return eol == std::string_view::npos ? text_.size() : eol + 1;
}

std::optional<EntryBlock> Tokenizer::next(DiagnosticList& diagnostics) {
    while (pos_ < text_.size()) {
        const auto at = find_entry_start(pos_);
        if (!at) {
            pos_ = text_.size();
            return std::nullopt;
        }

        const auto header = read_header(*at);
        if (!header) {
            const auto eol = text_.find('\n', *at);
            const auto snippet = trim(text_.substr(*at, std::min<std::size_t>(
                (eol == std::string_view::npos ? text_.size() : eol) - *at, 40)));
            push_diagnostic(diagnostics, DiagnosticKind::TrailingText,
                            {std::nullopt, lines_.line_of(*at)},
                            "Unparseable text '" + std::string(snippet) + "' is not an entry");
            pos_ = *at + 1;
            continue;
        }

        if (header->entry_type == "comment") {
            pos_ = skip_comment_block(*header);
            block_end_ = pos_;
            continue;
        }

        const char closer = text_[header->open] == '{' ? '}' : ')';
        std::size_t scanned_to = text_.size();
        const auto close = find_close(header->open, closer, scanned_to);
        if (!close) {
            std::optional<std::string> key;
            const auto stop = text_.find_first_of(",\n", header->open + 1);
            const auto guess = trim(text_.substr(
                header->open + 1,
                (stop == std::string_view::npos ? text_.size() : stop) - header->open - 1));
            if (!guess.empty() && header->entry_type != "string") {
                key = std::string(guess);
            }
            push_diagnostic(diagnostics, DiagnosticKind::UnterminatedEntry,
                            {key, lines_.line_of(*at)},
                            "Entry '@" + header->entry_type + "' opened with '" +
                                std::string(1, text_[header->open]) +
                                "' is never closed");
            pos_ = scanned_to;
            continue;
        }

        pos_ = *close + 1;
        block_end_ = pos_;
        if (header->entry_type == "preamble") {
            continue;
        }

        EntryBlock block;
        block.entry_type = header->entry_type;
        block.start_line = lines_.line_of(*at);
        block.source_text = std::string(text_.substr(*at, *close + 1 - *at));

        std::size_t body_begin = header->open + 1;
        if (header->entry_type != "string") {
            const auto key_end = find_key_end(header->open + 1, *close);
            if (key_end) {
                block.raw_key = std::string(text_.substr(header->open + 1, *key_end - header->open - 1));
                body_begin = std::min(*key_end + 1, *close);
            }
        }
        block.body = std::string(text_.substr(body_begin, *close - body_begin));
        block.body_line = lines_.line_of(body_begin);
        return block;
    }
    return std::nullopt;
}

std::vector<EntryBlock> tokenize(std::string_view text, DiagnosticList& diagnostics) {
    std::vector<EntryBlock> blocks;
    Tokenizer tokenizer(text);
    while (auto block = tokenizer.next(diagnostics)) {
        blocks.push_back(std::move(*block));
    }
    return blocks;
}

}  // namespace bibkit::v1
