#pragma once

#include "bibkit/v1/diagnostics.hpp"
#include "bibkit/v1/entry.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace bibkit::v1 {

/// Maps byte offsets of a buffer to 1-based line numbers.
class LineIndex {
public:
    explicit LineIndex(std::string_view text);

    [[nodiscard]] std::size_t line_of(std::size_t offset) const;
    [[nodiscard]] std::size_t line_count() const noexcept { return line_starts_.size(); }

private:
    std::vector<std::size_t> line_starts_;
};

/// Lazy scanner over the text of one .bib source.
///
/// Each call to next() yields the following entry block, skipping comments,
/// @comment and @preamble blocks and any text between entries. @string
/// blocks are yielded with entry_type "string" and an empty key. An '@'
/// counts as line-initial when only whitespace precedes it on its line or
/// since the end of the previous block. An entry whose opening delimiter is
/// not balanced before the next line-initial entry header (or the end of
/// input) is reported as UnterminatedEntry and scanning resumes at that
/// header.
///
/// The tokenizer holds a view: the text must outlive it.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view text);

    [[nodiscard]] std::optional<EntryBlock> next(DiagnosticList& diagnostics);

    void reset() noexcept {
        pos_ = 0;
        block_end_ = 0;
    }
    [[nodiscard]] bool done() const noexcept { return pos_ >= text_.size(); }

private:
    struct Header {
        std::size_t at = 0;       // offset of '@'
        std::size_t open = 0;     // offset of '{' or '('
        std::string entry_type;
    };

    [[nodiscard]] std::optional<std::size_t> find_entry_start(std::size_t from) const;
    [[nodiscard]] std::optional<Header> read_header(std::size_t at) const;
    [[nodiscard]] std::optional<std::size_t> find_header_on_line(std::size_t line_begin) const;
    // On failure `scanned_to` is the offset where the scan stopped.
    [[nodiscard]] std::optional<std::size_t> find_close(std::size_t open, char closer,
                                                        std::size_t& scanned_to) const;
    [[nodiscard]] std::optional<std::size_t> find_key_end(std::size_t begin, std::size_t end) const;
    [[nodiscard]] std::size_t skip_comment_block(const Header& header) const;

    std::string_view text_;
    LineIndex lines_;
    std::size_t pos_ = 0;
    std::size_t block_end_ = 0;  // one past the last closed block
};

/// Convenience: collect every block of `text`.
[[nodiscard]] std::vector<EntryBlock> tokenize(std::string_view text, DiagnosticList& diagnostics);

}  // namespace bibkit::v1
