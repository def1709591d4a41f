#pragma once

#include "bibkit/v1/diagnostics.hpp"
#include "bibkit/v1/entry.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace bibkit::v1 {

/// Extent of one field value inside an entry body.
struct ValueSpan {
    std::size_t begin = 0;
    std::size_t end = 0;    // one past the last character of the value
    bool closed = true;     // false when a { or " delimiter never closes
    std::size_t resume = 0; // where extraction continues after an unclosed value
};

// Index of the '}' matching the '{' at `open`, or npos. Backslash escapes are skipped.
[[nodiscard]] std::size_t find_matching_brace(std::string_view text, std::size_t open);

// Index of the '"' closing the quote at `open`, or npos. A '"' nested in braces is text.
[[nodiscard]] std::size_t find_closing_quote(std::string_view text, std::size_t open);

// Index of the next unescaped '"' after `open`, braces ignored, or npos.
// This is how the tokenizer delimits a quoted value.
[[nodiscard]] std::size_t find_flat_quote(std::string_view text, std::size_t open);

/// Scan a field value starting at `pos` (just after '='). Accepts {..},
/// "..", bare tokens and '#' concatenations of them. Stops before the
/// top-level ',' that ends the field, or at the end of `body`.
[[nodiscard]] ValueSpan scan_value(std::string_view body, std::size_t pos);

/// Split an entry body into ordered (name, raw value) pairs.
/// A field whose value never closes, or that has no '=' or no usable name,
/// is reported as MalformedField and left out; the rest of the entry stays.
[[nodiscard]] RawEntry extract_fields(const EntryBlock& block, DiagnosticList& diagnostics);

}  // namespace bibkit::v1
