#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace bibkit::v1 {

/// One `@type{...}` block located by the Tokenizer.
struct EntryBlock {
    std::string entry_type;     // lower-cased type word
    std::string raw_key;        // verbatim text before the first top-level comma
    std::string body;           // text after that comma up to the closing delimiter
    std::size_t start_line = 0; // line of the '@'
    std::size_t body_line = 0;  // line on which `body` starts
    std::string source_text;    // the whole block, '@' through closing delimiter
};

struct RawField {
    std::string name;   // as written
    std::string value;  // delimiters retained: {..}, "..", bare, or a # concatenation
    std::size_t line = 0;
};

struct RawEntry {
    std::string entry_type;
    std::string raw_key;
    std::vector<RawField> fields;
    std::size_t start_line = 0;
    std::string source_text;
};

struct NormalizedField {
    std::string name;   // lower case
    std::string value;  // unescaped, whitespace-collapsed
    std::vector<std::string> names;  // author list, split before grouping braces are removed
};

}  // namespace bibkit::v1
