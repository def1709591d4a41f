#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bibkit::v1 {

/// Final output unit. `key` is unique within one IngestResult.
struct Paper {
    std::string key;
    std::string entry_type;
    std::string title;
    std::vector<std::string> authors;
    std::optional<int> year;
    std::string abstract;
    std::optional<std::string> doi;
    std::map<std::string, std::string> extra_fields;

    std::size_t source_line = 0;
    std::string source_text;  // empty unless EngineOptions::keep_source_text
};

// journal, falling back to booktitle; empty when neither is present
[[nodiscard]] std::string venue(const Paper& paper);

/// One-line summary: "<title>... - <authors>... (<year>)".
/// Title is cut at 60 bytes and authors at 30, never inside a UTF-8 sequence.
[[nodiscard]] std::string preview(const Paper& paper);

}  // namespace bibkit::v1
