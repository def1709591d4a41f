#pragma once

#include "bibkit/v1/diagnostics.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace bibkit::v1 {

inline constexpr std::string_view kDefaultPlaceholderPrefix = "entry_";

/// Pure sanitization of one raw citation key.
/// Keeps ASCII letters, digits and "-_:."; every other run of bytes becomes a
/// single '_'. An empty result becomes `<prefix><position>` (position is
/// the 1-based index of the entry in the file).
[[nodiscard]] std::string sanitize_key(std::string_view raw_key,
                                       std::size_t position,
                                       std::string_view placeholder_prefix = kDefaultPlaceholderPrefix);

struct SanitizedKey {
    std::string raw_key;        // trimmed raw key
    std::string base;           // sanitize_key() result
    std::string key;            // base, or base + "_<n>" after a collision
    std::size_t occurrence = 1; // 1 for the first raw key owning `base`
};

/// Per-run key registry. Different raw keys sharing a sanitized base get
/// "_2", "_3", ... in file order (skipping suffixes another raw key already
/// owns); the same raw key always maps to the same sanitized key so true
/// duplicates reach the Assembler unchanged.
class KeySanitizer {
public:
    explicit KeySanitizer(std::string placeholder_prefix = std::string(kDefaultPlaceholderPrefix));

    [[nodiscard]] SanitizedKey assign(std::string_view raw_key,
                                      std::size_t position,
                                      std::size_t source_line,
                                      DiagnosticList& diagnostics);

    void reset() {
        issued_.clear();
        assigned_.clear();
    }

private:
    std::string placeholder_prefix_;
    std::unordered_map<std::string, std::string> issued_;     // sanitized key -> owning raw key
    std::unordered_map<std::string, SanitizedKey> assigned_;  // trimmed raw key -> result
};

}  // namespace bibkit::v1
