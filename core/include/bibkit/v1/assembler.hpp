#pragma once

#include "bibkit/v1/diagnostics.hpp"
#include "bibkit/v1/paper.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bibkit::v1 {

/// Collects accepted papers for one run.
///
/// Keys are unique in the output. When a key is accepted twice the later
/// paper takes the slot of the earlier one (output order stays the order of
/// first acceptance) and a DuplicateKey diagnostic names both source lines.
class Assembler {
public:
    Assembler() = default;

    void add(Paper paper, DiagnosticList& diagnostics);

    [[nodiscard]] std::size_t size() const noexcept { return papers_.size(); }
    [[nodiscard]] bool contains(const std::string& key) const { return slots_.count(key) != 0; }
    [[nodiscard]] const std::vector<Paper>& papers() const noexcept { return papers_; }

    [[nodiscard]] std::vector<Paper> finish() && { return std::move(papers_); }

private:
    std::vector<Paper> papers_;
    std::unordered_map<std::string, std::size_t> slots_;
};

}  // namespace bibkit::v1
