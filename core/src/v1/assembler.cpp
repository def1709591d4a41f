#include "bibkit/v1/assembler.hpp"

#include <utility>

namespace bibkit::v1 {

void Assembler::add(Paper paper, DiagnosticList& diagnostics) {
    const auto it = slots_.find(paper.key);
    if (it == slots_.end()) {
        slots_.emplace(paper.key, papers_.size());
        papers_.push_back(std::move(paper));
        return;
    }

    Paper& earlier = papers_[it->second];
    Diagnostic diagnostic;
    diagnostic.kind = DiagnosticKind::DuplicateKey;
    diagnostic.entry_key = paper.key;
    diagnostic.source_line = earlier.source_line;
    diagnostic.related_line = paper.source_line;
    diagnostic.message = "Entry '" + paper.key + "' at line " + std::to_string(earlier.source_line) +
                         " is replaced by the entry at line " + std::to_string(paper.source_line) +
                         " with the same key";
    diagnostics.push_back(std::move(diagnostic));

    earlier = std::move(paper);
}

}  // namespace bibkit::v1
