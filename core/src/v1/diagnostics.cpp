#include "bibkit/v1/diagnostics.hpp"

#include <sstream>

namespace bibkit::v1 {

std::string Diagnostic::to_string() const {
    std::ostringstream oss;
    oss << "[" << code_of(kind) << "]";
    if (source_line > 0) {
        oss << " line " << source_line;
    }
    if (entry_key) {
        oss << " (" << *entry_key << ")";
    }
    oss << ": " << message;
    return oss.str();
}

void push_diagnostic(DiagnosticList& diagnostics,
                     DiagnosticKind kind,
                     const DiagnosticContext& context,
                     std::string message) {
    Diagnostic diagnostic;
    diagnostic.kind = kind;
    diagnostic.entry_key = context.entry_key;
    diagnostic.message = std::move(message);
    diagnostic.source_line = context.line;
    diagnostics.push_back(std::move(diagnostic));
}

}  // namespace bibkit::v1
