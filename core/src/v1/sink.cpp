#include "bibkit/v1/sink.hpp"

namespace bibkit::v1 {

void to_json(nlohmann::json& j, const Paper& paper) {
    j = nlohmann::json{
        {"key", paper.key},
        {"entry_type", paper.entry_type},
        {"title", paper.title},
        {"authors", paper.authors},
        {"abstract", paper.abstract},
        {"extra_fields", paper.extra_fields},
        {"source_line", paper.source_line},
    };
    j["year"] = paper.year ? nlohmann::json(*paper.year) : nlohmann::json(nullptr);
    j["doi"] = paper.doi ? nlohmann::json(*paper.doi) : nlohmann::json(nullptr);
    if (!paper.source_text.empty()) {
        j["source_text"] = paper.source_text;
    }
}

void to_json(nlohmann::json& j, const Diagnostic& diagnostic) {
    j = nlohmann::json{
        {"kind", to_string(diagnostic.kind)},
        {"code", code_of(diagnostic.kind)},
        {"severity", to_string(diagnostic.severity())},
        {"message", diagnostic.message},
        {"source_line", diagnostic.source_line},
    };
    j["entry_key"] = diagnostic.entry_key ? nlohmann::json(*diagnostic.entry_key) : nlohmann::json(nullptr);
    if (diagnostic.related_line) {
        j["related_line"] = *diagnostic.related_line;
    }
}

void JsonLinesSink::accept(const Paper& paper) {
    // Invalid UTF-8 from the source is replaced rather than thrown on.
    out_ << nlohmann::json(paper).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    ++written_;
}

void JsonLinesSink::finish() {
    out_.flush();
}

std::size_t publish(const IngestResult& result, PaperSink& sink) {
    for (const auto& paper : result.papers) {
        sink.accept(paper);
    }
    sink.finish();
    return result.papers.size();
}

}  // namespace bibkit::v1
