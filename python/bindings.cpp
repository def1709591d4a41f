// =============================================================================
// BibKit v1 - Python Bindings
// =============================================================================
// Exposes the ingestion engine, its options and the record types:
//
//     import bibkit
//     result = bibkit.parse(open("refs.bib").read())
//     for paper in result.papers:
//         print(paper.key, paper.title)
// =============================================================================

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "bibkit/v1/core.hpp"
#include "bibkit/v1/parser/yaml_options.hpp"

#include <stdexcept>

namespace py = pybind11;
using namespace bibkit::v1;

void init_v1_module(py::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    py::enum_<DiagnosticKind>(m, "DiagnosticKind", "Kind of ingestion problem")
        .value("EmptyInput", DiagnosticKind::EmptyInput)
        .value("UnterminatedEntry", DiagnosticKind::UnterminatedEntry)
        .value("TrailingText", DiagnosticKind::TrailingText)
        .value("MalformedField", DiagnosticKind::MalformedField)
        .value("DuplicateField", DiagnosticKind::DuplicateField)
        .value("MissingRequiredField", DiagnosticKind::MissingRequiredField)
        .value("MissingRecommendedField", DiagnosticKind::MissingRecommendedField)
        .value("FieldFormatWarning", DiagnosticKind::FieldFormatWarning)
        .value("UnsupportedEscape", DiagnosticKind::UnsupportedEscape)
        .value("UndefinedMacro", DiagnosticKind::UndefinedMacro)
        .value("KeyCollisionResolved", DiagnosticKind::KeyCollisionResolved)
        .value("DuplicateKey", DiagnosticKind::DuplicateKey);

    py::enum_<Severity>(m, "Severity", "Diagnostic severity")
        .value("Info", Severity::Info)
        .value("Warning", Severity::Warning)
        .value("Error", Severity::Error);

    // =========================================================================
    // Records
    // =========================================================================

    py::class_<Diagnostic>(m, "Diagnostic")
        .def_readonly("kind", &Diagnostic::kind)
        .def_readonly("entry_key", &Diagnostic::entry_key)
        .def_readonly("message", &Diagnostic::message)
        .def_readonly("source_line", &Diagnostic::source_line)
        .def_readonly("related_line", &Diagnostic::related_line)
        .def_property_readonly("severity", &Diagnostic::severity)
        .def_property_readonly("code", [](const Diagnostic& d) { return std::string(code_of(d.kind)); })
        .def("__str__", &Diagnostic::to_string);

    py::class_<Paper>(m, "Paper")
        .def(py::init<>())
        .def_readwrite("key", &Paper::key)
        .def_readwrite("entry_type", &Paper::entry_type)
        .def_readwrite("title", &Paper::title)
        .def_readwrite("authors", &Paper::authors)
        .def_readwrite("year", &Paper::year)
        .def_readwrite("abstract", &Paper::abstract)
        .def_readwrite("doi", &Paper::doi)
        .def_readwrite("extra_fields", &Paper::extra_fields)
        .def_readwrite("source_line", &Paper::source_line)
        .def_readwrite("source_text", &Paper::source_text)
        .def_property_readonly("venue", [](const Paper& p) { return venue(p); })
        .def_property_readonly("preview", [](const Paper& p) { return preview(p); })
        .def("__repr__", [](const Paper& p) { return "<bibkit.Paper key='" + p.key + "'>"; });

    py::class_<EngineOptions>(m, "EngineOptions")
        .def(py::init<>())
        .def_readwrite("recommended_fields", &EngineOptions::recommended_fields)
        .def_readwrite("expand_month_macros", &EngineOptions::expand_month_macros)
        .def_readwrite("report_unsupported_escapes", &EngineOptions::report_unsupported_escapes)
        .def_readwrite("homogenize_fields", &EngineOptions::homogenize_fields)
        .def_readwrite("keep_source_text", &EngineOptions::keep_source_text)
        .def_readwrite("placeholder_prefix", &EngineOptions::placeholder_prefix);

    py::class_<IngestResult>(m, "IngestResult")
        .def_readonly("papers", &IngestResult::papers)
        .def_readonly("diagnostics", &IngestResult::diagnostics)
        .def("has_fatal", &IngestResult::has_fatal)
        .def("count", [](const IngestResult& r, DiagnosticKind kind) { return r.count(kind); })
        .def("rejected_entries", &IngestResult::rejected_entries);

    // =========================================================================
    // Functions
    // =========================================================================

    m.def("parse", &parse_bibtex, py::arg("text"), py::arg("options") = EngineOptions{},
          "Parse BibTeX text into papers and diagnostics");

    m.def("load_options", [](const std::string& path) {
        parser::YamlOptionsLoader loader;
        EngineOptions options = loader.load(path);
        if (!loader.ok()) {
            std::string message = "Invalid options file " + path + ":";
            for (const auto& error : loader.errors()) message += "\n  " + error;
            throw std::invalid_argument(message);
        }
        return options;
    }, py::arg("path"), "Load EngineOptions from a bibkit-v1 YAML file");

    m.def("normalize", [](const std::string& text) { return ContentNormalizer().normalize(text); },
          py::arg("text"), "Apply the LaTeX escape table and whitespace cleanup to one value");

    m.def("sanitize_key", [](const std::string& raw, std::size_t position) {
        return sanitize_key(raw, position);
    }, py::arg("raw_key"), py::arg("position") = 1);
}

PYBIND11_MODULE(bibkit, m) {
    m.doc() = "BibKit BibTeX ingestion engine (C++ extension)";
    init_v1_module(m);
}
