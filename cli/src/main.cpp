#include <CLI/CLI.hpp>
#include <bibkit/v1/core.hpp>
#include <bibkit/v1/parser/yaml_options.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace bibkit::v1;

std::string read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Returns false (after reporting) when the config file is unusable.
bool load_options(const std::string& config_file, EngineOptions& options, bool quiet) {
    if (config_file.empty()) {
        return true;
    }
    parser::YamlOptionsLoader loader;
    options = loader.load(config_file);
    for (const auto& warning : loader.warnings()) {
        if (!quiet) std::cerr << "Warning: " << warning << std::endl;
    }
    if (!loader.ok()) {
        for (const auto& error : loader.errors()) {
            std::cerr << "Error: " << error << std::endl;
        }
        return false;
    }
    return true;
}

void print_diagnostics(const IngestResult& result, bool verbose, bool quiet) {
    for (const auto& diagnostic : result.diagnostics) {
        const Severity severity = diagnostic.severity();
        if (quiet && severity != Severity::Error) continue;
        if (!verbose && severity == Severity::Info) continue;
        std::cerr << diagnostic.to_string() << std::endl;
    }
}

void print_summary(const IngestResult& result) {
    std::cerr << "  Papers: " << result.papers.size() << std::endl;
    std::cerr << "  Rejected entries: " << result.rejected_entries() << std::endl;
    std::cerr << "  Errors: " << result.count(Severity::Error) << std::endl;
    std::cerr << "  Warnings: " << result.count(Severity::Warning) << std::endl;
}

int cmd_parse(const std::string& bib_file, const std::string& output_file,
              const std::string& config_file, bool verbose, bool quiet) {
    try {
        EngineOptions options;
        if (!load_options(config_file, options, quiet)) {
            return 1;
        }

        if (!quiet) {
            std::cerr << "Reading bibliography: " << bib_file << std::endl;
        }
        const std::string text = read_file(bib_file);
        const IngestResult result = BibEngine(options).parse(text);

        print_diagnostics(result, verbose, quiet);

        if (!output_file.empty()) {
            std::ofstream out(output_file);
            if (!out.is_open()) {
                throw std::runtime_error("Cannot open output file: " + output_file);
            }
            JsonLinesSink sink(out);
            publish(result, sink);
            if (!quiet) {
                std::cerr << "Wrote " << sink.written() << " papers to: " << output_file << std::endl;
            }
        } else {
            JsonLinesSink sink(std::cout);
            publish(result, sink);
        }

        if (verbose) {
            std::cerr << "Parse completed:" << std::endl;
            print_summary(result);
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_validate(const std::string& bib_file, const std::string& config_file, bool verbose, bool quiet) {
    try {
        EngineOptions options;
        if (!load_options(config_file, options, quiet)) {
            return 1;
        }

        const IngestResult result = BibEngine(options).parse(read_file(bib_file));

        for (const auto& diagnostic : result.diagnostics) {
            if (quiet && !diagnostic.is_fatal()) continue;
            std::cout << diagnostic.to_string() << std::endl;
        }

        if (verbose) {
            print_summary(result);
        }

        if (result.rejected_entries() > 0 || result.count(DiagnosticKind::EmptyInput) > 0) {
            if (!quiet) {
                std::cout << "FAILED (" << result.rejected_entries() << " entries rejected)" << std::endl;
            }
            return 2;
        }

        if (!quiet) {
            std::cout << "OK (" << result.papers.size() << " papers)" << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_info(const std::string& bib_file, const std::string& config_file, bool quiet) {
    try {
        EngineOptions options;
        if (!load_options(config_file, options, quiet)) {
            return 1;
        }

        const IngestResult result = BibEngine(options).parse(read_file(bib_file));

        std::cout << "Bibliography: " << bib_file << std::endl;
        std::cout << "\nPapers (" << result.papers.size() << "):" << std::endl;
        for (const auto& paper : result.papers) {
            std::cout << "  [" << paper.key << "] " << preview(paper) << std::endl;
            const std::string where = venue(paper);
            if (!where.empty()) {
                std::cout << "      in " << where << std::endl;
            }
        }

        std::cout << "\nDiagnostics (" << result.diagnostics.size() << "):" << std::endl;
        std::cout << "  errors: " << result.count(Severity::Error) << std::endl;
        std::cout << "  warnings: " << result.count(Severity::Warning) << std::endl;
        std::cout << "  info: " << result.count(Severity::Info) << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int main(int argc, char** argv) {
    CLI::App app{"BibKit - BibTeX ingestion and normalization"};
    app.set_version_flag("-V,--version", "BibKit 0.1.0");

    // Global options
    bool verbose = false;
    bool quiet = false;
    std::string config_file;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");
    app.add_option("-c,--config", config_file, "Engine options (bibkit-v1 YAML)")
        ->check(CLI::ExistingFile);

    // Parse command
    auto* parse_cmd = app.add_subcommand("parse", "Parse a .bib file into JSON lines");
    std::string parse_file;
    std::string output_file;
    parse_cmd->add_option("bibfile", parse_file, "BibTeX file")
        ->required()
        ->check(CLI::ExistingFile);
    parse_cmd->add_option("-o,--output", output_file, "Output file (JSON lines)");
    parse_cmd->callback([&]() {
        std::exit(cmd_parse(parse_file, output_file, config_file, verbose, quiet));
    });

    // Validate command
    auto* validate_cmd = app.add_subcommand("validate", "Check a .bib file and list diagnostics");
    std::string validate_file;
    validate_cmd->add_option("bibfile", validate_file, "BibTeX file")
        ->required()
        ->check(CLI::ExistingFile);
    validate_cmd->callback([&]() {
        std::exit(cmd_validate(validate_file, config_file, verbose, quiet));
    });

    // Info command
    auto* info_cmd = app.add_subcommand("info", "Show a preview of every paper");
    std::string info_file;
    info_cmd->add_option("bibfile", info_file, "BibTeX file")
        ->required()
        ->check(CLI::ExistingFile);
    info_cmd->callback([&]() {
        std::exit(cmd_info(info_file, config_file, quiet));
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
