#include "bibkit/v1/parser/yaml_options.hpp"

#include "bibkit/v1/key_sanitizer.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace bibkit::v1::parser {

namespace {

constexpr const char* kSchemaId = "bibkit-v1";
constexpr const char* kDiagUnknownField = "BIBKIT_CFG_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "BIBKIT_CFG_E_TYPE_MISMATCH";
constexpr const char* kDiagInvalidValue = "BIBKIT_CFG_E_VALUE_INVALID";
constexpr const char* kDiagSchema = "BIBKIT_CFG_E_SCHEMA";
constexpr const char* kDiagIgnoredField = "BIBKIT_CFG_W_UNKNOWN_FIELD";

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

void push_type_mismatch_error(std::vector<std::string>& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    push_error(errors, kDiagTypeMismatch,
               "Type mismatch at '" + path + "' (expected " + expected + ", got " +
                   yaml_node_class(received) + ")");
}

std::optional<bool> parse_bool_scalar(const YAML::Node& node,
                                      const std::string& path,
                                      std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "boolean", node);
        return std::nullopt;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "boolean", node);
        return std::nullopt;
    }
}

std::optional<int> parse_int_scalar(const YAML::Node& node,
                                    const std::string& path,
                                    std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
    try {
        return node.as<int>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
}

std::optional<std::string> parse_string_scalar(const YAML::Node& node,
                                               const std::string& path,
                                               std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "string", node);
        return std::nullopt;
    }
    return node.Scalar();
}

std::optional<std::vector<std::string>> parse_string_sequence(const YAML::Node& node,
                                                              const std::string& path,
                                                              std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsSequence()) {
        push_type_mismatch_error(errors, path, "sequence of strings", node);
        return std::nullopt;
    }
    std::vector<std::string> values;
    for (std::size_t i = 0; i < node.size(); ++i) {
        const auto value = parse_string_scalar(node[i], path + "[" + std::to_string(i) + "]", errors);
        if (!value) {
            return std::nullopt;
        }
        values.push_back(*value);
    }
    return values;
}

// Returns true when `node` is absent or a map; reports otherwise.
bool expect_section(const YAML::Node& node, const std::string& path, std::vector<std::string>& errors) {
    if (!node || node.IsMap()) {
        return true;
    }
    push_type_mismatch_error(errors, path, "map", node);
    return false;
}

}  // namespace

YamlOptionsLoader::YamlOptionsLoader(YamlOptionsLoaderOptions options)
    : options_(options) {}

EngineOptions YamlOptionsLoader::load(const std::filesystem::path& path) {
    errors_.clear();
    warnings_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.push_back("Cannot open file: " + path.string());
        return EngineOptions();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

EngineOptions YamlOptionsLoader::load_string(const std::string& content) {
    EngineOptions options;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, options);
    return options;
}

void YamlOptionsLoader::parse_yaml(const std::string& content, EngineOptions& options) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        errors_.push_back(std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root.IsMap()) {
        push_type_mismatch_error(errors_, "root", "map", root);
        return;
    }

    auto validate_keys = [this](const YAML::Node& node,
                                const std::unordered_set<std::string>& allowed,
                                const std::string& context) {
        if (!node || !node.IsMap()) return;
        for (const auto& it : node) {
            const std::string key = it.first.as<std::string>();
            if (allowed.find(key) != allowed.end()) continue;
            if (options_.strict) {
                push_error(errors_, kDiagUnknownField, "Unknown field at '" + context + "." + key + "'");
            } else {
                push_warning(warnings_, kDiagIgnoredField, "Ignoring unknown field '" + context + "." + key + "'");
            }
        }
    };

    validate_keys(root, {"schema", "version", "validation", "normalization", "keys", "output"}, "root");

    if (!root["schema"]) {
        push_error(errors_, kDiagSchema, "Missing required field 'schema'");
        return;
    }
    if (!root["version"]) {
        push_error(errors_, kDiagSchema, "Missing required field 'version'");
        return;
    }

    const std::optional<std::string> schema = parse_string_scalar(root["schema"], "root.schema", errors_);
    if (!schema) {
        return;
    }
    if (*schema != kSchemaId) {
        push_error(errors_, kDiagSchema, "Unsupported schema: " + *schema);
        return;
    }

    const std::optional<int> version = parse_int_scalar(root["version"], "root.version", errors_);
    if (!version) {
        return;
    }
    if (*version != 1) {
        push_error(errors_, kDiagSchema, "Unsupported schema version: " + std::to_string(*version));
        return;
    }

    const YAML::Node validation = root["validation"];
    if (expect_section(validation, "root.validation", errors_) && validation) {
        validate_keys(validation, {"recommended_fields"}, "validation");
        if (auto fields = parse_string_sequence(validation["recommended_fields"],
                                                "validation.recommended_fields", errors_)) {
            for (auto& name : *fields) {
                for (char& c : name) {
                    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
                }
            }
            options.recommended_fields = std::move(*fields);
        }
    }

    const YAML::Node normalization = root["normalization"];
    if (expect_section(normalization, "root.normalization", errors_) && normalization) {
        validate_keys(normalization, {"expand_month_macros", "report_unsupported_escapes", "homogenize_fields"},
                      "normalization");
        if (auto v = parse_bool_scalar(normalization["expand_month_macros"],
                                       "normalization.expand_month_macros", errors_)) {
            options.expand_month_macros = *v;
        }
        if (auto v = parse_bool_scalar(normalization["report_unsupported_escapes"],
                                       "normalization.report_unsupported_escapes", errors_)) {
            options.report_unsupported_escapes = *v;
        }
        if (auto v = parse_bool_scalar(normalization["homogenize_fields"],
                                       "normalization.homogenize_fields", errors_)) {
            options.homogenize_fields = *v;
        }
    }

    const YAML::Node keys = root["keys"];
    if (expect_section(keys, "root.keys", errors_) && keys) {
        validate_keys(keys, {"placeholder_prefix"}, "keys");
        if (auto prefix = parse_string_scalar(keys["placeholder_prefix"], "keys.placeholder_prefix", errors_)) {
            // The prefix ends up in keys, so it must survive sanitization unchanged.
            if (prefix->empty() || sanitize_key(*prefix, 1, "x") != *prefix) {
                push_error(errors_, kDiagInvalidValue,
                           "Invalid value at 'keys.placeholder_prefix': '" + *prefix +
                               "' (allowed: letters, digits, '-', '_', ':', '.')");
            } else {
                options.placeholder_prefix = *prefix;
            }
        }
    }

    const YAML::Node output = root["output"];
    if (expect_section(output, "root.output", errors_) && output) {
        validate_keys(output, {"keep_source_text"}, "output");
        if (auto v = parse_bool_scalar(output["keep_source_text"], "output.keep_source_text", errors_)) {
            options.keep_source_text = *v;
        }
    }
}

}  // namespace bibkit::v1::parser
