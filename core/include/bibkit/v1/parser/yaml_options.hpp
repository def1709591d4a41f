#pragma once

#include "bibkit/v1/engine.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace bibkit::v1::parser {

struct YamlOptionsLoaderOptions {
    bool strict = true;  // Unknown fields are errors (warnings otherwise)
};

/// Reads EngineOptions from a `schema: bibkit-v1` YAML document:
///
///   schema: bibkit-v1
///   version: 1
///   validation:
///     recommended_fields: [author, year, abstract]
///   normalization:
///     expand_month_macros: true
///     report_unsupported_escapes: true
///     homogenize_fields: true
///   keys:
///     placeholder_prefix: entry_
///   output:
///     keep_source_text: false
///
/// Problems are collected as "[CODE] message" strings; fields that fail to
/// load keep their defaults.
class YamlOptionsLoader {
public:
    explicit YamlOptionsLoader(YamlOptionsLoaderOptions options = {});

    // Parse from file
    EngineOptions load(const std::filesystem::path& path);

    // Parse from string
    EngineOptions load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }
    bool ok() const { return errors_.empty(); }

private:
    YamlOptionsLoaderOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, EngineOptions& options);
};

}  // namespace bibkit::v1::parser
