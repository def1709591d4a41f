#include "bibkit/v1/validator.hpp"

#include "bibkit/v1/key_sanitizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>

namespace bibkit::v1 {

namespace {

constexpr std::array<std::string_view, 4> kDoiPrefixes{
    "https://doi.org/", "http://doi.org/", "https://dx.doi.org/", "http://dx.doi.org/"};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool starts_with_icase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

const NormalizedField* find_field(const std::vector<NormalizedField>& fields, std::string_view name) {
    const auto it = std::find_if(fields.begin(), fields.end(),
                                 [&](const NormalizedField& f) { return f.name == name; });
    return it == fields.end() ? nullptr : &*it;
}

bool is_promoted(std::string_view name) {
    return name == "title" || name == "author" || name == "year" || name == "abstract" || name == "doi";
}

}  // namespace

std::optional<int> parse_year(std::string_view value) {
    std::size_t run = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (!is_digit(value[i])) {
            run = 0;
            continue;
        }
        if (++run == 4) {
            const std::size_t begin = i - 3;
            int year = 0;
            for (std::size_t k = begin; k <= i; ++k) {
                year = year * 10 + (value[k] - '0');
            }
            return year;
        }
    }
    return std::nullopt;
}

std::vector<std::string> split_authors(std::string_view value) {
    std::vector<std::string> authors;

    auto push = [&](std::string_view name) {
        name = trim(name);
        if (!name.empty()) authors.emplace_back(name);
    };

    std::size_t start = 0;
    std::size_t i = 0;
    int depth = 0;  // "and" inside braces is part of a name
    while (i < value.size()) {
        const char c = value[i];
        if (c == '\\') {
            i += 2;
            continue;
        }
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (depth > 0) --depth;
        } else if (depth == 0 && i + 3 <= value.size()) {
            const bool space_before = i > 0 && is_space(value[i - 1]);
            const bool space_after = i + 3 < value.size() && is_space(value[i + 3]);
            if (space_before && space_after && starts_with_icase(value.substr(i), "and")) {
                push(value.substr(start, i - start));
                i += 3;
                start = i;
                continue;
            }
        }
        ++i;
    }
    push(value.substr(start));
    return authors;
}

std::string clean_doi(std::string_view value) {
    value = trim(value);
    for (const auto prefix : kDoiPrefixes) {
        if (starts_with_icase(value, prefix)) {
            value.remove_prefix(prefix.size());
            break;
        }
    }
    if (starts_with_icase(value, "doi:")) {
        value.remove_prefix(4);
    }
    return std::string(trim(value));
}

std::vector<NormalizedField> merge_duplicate_fields(std::vector<NormalizedField> fields,
                                                    const DiagnosticContext& context,
                                                    DiagnosticList& diagnostics) {
    std::vector<NormalizedField> merged;
    merged.reserve(fields.size());
    std::unordered_map<std::string, std::size_t> slot;

    for (auto& field : fields) {
        const auto it = slot.find(field.name);
        if (it == slot.end()) {
            slot.emplace(field.name, merged.size());
            merged.push_back(std::move(field));
            continue;
        }
        push_diagnostic(diagnostics, DiagnosticKind::DuplicateField, context,
                        "Field '" + field.name + "' appears more than once; the last value is kept");
        merged[it->second] = std::move(field);
    }
    return merged;
}

std::optional<Paper> validate_entry(const EntryIdentity& identity,
                                    const std::vector<NormalizedField>& fields,
                                    const ValidationPolicy& policy,
                                    DiagnosticList& diagnostics) {
    const DiagnosticContext context{identity.key, identity.source_line};

    const NormalizedField* title = find_field(fields, "title");
    if (title == nullptr || title->value.empty()) {
        push_diagnostic(diagnostics, DiagnosticKind::MissingRequiredField, context,
                        std::string("Required field 'title' ") +
                            (title == nullptr ? "is absent" : "is empty") + "; entry rejected");
        return std::nullopt;
    }

    for (const auto& name : policy.recommended_fields) {
        if (name == "title") continue;
        const NormalizedField* field = find_field(fields, name);
        if (field == nullptr || field->value.empty()) {
            push_diagnostic(diagnostics, DiagnosticKind::MissingRecommendedField, context,
                            "Recommended field '" + name + "' is " +
                                (field == nullptr ? "absent" : "empty"));
        }
    }

    Paper paper;
    paper.key = identity.key;
    paper.entry_type = identity.entry_type;
    paper.source_line = identity.source_line;
    paper.source_text = identity.source_text;
    paper.title = title->value;

    if (const auto* author = find_field(fields, "author")) {
        paper.authors = author->names.empty() ? split_authors(author->value) : author->names;
    }
    if (const auto* abstract = find_field(fields, "abstract")) {
        paper.abstract = abstract->value;
    }
    if (const auto* doi = find_field(fields, "doi")) {
        std::string cleaned = clean_doi(doi->value);
        if (!cleaned.empty()) paper.doi = std::move(cleaned);
    }
    if (const auto* year = find_field(fields, "year"); year != nullptr && !year->value.empty()) {
        paper.year = parse_year(year->value);
        if (!paper.year) {
            push_diagnostic(diagnostics, DiagnosticKind::FieldFormatWarning, context,
                            "Year '" + year->value + "' has no four-digit year; left unset");
            // Unparsed text stays available to the caller.
            paper.extra_fields.emplace("year", year->value);
        }
    }

    for (const auto& field : fields) {
        if (!is_promoted(field.name)) {
            paper.extra_fields.insert_or_assign(field.name, field.value);
        }
    }
    return paper;
}

std::optional<Paper> make_paper(const ExtractedDocument& document,
                                std::size_t position,
                                const ContentNormalizer& normalizer,
                                const ValidationPolicy& policy,
                                DiagnosticList& diagnostics) {
    EntryIdentity identity;
    identity.key = sanitize_key(document.source_name, position, "document_");
    identity.entry_type = "document";

    const DiagnosticContext context{identity.key, 0};
    std::vector<NormalizedField> fields;
    auto add = [&](const char* name, const std::string& raw) {
        if (raw.empty()) return;
        NormalizedField field;
        field.name = name;
        field.value = normalizer.normalize(raw, context, diagnostics);
        fields.push_back(std::move(field));
    };
    add("title", document.title);
    if (!document.authors.empty()) {
        NormalizedField author;
        author.name = "author";
        author.names = normalizer.normalize_names(document.authors, context, diagnostics);
        for (const auto& name : author.names) {
            if (!author.value.empty()) author.value += " and ";
            author.value += name;
        }
        fields.push_back(std::move(author));
    }
    add("year", document.year);
    add("abstract", document.abstract);
    add("doi", document.doi);

    auto paper = validate_entry(identity, fields, policy, diagnostics);
    if (paper && !document.body.empty()) {
        // Body text is kept as extracted; only control characters are an issue downstream.
        paper->extra_fields.emplace("body", normalizer.normalize(document.body));
    }
    return paper;
}

}  // namespace bibkit::v1
