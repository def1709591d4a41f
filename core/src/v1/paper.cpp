#include "bibkit/v1/paper.hpp"

namespace bibkit::v1 {

namespace {

constexpr std::size_t kPreviewTitleBytes = 60;
constexpr std::size_t kPreviewAuthorBytes = 30;

// Cut at `limit` bytes, backing off so a multi-byte sequence is never split.
std::string utf8_prefix(const std::string& s, std::size_t limit) {
    if (s.size() <= limit) {
        return s;
    }
    std::size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return s.substr(0, cut);
}

}  // namespace

std::string venue(const Paper& paper) {
    for (const char* name : {"journal", "booktitle"}) {
        const auto it = paper.extra_fields.find(name);
        if (it != paper.extra_fields.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return {};
}

std::string preview(const Paper& paper) {
    const std::string title = paper.title.empty() ? "Unknown Title" : paper.title;

    std::string authors;
    for (const auto& author : paper.authors) {
        if (!authors.empty()) authors += ", ";
        authors += author;
    }
    if (authors.empty()) authors = "Unknown Authors";

    const std::string year = paper.year ? std::to_string(*paper.year) : "Unknown Year";

    return utf8_prefix(title, kPreviewTitleBytes) + "... - " +
           utf8_prefix(authors, kPreviewAuthorBytes) + "... (" + year + ")";
}

}  // namespace bibkit::v1
