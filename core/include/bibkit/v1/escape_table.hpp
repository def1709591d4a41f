#pragma once

// =============================================================================
// BibKit v1 - Fixed LaTeX escape table
// =============================================================================
// The normalizer maps these markup sequences to plain text and leaves every
// other macro untouched. The table is closed: it is checked at compile time
// for duplicate or conflicting commands, and no replacement may contain a
// character the normalizer itself interprets ('\\', '{', '}', '~'), so that
// normalizing twice is the same as normalizing once.
// =============================================================================

#include <array>
#include <optional>
#include <string_view>

namespace bibkit::v1::escapes {

/// `\<command>` -> replacement. Control symbols use a one-character command.
struct SymbolEscape {
    std::string_view command;
    std::string_view replacement;
};

/// `\<accent><base>`, `\<accent>{<base>}` -> precomposed character.
struct AccentEscape {
    char accent;
    char base;
    std::string_view replacement;
};

inline constexpr std::array kSymbolEscapes{
    // Letters
    SymbolEscape{"ss", "ß"},
    SymbolEscape{"o", "ø"},
    SymbolEscape{"O", "Ø"},
    SymbolEscape{"aa", "å"},
    SymbolEscape{"AA", "Å"},
    SymbolEscape{"ae", "æ"},
    SymbolEscape{"AE", "Æ"},
    SymbolEscape{"oe", "œ"},
    SymbolEscape{"OE", "Œ"},
    SymbolEscape{"l", "ł"},
    SymbolEscape{"L", "Ł"},
    SymbolEscape{"i", "ı"},
    SymbolEscape{"j", "ȷ"},
    // Escaped specials
    SymbolEscape{"&", "&"},
    SymbolEscape{"%", "%"},
    SymbolEscape{"$", "$"},
    SymbolEscape{"#", "#"},
    SymbolEscape{"_", "_"},
    // Spacing and hints
    SymbolEscape{" ", " "},
    SymbolEscape{"\\", " "},
    SymbolEscape{",", " "},
    SymbolEscape{";", " "},
    SymbolEscape{":", " "},
    SymbolEscape{"!", ""},
    SymbolEscape{"-", ""},
    SymbolEscape{"/", ""},
    // Punctuation and symbols
    SymbolEscape{"ldots", "…"},
    SymbolEscape{"dots", "…"},
    SymbolEscape{"textendash", "–"},
    SymbolEscape{"textemdash", "—"},
    SymbolEscape{"textquotedblleft", "“"},
    SymbolEscape{"textquotedblright", "”"},
    SymbolEscape{"textquoteleft", "‘"},
    SymbolEscape{"textquoteright", "’"},
    SymbolEscape{"guillemotleft", "«"},
    SymbolEscape{"guillemotright", "»"},
    SymbolEscape{"textregistered", "®"},
    SymbolEscape{"copyright", "©"},
    SymbolEscape{"textcopyright", "©"},
    SymbolEscape{"texttrademark", "™"},
    SymbolEscape{"S", "§"},
    SymbolEscape{"P", "¶"},
    SymbolEscape{"dag", "†"},
    SymbolEscape{"ddag", "‡"},
    SymbolEscape{"textbullet", "•"},
    SymbolEscape{"textdegree", "°"},
    SymbolEscape{"pounds", "£"},
    SymbolEscape{"euro", "€"},
    // Math symbols common in abstracts
    SymbolEscape{"alpha", "α"},
    SymbolEscape{"beta", "β"},
    SymbolEscape{"gamma", "γ"},
    SymbolEscape{"delta", "δ"},
    SymbolEscape{"epsilon", "ε"},
    SymbolEscape{"theta", "θ"},
    SymbolEscape{"lambda", "λ"},
    SymbolEscape{"mu", "μ"},
    SymbolEscape{"pi", "π"},
    SymbolEscape{"sigma", "σ"},
    SymbolEscape{"omega", "ω"},
    SymbolEscape{"Delta", "Δ"},
    SymbolEscape{"Omega", "Ω"},
    SymbolEscape{"pm", "±"},
    SymbolEscape{"times", "×"},
    SymbolEscape{"cdot", "·"},
    SymbolEscape{"leq", "≤"},
    SymbolEscape{"geq", "≥"},
    SymbolEscape{"approx", "≈"},
    SymbolEscape{"infty", "∞"},
};

inline constexpr std::array kAccentEscapes{
    // umlaut
    AccentEscape{'"', 'a', "ä"}, AccentEscape{'"', 'e', "ë"}, AccentEscape{'"', 'i', "ï"},
    AccentEscape{'"', 'o', "ö"}, AccentEscape{'"', 'u', "ü"}, AccentEscape{'"', 'y', "ÿ"},
    AccentEscape{'"', 'A', "Ä"}, AccentEscape{'"', 'E', "Ë"}, AccentEscape{'"', 'I', "Ï"},
    AccentEscape{'"', 'O', "Ö"}, AccentEscape{'"', 'U', "Ü"}, AccentEscape{'"', 'Y', "Ÿ"},
    // acute
    AccentEscape{'\'', 'a', "á"}, AccentEscape{'\'', 'e', "é"}, AccentEscape{'\'', 'i', "í"},
    AccentEscape{'\'', 'o', "ó"}, AccentEscape{'\'', 'u', "ú"}, AccentEscape{'\'', 'y', "ý"},
    AccentEscape{'\'', 'c', "ć"}, AccentEscape{'\'', 'n', "ń"}, AccentEscape{'\'', 's', "ś"},
    AccentEscape{'\'', 'z', "ź"}, AccentEscape{'\'', 'A', "Á"}, AccentEscape{'\'', 'E', "É"},
    AccentEscape{'\'', 'I', "Í"}, AccentEscape{'\'', 'O', "Ó"}, AccentEscape{'\'', 'U', "Ú"},
    AccentEscape{'\'', 'Y', "Ý"}, AccentEscape{'\'', 'C', "Ć"}, AccentEscape{'\'', 'N', "Ń"},
    AccentEscape{'\'', 'S', "Ś"}, AccentEscape{'\'', 'Z', "Ź"},
    // grave
    AccentEscape{'`', 'a', "à"}, AccentEscape{'`', 'e', "è"}, AccentEscape{'`', 'i', "ì"},
    AccentEscape{'`', 'o', "ò"}, AccentEscape{'`', 'u', "ù"}, AccentEscape{'`', 'A', "À"},
    AccentEscape{'`', 'E', "È"}, AccentEscape{'`', 'I', "Ì"}, AccentEscape{'`', 'O', "Ò"},
    AccentEscape{'`', 'U', "Ù"},
    // circumflex
    AccentEscape{'^', 'a', "â"}, AccentEscape{'^', 'e', "ê"}, AccentEscape{'^', 'i', "î"},
    AccentEscape{'^', 'o', "ô"}, AccentEscape{'^', 'u', "û"}, AccentEscape{'^', 'A', "Â"},
    AccentEscape{'^', 'E', "Ê"}, AccentEscape{'^', 'I', "Î"}, AccentEscape{'^', 'O', "Ô"},
    AccentEscape{'^', 'U', "Û"},
    // tilde
    AccentEscape{'~', 'a', "ã"}, AccentEscape{'~', 'n', "ñ"}, AccentEscape{'~', 'o', "õ"},
    AccentEscape{'~', 'A', "Ã"}, AccentEscape{'~', 'N', "Ñ"}, AccentEscape{'~', 'O', "Õ"},
    // macron
    AccentEscape{'=', 'a', "ā"}, AccentEscape{'=', 'e', "ē"}, AccentEscape{'=', 'i', "ī"},
    AccentEscape{'=', 'o', "ō"}, AccentEscape{'=', 'u', "ū"},
    // dot above
    AccentEscape{'.', 'z', "ż"}, AccentEscape{'.', 'Z', "Ż"}, AccentEscape{'.', 'e', "ė"},
    AccentEscape{'.', 'I', "İ"},
    // cedilla
    AccentEscape{'c', 'c', "ç"}, AccentEscape{'c', 'C', "Ç"}, AccentEscape{'c', 's', "ş"},
    AccentEscape{'c', 'S', "Ş"},
    // caron
    AccentEscape{'v', 'c', "č"}, AccentEscape{'v', 'C', "Č"}, AccentEscape{'v', 's', "š"},
    AccentEscape{'v', 'S', "Š"}, AccentEscape{'v', 'z', "ž"}, AccentEscape{'v', 'Z', "Ž"},
    AccentEscape{'v', 'r', "ř"}, AccentEscape{'v', 'R', "Ř"}, AccentEscape{'v', 'e', "ě"},
    AccentEscape{'v', 'E', "Ě"}, AccentEscape{'v', 'n', "ň"}, AccentEscape{'v', 'N', "Ň"},
    // breve
    AccentEscape{'u', 'a', "ă"}, AccentEscape{'u', 'A', "Ă"}, AccentEscape{'u', 'g', "ğ"},
    AccentEscape{'u', 'G', "Ğ"},
    // double acute
    AccentEscape{'H', 'o', "ő"}, AccentEscape{'H', 'O', "Ő"}, AccentEscape{'H', 'u', "ű"},
    AccentEscape{'H', 'U', "Ű"},
    // ring
    AccentEscape{'r', 'a', "å"}, AccentEscape{'r', 'A', "Å"}, AccentEscape{'r', 'u', "ů"},
    AccentEscape{'r', 'U', "Ů"},
    // ogonek
    AccentEscape{'k', 'a', "ą"}, AccentEscape{'k', 'A', "Ą"}, AccentEscape{'k', 'e', "ę"},
    AccentEscape{'k', 'E', "Ę"},
};

/// Commands that only style their argument; the argument is kept.
inline constexpr std::array<std::string_view, 24> kFormattingCommands{
    "emph", "textit", "textbf", "textsc", "texttt", "textrm", "textsf", "textsl",
    "textup", "textmd", "textnormal", "mathrm", "mathit", "mathbf", "mathsf", "mathtt",
    "mathcal", "mbox", "hbox", "url", "underline", "uline", "ensuremath", "NoCaseChange"};

/// Style switches with no argument; dropped.
inline constexpr std::array<std::string_view, 22> kDeclarationCommands{
    "it", "bf", "em", "sc", "tt", "rm", "sf", "sl", "up", "normalfont", "itshape",
    "bfseries", "scshape", "upshape", "mdseries", "rmfamily", "sffamily", "ttfamily",
    "protect", "relax", "small", "footnotesize"};

/// Accent commands that are control symbols (`\"o`).
inline constexpr std::string_view kSymbolAccents = "\"'`^~=.";
/// Accent commands that are letters and need a space or brace (`\c c`, `\v{s}`).
inline constexpr std::string_view kLetterAccents = "cvuHrk";

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------

[[nodiscard]] constexpr std::optional<std::string_view> find_symbol(std::string_view command) noexcept {
    for (const auto& e : kSymbolEscapes) {
        if (e.command == command) return e.replacement;
    }
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<std::string_view> find_accent(char accent, char base) noexcept {
    for (const auto& e : kAccentEscapes) {
        if (e.accent == accent && e.base == base) return e.replacement;
    }
    return std::nullopt;
}

template<std::size_t N>
[[nodiscard]] constexpr bool contains(const std::array<std::string_view, N>& table,
                                      std::string_view command) noexcept {
    for (const auto& entry : table) {
        if (entry == command) return true;
    }
    return false;
}

[[nodiscard]] constexpr bool is_formatting_command(std::string_view command) noexcept {
    return contains(kFormattingCommands, command);
}

[[nodiscard]] constexpr bool is_declaration_command(std::string_view command) noexcept {
    return contains(kDeclarationCommands, command);
}

[[nodiscard]] constexpr bool is_letter_accent(std::string_view command) noexcept {
    return command.size() == 1 && kLetterAccents.find(command.front()) != std::string_view::npos;
}

// -----------------------------------------------------------------------------
// Compile-time table checks
// -----------------------------------------------------------------------------

namespace detail {

constexpr bool is_plain_replacement(std::string_view text) noexcept {
    for (const char c : text) {
        const auto u = static_cast<unsigned char>(c);
        if (c == '\\' || c == '{' || c == '}' || c == '~' || u < 0x20 || u == 0x7F) {
            return false;
        }
    }
    return true;
}

constexpr bool symbol_table_is_consistent() noexcept {
    for (std::size_t i = 0; i < kSymbolEscapes.size(); ++i) {
        const auto& e = kSymbolEscapes[i];
        if (e.command.empty() || !is_plain_replacement(e.replacement)) return false;
        if (is_formatting_command(e.command) || is_declaration_command(e.command) ||
            is_letter_accent(e.command)) {
            return false;
        }
        if (e.command.size() == 1 && kSymbolAccents.find(e.command.front()) != std::string_view::npos) {
            return false;
        }
        for (std::size_t j = i + 1; j < kSymbolEscapes.size(); ++j) {
            if (kSymbolEscapes[j].command == e.command) return false;
        }
    }
    return true;
}

constexpr bool accent_table_is_consistent() noexcept {
    for (std::size_t i = 0; i < kAccentEscapes.size(); ++i) {
        const auto& e = kAccentEscapes[i];
        const bool known_accent = kSymbolAccents.find(e.accent) != std::string_view::npos ||
                                  kLetterAccents.find(e.accent) != std::string_view::npos;
        if (!known_accent || !is_plain_replacement(e.replacement) || e.replacement.empty()) {
            return false;
        }
        for (std::size_t j = i + 1; j < kAccentEscapes.size(); ++j) {
            if (kAccentEscapes[j].accent == e.accent && kAccentEscapes[j].base == e.base) return false;
        }
    }
    return true;
}

template<std::size_t N, std::size_t M>
constexpr bool disjoint(const std::array<std::string_view, N>& a,
                        const std::array<std::string_view, M>& b) noexcept {
    for (std::size_t i = 0; i < N; ++i) {
        for (std::size_t j = i + 1; j < N; ++j) {
            if (a[i] == a[j]) return false;
        }
        if (contains(b, a[i])) return false;
    }
    return true;
}

}  // namespace detail

static_assert(detail::symbol_table_is_consistent(),
              "symbol escape table has a duplicate, conflicting or non-plain entry");
static_assert(detail::accent_table_is_consistent(),
              "accent escape table has a duplicate or non-plain entry");
static_assert(detail::disjoint(kFormattingCommands, kDeclarationCommands) &&
                  detail::disjoint(kDeclarationCommands, kFormattingCommands),
              "formatting and declaration commands overlap");

}  // namespace bibkit::v1::escapes
