#include "vigil/text/fold.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <unordered_set>

namespace vigil::text {

namespace {

// Lowercase Cyrillic U+0430..U+044F, in order.
constexpr std::array<std::string_view, 32> CYRILLIC_BASIC = {
    "a", "b", "v", "g", "d", "e", "zh", "z",
    "i", "i", "k", "l", "m", "n", "o", "p",
    "r", "s", "t", "u", "f", "kh", "ts", "ch",
    "sh", "shch", "", "y", "", "e", "yu", "ya"
};

// Latin-1 Supplement U+00C0..U+00FF; empty entries are dropped.
constexpr std::array<std::string_view, 64> LATIN1 = {
    "a", "a", "a", "a", "a", "a", "ae", "c",
    "e", "e", "e", "e", "i", "i", "i", "i",
    "d", "n", "o", "o", "o", "o", "o", "",
    "o", "u", "u", "u", "u", "y", "th", "ss",
    "a", "a", "a", "a", "a", "a", "ae", "c",
    "e", "e", "e", "e", "i", "i", "i", "i",
    "d", "n", "o", "o", "o", "o", "o", "",
    "o", "u", "u", "u", "u", "y", "th", "y"
};

// Latin Extended-A U+0100..U+017F.
constexpr std::array<std::string_view, 128> LATIN_EXT_A = {
    "a", "a", "a", "a", "a", "a", "c", "c",
    "c", "c", "c", "c", "c", "c", "d", "d",
    "d", "d", "e", "e", "e", "e", "e", "e",
    "e", "e", "e", "e", "g", "g", "g", "g",
    "g", "g", "g", "g", "h", "h", "h", "h",
    "i", "i", "i", "i", "i", "i", "i", "i",
    "i", "i", "ij", "ij", "j", "j", "k", "k",
    "k", "l", "l", "l", "l", "l", "l", "l",
    "l", "l", "l", "n", "n", "n", "n", "n",
    "n", "n", "n", "n", "o", "o", "o", "o",
    "o", "o", "oe", "oe", "r", "r", "r", "r",
    "r", "r", "s", "s", "s", "s", "s", "s",
    "s", "s", "t", "t", "t", "t", "t", "t",
    "u", "u", "u", "u", "u", "u", "u", "u",
    "u", "u", "u", "u", "w", "w", "y", "y",
    "y", "z", "z", "z", "z", "z", "z", "s"
};

// Lowercase Greek U+03B1..U+03C9 (final sigma included), in order.
constexpr std::array<std::string_view, 25> GREEK_BASIC = {
    "a", "v", "g", "d", "e", "z", "i", "th",
    "i", "k", "l", "m", "n", "x", "o", "p",
    "r", "s", "s", "t", "y", "f", "ch", "ps",
    "o"
};

const std::unordered_set<std::string_view> STOPWORDS = {
    // legal forms
    "llc", "ltd", "inc", "corp", "co", "plc", "gmbh", "ag", "sa", "lp", "llp",
    "ooo", "zao", "oao", "pao", "ao", "ip", "fop", "tov", "pat", "prat", "at",
    // connectives
    "and", "of", "the", "ta", "na",
};

auto transliterate(char32_t cp) -> std::string_view {
    if (cp >= 0x0410 && cp <= 0x042F) return CYRILLIC_BASIC[cp - 0x0410];
    if (cp >= 0x0430 && cp <= 0x044F) return CYRILLIC_BASIC[cp - 0x0430];
    if (cp >= 0x00C0 && cp <= 0x00FF) return LATIN1[cp - 0x00C0];
    if (cp >= 0x0100 && cp <= 0x017F) return LATIN_EXT_A[cp - 0x0100];
    if (cp >= 0x0391 && cp <= 0x03A9) return GREEK_BASIC[cp - 0x0391];
    if (cp >= 0x03B1 && cp <= 0x03C9) return GREEK_BASIC[cp - 0x03B1];
    switch (cp) {
        case 0x0218: case 0x0219: return "s";   // Ș ș
        case 0x021A: case 0x021B: return "t";   // Ț ț
        case 0x0386: case 0x03AC: return "a";   // Ά ά
        case 0x0388: case 0x03AD: return "e";   // Έ έ
        case 0x0389: case 0x038A: case 0x03AE:
        case 0x03AF: case 0x03CA: return "i";   // Ή Ί ή ί ϊ
        case 0x038C: case 0x03CC:
        case 0x038F: case 0x03CE: return "o";   // Ό ό Ώ ώ
        case 0x038E: case 0x03CD: case 0x03CB: return "y";   // Ύ ύ ϋ
        case 0x0401: case 0x0451: return "e";   // Ё ё
        case 0x0404: case 0x0454: return "ye";  // Є є
        case 0x0406: case 0x0456: return "i";   // І і
        case 0x0407: case 0x0457: return "yi";  // Ї ї
        case 0x0490: case 0x0491: return "g";   // Ґ ґ
        default: return {};
    }
}

// Decodes one code point starting at s[i]; advances i. Invalid sequences yield
// U+FFFD and skip a single byte.
auto decode_utf8(std::string_view s, std::size_t& i) -> char32_t {
    const auto b0 = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    char32_t cp = 0;
    if (b0 < 0x80) { ++i; return b0; }
    if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; }
    else { ++i; return 0xFFFD; }

    if (i + len > s.size()) { ++i; return 0xFFFD; }
    for (std::size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) { ++i; return 0xFFFD; }
        cp = (cp << 6) | (b & 0x3F);
    }
    i += len;
    return cp;
}

auto fold_ascii(std::string_view token) -> std::string {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u)) {
            out.push_back(static_cast<char>(std::tolower(u)));
        }
    }
    return out;
}

} // anonymous namespace

auto is_ascii(std::string_view s) noexcept -> bool {
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

auto fold(std::string_view token, bool ascii_fastpath) -> std::string {
    if (ascii_fastpath && is_ascii(token)) {
        return fold_ascii(token);
    }

    std::string out;
    out.reserve(token.size());
    std::size_t i = 0;
    while (i < token.size()) {
        const char32_t cp = decode_utf8(token, i);
        if (cp < 0x80) {
            const auto u = static_cast<unsigned char>(cp);
            if (std::isalnum(u)) {
                out.push_back(static_cast<char>(std::tolower(u)));
            }
            continue;
        }
        out.append(transliterate(cp));
    }
    return out;
}

auto fold_tokens(const std::vector<std::string>& tokens, bool ascii_fastpath)
    -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(tokens.size());
    for (const auto& t : tokens) {
        auto f = fold(t, ascii_fastpath);
        if (!f.empty()) out.push_back(std::move(f));
    }
    return out;
}

auto fold_text(std::string_view text, bool ascii_fastpath) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start < text.size()) {
        while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
        std::size_t end = start;
        while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) ++end;
        if (end > start) {
            auto f = fold(text.substr(start, end - start), ascii_fastpath);
            if (!f.empty()) out.push_back(std::move(f));
        }
        start = end;
    }
    return out;
}

auto join(const std::vector<std::string>& tokens, std::string_view sep) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out.append(sep);
        out.append(tokens[i]);
    }
    return out;
}

auto sorted_join(std::vector<std::string> tokens, std::string_view sep) -> std::string {
    std::sort(tokens.begin(), tokens.end());
    return join(tokens, sep);
}

auto is_stopword(std::string_view folded) noexcept -> bool {
    return STOPWORDS.count(folded) > 0;
}

auto drop_stopwords(const std::vector<std::string>& folded) -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(folded.size());
    for (const auto& t : folded) {
        if (!is_stopword(t)) out.push_back(t);
    }
    if (out.empty()) return folded;
    return out;
}

auto normalize_identifier(std::string_view raw) -> std::string {
    if (auto pos = raw.find(':'); pos != std::string_view::npos) {
        raw = raw.substr(pos + 1);
    }
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x80 && std::isalnum(u)) {
            out.push_back(static_cast<char>(std::toupper(u)));
        }
    }
    return out;
}

} // namespace vigil::text
