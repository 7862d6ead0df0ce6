#include "vigil/text/phonetic.hpp"

#include <cctype>

namespace vigil::text {

namespace {

// Soundex digit for a lowercase letter; '0' for vowels and y, '-' for h and w.
constexpr auto soundex_code(char c) noexcept -> char {
    switch (c) {
        case 'b': case 'f': case 'p': case 'v':
            return '1';
        case 'c': case 'g': case 'j': case 'k': case 'q': case 's': case 'x': case 'z':
            return '2';
        case 'd': case 't':
            return '3';
        case 'l':
            return '4';
        case 'm': case 'n':
            return '5';
        case 'r':
            return '6';
        case 'h': case 'w':
            return '-';
        default:
            return '0';
    }
}

} // anonymous namespace

auto soundex(std::string_view folded) -> std::string {
    std::string out;
    out.reserve(4);

    char last = 0;
    for (char raw : folded) {
        const auto u = static_cast<unsigned char>(raw);
        if (!std::isalpha(u)) continue;
        const char c = static_cast<char>(std::tolower(u));
        const char code = soundex_code(c);

        if (out.empty()) {
            out.push_back(static_cast<char>(std::toupper(u)));
            last = code;
            continue;
        }
        if (code == '-') continue;  // h/w: keep previous code so equal codes still merge
        if (code != '0' && code != last) {
            out.push_back(code);
            if (out.size() == 4) break;
        }
        last = code;
    }

    if (out.empty()) return out;
    while (out.size() < 4) out.push_back('0');
    return out;
}

} // namespace vigil::text
