#include "vigil/text/similarity.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

namespace vigil::text {

auto levenshtein(std::string_view a, std::string_view b) -> std::size_t {
    if (a.size() < b.size()) std::swap(a, b);
    if (b.empty()) return a.size();

    std::vector<std::size_t> prev(b.size() + 1);
    std::vector<std::size_t> curr(b.size() + 1);
    std::iota(prev.begin(), prev.end(), std::size_t{0});

    for (std::size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            const std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

auto edit_similarity(std::string_view a, std::string_view b) -> float {
    const std::size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0f;
    const auto d = levenshtein(a, b);
    return 1.0f - static_cast<float>(d) / static_cast<float>(longest);
}

namespace {

auto jaro(std::string_view a, std::string_view b) -> double {
    if (a.empty() && b.empty()) return 1.0;
    if (a.empty() || b.empty()) return 0.0;
    if (a == b) return 1.0;

    const std::size_t window = std::max<std::size_t>(std::max(a.size(), b.size()) / 2, 2) - 1;
    std::vector<bool> a_hit(a.size(), false);
    std::vector<bool> b_hit(b.size(), false);

    std::size_t matches = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const std::size_t lo = i > window ? i - window : 0;
        const std::size_t hi = std::min(i + window + 1, b.size());
        for (std::size_t j = lo; j < hi; ++j) {
            if (b_hit[j] || a[i] != b[j]) continue;
            a_hit[i] = true;
            b_hit[j] = true;
            ++matches;
            break;
        }
    }
    if (matches == 0) return 0.0;

    std::size_t transpositions = 0;
    std::size_t k = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!a_hit[i]) continue;
        while (!b_hit[k]) ++k;
        if (a[i] != b[k]) ++transpositions;
        ++k;
    }

    const auto m = static_cast<double>(matches);
    return (m / static_cast<double>(a.size()) +
            m / static_cast<double>(b.size()) +
            (m - static_cast<double>(transpositions / 2)) / m) / 3.0;
}

} // anonymous namespace

auto jaro_winkler(std::string_view a, std::string_view b) -> float {
    const double j = jaro(a, b);
    std::size_t prefix = 0;
    const std::size_t max_prefix = std::min({a.size(), b.size(), std::size_t{4}});
    while (prefix < max_prefix && a[prefix] == b[prefix]) ++prefix;
    return static_cast<float>(j + static_cast<double>(prefix) * 0.1 * (1.0 - j));
}

} // namespace vigil::text
