#pragma once

/** \file similarity.hpp
 *  \brief String similarity measures over folded text.
 */

#include <cstddef>
#include <string_view>

namespace vigil::text {

/** \brief Levenshtein distance (unit costs), byte-wise. O(|a|*|b|) time, O(|b|) space. */
auto levenshtein(std::string_view a, std::string_view b) -> std::size_t;

/** \brief 1 - distance / max(|a|, |b|); 1.0 for two empty strings. */
auto edit_similarity(std::string_view a, std::string_view b) -> float;

/** \brief Jaro similarity with the Winkler common-prefix boost (prefix up to 4, scale 0.1). */
auto jaro_winkler(std::string_view a, std::string_view b) -> float;

} // namespace vigil::text
