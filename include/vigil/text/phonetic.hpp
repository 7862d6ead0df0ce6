#pragma once

/** \file phonetic.hpp
 *  \brief Phonetic codes used as blocking keys and rerank features.
 */

#include <string>
#include <string_view>

namespace vigil::text {

/** \brief American Soundex of a folded token.
 *
 * \param folded Lowercase ASCII token (see fold())
 * \return Four-character code such as "P361", or empty when the token has no letters
 *
 * Digits are ignored. H and W do not separate equal codes; vowels and Y do.
 */
auto soundex(std::string_view folded) -> std::string;

} // namespace vigil::text
