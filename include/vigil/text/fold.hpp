#pragma once

/** \file fold.hpp
 *  \brief Case folding and script unification for matching keys.
 *
 * Folding maps a UTF-8 token to lowercase ASCII: Latin letters are lowercased,
 * Latin-1 and Latin Extended-A diacritics are stripped, Russian and Ukrainian
 * Cyrillic and Greek are transliterated, digits are kept and everything else
 * is dropped. All tiers key
 * on folded text so that "Петров", "PETROV" and "Petróv" meet in one bucket.
 */

#include <string>
#include <string_view>
#include <vector>

namespace vigil::text {

/** \brief True when every byte is below 0x80. */
auto is_ascii(std::string_view s) noexcept -> bool;

/** \brief Fold one token.
 *
 * \param token UTF-8 token
 * \param ascii_fastpath When set and the token is pure ASCII, skip UTF-8 decoding
 * \return Folded token; may be empty when the token had no letters or digits
 */
auto fold(std::string_view token, bool ascii_fastpath = false) -> std::string;

/** \brief Fold every token, dropping the ones that fold to nothing. */
auto fold_tokens(const std::vector<std::string>& tokens, bool ascii_fastpath = false)
    -> std::vector<std::string>;

/** \brief Split on whitespace and fold each piece. */
auto fold_text(std::string_view text, bool ascii_fastpath = false) -> std::vector<std::string>;

auto join(const std::vector<std::string>& tokens, std::string_view sep = " ") -> std::string;

/** \brief Tokens sorted lexicographically, then joined; order-insensitive key. */
auto sorted_join(std::vector<std::string> tokens, std::string_view sep = " ") -> std::string;

/** \brief Legal forms and connective words ignored under strict stopwords. */
auto is_stopword(std::string_view folded) noexcept -> bool;

/** \brief Remove stopwords from folded tokens. Never returns an empty list when
 *  the input was non-empty: if every token is a stopword the input is kept. */
auto drop_stopwords(const std::vector<std::string>& folded) -> std::vector<std::string>;

/** \brief Identifier value for matching: the part after "TYPE:", uppercase, alphanumerics only.
 *
 * "INN:1234567890" -> "1234567890", "passport: ab 123-456" -> "AB123456".
 */
auto normalize_identifier(std::string_view raw) -> std::string;

} // namespace vigil::text
