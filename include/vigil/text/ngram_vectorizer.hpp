#pragma once

/** \file ngram_vectorizer.hpp
 *  \brief Character and word n-gram TF-IDF vectors for name similarity.
 *
 * Names are represented as the concatenation of two L2-normalized blocks:
 * character n-grams taken inside word boundaries (" ivan " -> " iv", "iva", ...)
 * and word n-grams. Each block is scaled by its weight and the whole vector is
 * renormalized, so the dot product of two vectors is their cosine similarity
 * in [0, 1] (all weights are non-negative).
 *
 * Thread-safety: fit() is single-threaded; transform() and cosine() are
 * thread-safe on a fitted vectorizer.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vigil/error.hpp"

namespace vigil::text {

/** \brief Sparse vector with sorted term ids. */
struct SparseVector {
    std::vector<std::uint32_t> indices;  /**< Term IDs (sorted) */
    std::vector<float> values;           /**< TF-IDF weights */

    /** \brief Get number of non-zero elements. */
    auto nnz() const noexcept -> std::size_t { return indices.size(); }

    /** \brief Check if vector is empty. */
    auto empty() const noexcept -> bool { return indices.empty(); }

    /** \brief Compute dot product with another sparse vector. */
    auto dot(const SparseVector& other) const noexcept -> float;

    /** \brief L2 normalize the vector in-place. */
    auto normalize() -> void;
};

/** \brief Vectorizer parameters. */
struct NgramParams {
    std::uint32_t char_min{3};     /**< shortest character n-gram */
    std::uint32_t char_max{5};     /**< longest character n-gram */
    std::uint32_t word_min{1};     /**< shortest word n-gram */
    std::uint32_t word_max{2};     /**< longest word n-gram */
    float char_weight{0.4f};       /**< weight of the character block */
    float word_weight{0.3f};       /**< weight of the word block */
    bool sublinear_tf{true};       /**< use 1 + ln(tf) */
};

class NgramVectorizer {
public:
    explicit NgramVectorizer(NgramParams params = {});

    /** \brief Learn vocabulary and IDF from folded documents.
     *
     * \param documents Folded, space-separated names
     * \return Success or config_invalid on bad parameters / empty corpus
     *
     * Complexity: O(total characters * (char_max - char_min + 1))
     */
    auto fit(const std::vector<std::string>& documents) -> std::expected<void, core::error>;

    /** \brief Vectorize folded text; terms unseen during fit are ignored. */
    auto transform(std::string_view folded) const -> SparseVector;

    /** \brief Cosine similarity of two vectors produced by transform(). */
    static auto cosine(const SparseVector& a, const SparseVector& b) noexcept -> float;

    [[nodiscard]] auto is_fitted() const noexcept -> bool { return fitted_; }
    [[nodiscard]] auto vocabulary_size() const noexcept -> std::size_t { return vocab_.size(); }
    [[nodiscard]] auto params() const noexcept -> const NgramParams& { return params_; }

    /** \brief Character n-grams ("c:" prefixed) followed by word n-grams ("w:" prefixed). */
    auto extract_terms(std::string_view folded) const -> std::vector<std::string>;

private:
    auto block(const std::vector<std::string>& terms, char prefix) const -> SparseVector;

    NgramParams params_;
    std::unordered_map<std::string, std::uint32_t> vocab_;
    std::vector<float> idf_;
    bool fitted_{false};
};

} // namespace vigil::text
