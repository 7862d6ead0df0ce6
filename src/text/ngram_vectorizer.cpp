#include "vigil/text/ngram_vectorizer.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace vigil::text {

auto SparseVector::dot(const SparseVector& other) const noexcept -> float {
    float result = 0.0f;
    std::size_t i = 0, j = 0;

    while (i < indices.size() && j < other.indices.size()) {
        if (indices[i] < other.indices[j]) {
            ++i;
        } else if (indices[i] > other.indices[j]) {
            ++j;
        } else {
            result += values[i] * other.values[j];
            ++i;
            ++j;
        }
    }

    return result;
}

auto SparseVector::normalize() -> void {
    float norm = 0.0f;
    for (float val : values) {
        norm += val * val;
    }

    if (norm > 0.0f) {
        norm = std::sqrt(norm);
        for (float& val : values) {
            val /= norm;
        }
    }
}

namespace {

auto split_words(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> words;
    std::size_t start = 0;
    while (start < text.size()) {
        while (start < text.size() && text[start] == ' ') ++start;
        std::size_t end = start;
        while (end < text.size() && text[end] != ' ') ++end;
        if (end > start) words.push_back(text.substr(start, end - start));
        start = end;
    }
    return words;
}

} // anonymous namespace

NgramVectorizer::NgramVectorizer(NgramParams params)
    : params_(params) {}

auto NgramVectorizer::extract_terms(std::string_view folded) const -> std::vector<std::string> {
    std::vector<std::string> terms;
    const auto words = split_words(folded);

    // char_wb: n-grams never cross a word boundary; each word is padded with one space.
    for (const auto w : words) {
        std::string padded;
        padded.reserve(w.size() + 2);
        padded.push_back(' ');
        padded.append(w);
        padded.push_back(' ');
        for (std::uint32_t n = params_.char_min; n <= params_.char_max; ++n) {
            if (padded.size() < n) break;
            for (std::size_t i = 0; i + n <= padded.size(); ++i) {
                terms.push_back("c:" + padded.substr(i, n));
            }
        }
    }

    for (std::uint32_t n = params_.word_min; n <= params_.word_max; ++n) {
        if (words.size() < n) break;
        for (std::size_t i = 0; i + n <= words.size(); ++i) {
            std::string gram = "w:";
            for (std::size_t k = 0; k < n; ++k) {
                if (k > 0) gram.push_back(' ');
                gram.append(words[i + k]);
            }
            terms.push_back(std::move(gram));
        }
    }
    return terms;
}

auto NgramVectorizer::fit(const std::vector<std::string>& documents)
    -> std::expected<void, core::error> {
    if (params_.char_min == 0 || params_.char_min > params_.char_max ||
        params_.word_min == 0 || params_.word_min > params_.word_max) {
        return std::unexpected(core::error{
            core::error_code::config_invalid,
            "n-gram ranges must be non-empty and start at 1 or more",
            "text.ngram"});
    }
    if (!(params_.char_weight >= 0.0f) || !(params_.word_weight >= 0.0f) ||
        params_.char_weight + params_.word_weight <= 0.0f) {
        return std::unexpected(core::error{
            core::error_code::config_invalid,
            "block weights must be non-negative and not both zero",
            "text.ngram"});
    }
    if (documents.empty()) {
        return std::unexpected(core::error{
            core::error_code::config_invalid,
            "cannot fit on an empty corpus",
            "text.ngram"});
    }

    std::unordered_map<std::string, std::uint32_t> df;
    for (const auto& doc : documents) {
        auto terms = extract_terms(doc);
        std::unordered_set<std::string> seen(terms.begin(), terms.end());
        for (const auto& t : seen) {
            ++df[t];
        }
    }

    // Term ids follow lexicographic order so that ids are stable across runs.
    std::vector<std::string> keys;
    keys.reserve(df.size());
    for (const auto& [term, _] : df) keys.push_back(term);
    std::sort(keys.begin(), keys.end());

    vocab_.clear();
    idf_.assign(keys.size(), 0.0f);
    const auto n_docs = static_cast<float>(documents.size());
    for (std::uint32_t id = 0; id < keys.size(); ++id) {
        const auto d = static_cast<float>(df[keys[id]]);
        idf_[id] = std::log((1.0f + n_docs) / (1.0f + d)) + 1.0f;
        vocab_.emplace(std::move(keys[id]), id);
    }
    fitted_ = true;
    return {};
}

auto NgramVectorizer::block(const std::vector<std::string>& terms, char prefix) const
    -> SparseVector {
    std::unordered_map<std::uint32_t, std::uint32_t> counts;
    for (const auto& t : terms) {
        if (t.empty() || t[0] != prefix) continue;
        auto it = vocab_.find(t);
        if (it == vocab_.end()) continue;
        ++counts[it->second];
    }

    SparseVector vec;
    vec.indices.reserve(counts.size());
    for (const auto& [id, _] : counts) vec.indices.push_back(id);
    std::sort(vec.indices.begin(), vec.indices.end());

    vec.values.reserve(vec.indices.size());
    for (auto id : vec.indices) {
        const auto tf = static_cast<float>(counts[id]);
        const float w = params_.sublinear_tf ? 1.0f + std::log(tf) : tf;
        vec.values.push_back(w * idf_[id]);
    }
    vec.normalize();
    return vec;
}

auto NgramVectorizer::transform(std::string_view folded) const -> SparseVector {
    SparseVector out;
    if (!fitted_) return out;

    const auto terms = extract_terms(folded);
    auto chars = block(terms, 'c');
    auto words = block(terms, 'w');

    std::vector<std::pair<std::uint32_t, float>> merged;
    merged.reserve(chars.nnz() + words.nnz());
    for (std::size_t i = 0; i < chars.nnz(); ++i) {
        merged.emplace_back(chars.indices[i], chars.values[i] * params_.char_weight);
    }
    for (std::size_t i = 0; i < words.nnz(); ++i) {
        merged.emplace_back(words.indices[i], words.values[i] * params_.word_weight);
    }
    std::sort(merged.begin(), merged.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    out.indices.reserve(merged.size());
    out.values.reserve(merged.size());
    for (const auto& [id, v] : merged) {
        if (v <= 0.0f) continue;
        out.indices.push_back(id);
        out.values.push_back(v);
    }
    out.normalize();
    return out;
}

auto NgramVectorizer::cosine(const SparseVector& a, const SparseVector& b) noexcept -> float {
    if (a.empty() || b.empty()) return 0.0f;
    return std::clamp(a.dot(b), 0.0f, 1.0f);
}

} // namespace vigil::text
