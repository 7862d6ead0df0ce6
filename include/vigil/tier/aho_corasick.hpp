#pragma once

/** \file aho_corasick.hpp
 *  \brief Multi-pattern byte automaton.
 *
 * Build with add() then compile(); afterwards the automaton is immutable and
 * find_all() may be called concurrently. Matching is O(|text| + matches),
 * independent of the number of patterns.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::tier {

class AhoCorasick {
public:
    struct Match {
        std::size_t begin{0};      /**< offset of the first byte */
        std::size_t end{0};        /**< one past the last byte */
        std::uint32_t value{0};    /**< value passed to add() */
    };

    AhoCorasick();

    /** \brief Register a pattern. Empty patterns are ignored. Invalid after compile(). */
    auto add(std::string_view pattern, std::uint32_t value) -> void;

    /** \brief Build failure and output links. */
    auto compile() -> void;

    /** \brief All pattern occurrences, ordered by end offset. */
    [[nodiscard]] auto find_all(std::string_view text) const -> std::vector<Match>;

    [[nodiscard]] auto pattern_count() const noexcept -> std::size_t { return patterns_; }
    [[nodiscard]] auto node_count() const noexcept -> std::size_t { return nodes_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return patterns_ == 0; }
    [[nodiscard]] auto compiled() const noexcept -> bool { return compiled_; }

private:
    static constexpr std::uint32_t kNone = 0xFFFFFFFFu;

    struct Node {
        std::vector<std::pair<unsigned char, std::uint32_t>> next;   /**< sorted by byte after compile */
        std::uint32_t fail{0};
        std::uint32_t output_link{kNone};                           /**< nearest suffix state with outputs */
        std::vector<std::pair<std::uint32_t, std::uint32_t>> out;   /**< (value, pattern length) */
    };

    auto child(std::uint32_t state, unsigned char c) const noexcept -> std::uint32_t;

    std::vector<Node> nodes_;
    std::size_t patterns_{0};
    bool compiled_{false};
};

} // namespace vigil::tier
