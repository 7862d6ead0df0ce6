#include "vigil/tier/aho_corasick.hpp"

#include <algorithm>
#include <deque>

namespace vigil::tier {

AhoCorasick::AhoCorasick() {
    nodes_.emplace_back();
}

auto AhoCorasick::child(std::uint32_t state, unsigned char c) const noexcept -> std::uint32_t {
    const auto& next = nodes_[state].next;
    if (compiled_) {
        auto it = std::lower_bound(next.begin(), next.end(), c,
                                   [](const auto& e, unsigned char v) { return e.first < v; });
        return (it != next.end() && it->first == c) ? it->second : kNone;
    }
    for (const auto& [byte, target] : next) {
        if (byte == c) return target;
    }
    return kNone;
}

auto AhoCorasick::add(std::string_view pattern, std::uint32_t value) -> void {
    if (pattern.empty() || compiled_) return;

    std::uint32_t state = 0;
    for (char ch : pattern) {
        const auto c = static_cast<unsigned char>(ch);
        auto next = child(state, c);
        if (next == kNone) {
            next = static_cast<std::uint32_t>(nodes_.size());
            nodes_.emplace_back();
            nodes_[state].next.emplace_back(c, next);
        }
        state = next;
    }
    nodes_[state].out.emplace_back(value, static_cast<std::uint32_t>(pattern.size()));
    ++patterns_;
}

auto AhoCorasick::compile() -> void {
    if (compiled_) return;
    for (auto& n : nodes_) {
        std::sort(n.next.begin(), n.next.end());
    }
    compiled_ = true;

    std::deque<std::uint32_t> queue;
    for (const auto& [_, v] : nodes_[0].next) {
        nodes_[v].fail = 0;
        queue.push_back(v);
    }

    while (!queue.empty()) {
        const auto u = queue.front();
        queue.pop_front();

        for (const auto& [c, v] : nodes_[u].next) {
            auto f = nodes_[u].fail;
            while (f != 0 && child(f, c) == kNone) {
                f = nodes_[f].fail;
            }
            const auto target = child(f, c);
            nodes_[v].fail = (target != kNone && target != v) ? target : 0;

            const auto& fail_node = nodes_[nodes_[v].fail];
            nodes_[v].output_link = !fail_node.out.empty() ? nodes_[v].fail : fail_node.output_link;
            queue.push_back(v);
        }
    }
}

auto AhoCorasick::find_all(std::string_view text) const -> std::vector<Match> {
    std::vector<Match> matches;
    if (!compiled_ || patterns_ == 0) return matches;

    std::uint32_t state = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        while (state != 0 && child(state, c) == kNone) {
            state = nodes_[state].fail;
        }
        if (auto next = child(state, c); next != kNone) {
            state = next;
        }

        for (auto s = state; s != kNone; s = nodes_[s].output_link) {
            for (const auto& [value, len] : nodes_[s].out) {
                matches.push_back(Match{i + 1 - len, i + 1, value});
            }
        }
    }
    return matches;
}

} // namespace vigil::tier
