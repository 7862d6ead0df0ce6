#include "vigil/tier/exact_matcher.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <unordered_map>

#include "vigil/text/fold.hpp"

namespace vigil::tier {

namespace {

enum class SegmentKind { name, identifier };

struct Segment {
    std::size_t begin;
    std::size_t end;
    SegmentKind kind;
};

// Segments never contain '\n': folded names are [a-z0-9 ] and identifiers [A-Z0-9].
constexpr char kSeparator = '\n';

auto name_variants(const std::vector<std::string>& folded) -> std::set<std::string> {
    std::set<std::string> out;
    if (folded.empty()) return out;
    out.insert(text::join(folded));
    out.insert(text::sorted_join(folded));
    const auto core = text::drop_stopwords(folded);
    out.insert(text::join(core));
    out.insert(text::sorted_join(core));
    return out;
}

auto field_for(backend::PatternKind kind) -> MatchedField {
    switch (kind) {
        case backend::PatternKind::alias: return MatchedField::alias;
        case backend::PatternKind::identifier: return MatchedField::identifier;
        case backend::PatternKind::name: break;
    }
    return MatchedField::name;
}

} // anonymous namespace

ExactMatcher::ExactMatcher(std::shared_ptr<const backend::WatchlistBackend> backend)
    : backend_(std::move(backend)) {}

auto ExactMatcher::create(std::shared_ptr<const backend::WatchlistBackend> backend)
    -> std::expected<std::shared_ptr<ExactMatcher>, core::error> {
    if (!backend) {
        return std::unexpected(core::error{
            core::error_code::config_invalid, "exact matcher requires a backend", "tier.exact"});
    }
    auto patterns = backend->export_patterns();
    if (!patterns) {
        return std::unexpected(patterns.error());
    }
    auto matcher = std::make_shared<ExactMatcher>(std::move(backend));
    matcher->compile(std::move(*patterns));
    return matcher;
}

auto ExactMatcher::compile(backend::PatternSet patterns) -> void {
    records_ = std::move(patterns.records);
    entries_.clear();
    automaton_ = AhoCorasick{};

    for (const auto& p : patterns.patterns) {
        if (p.record >= records_.size()) continue;
        const auto value = static_cast<std::uint32_t>(entries_.size());
        entries_.push_back(Entry{p.record, p.kind});

        if (p.kind == backend::PatternKind::identifier) {
            automaton_.add(text::normalize_identifier(p.text), value);
            continue;
        }
        for (const auto& v : name_variants(text::fold_text(p.text))) {
            automaton_.add(v, value);
        }
    }
    automaton_.compile();
}

auto ExactMatcher::scan(const PreparedQuery& query) const -> std::vector<Candidate> {
    std::string haystack;
    std::vector<Segment> segments;
    auto push = [&](const std::string& s, SegmentKind kind) {
        if (s.empty()) return;
        if (!haystack.empty()) haystack.push_back(kSeparator);
        segments.push_back(Segment{haystack.size(), haystack.size() + s.size(), kind});
        haystack.append(s);
    };

    const auto name = text::join(query.keyed);
    const auto sorted = text::sorted_join(query.keyed);
    push(name, SegmentKind::name);
    if (sorted != name) push(sorted, SegmentKind::name);
    for (const auto& id : query.identifiers) push(id, SegmentKind::identifier);

    std::unordered_map<std::uint32_t, std::size_t> by_record;
    std::vector<Candidate> out;

    for (const auto& m : automaton_.find_all(haystack)) {
        const auto& entry = entries_[m.value];
        const bool is_id = entry.kind == backend::PatternKind::identifier;
        const bool whole = std::any_of(segments.begin(), segments.end(), [&](const Segment& s) {
            return s.begin == m.begin && s.end == m.end &&
                   (s.kind == SegmentKind::identifier) == is_id;
        });
        if (!whole) continue;

        auto [it, inserted] = by_record.try_emplace(entry.record, out.size());
        if (inserted) {
            out.push_back(make_candidate(records_[entry.record], TierKind::exact, 1.0f, 1.0f));
        }
        out[it->second].matched_fields.set(field_for(entry.kind));
    }
    return out;
}

auto ExactMatcher::fallback(const TierInput& input, TierResult& result) const -> void {
    if (!backend_) return;
    const auto call = input.context.call_options(input.config.exact.timeout);
    auto hits = backend_->exact_lookup(
        backend::ExactQuery{input.query.keyed, input.query.identifiers}, call);
    if (!hits) {
        result.error = tier_error(hits.error(), "tier.exact");
        return;
    }
    for (const auto& h : *hits) {
        auto c = make_candidate(h.record, TierKind::exact, 1.0f, 1.0f);
        c.matched_fields.set(field_for(h.kind));
        result.candidates.push_back(std::move(c));
    }
}

auto ExactMatcher::run(const TierInput& input) -> TierResult {
    const auto start = Clock::now();
    TierResult result;

    if (automaton_.empty()) {
        fallback(input, result);
    } else {
        result.candidates = scan(input.query);
    }

    for (const auto& c : result.candidates) {
        result.best_confidence = std::max(result.best_confidence, c.confidence);
    }
    result.escalate = result.candidates.empty();
    result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
    return result;
}

} // namespace vigil::tier
