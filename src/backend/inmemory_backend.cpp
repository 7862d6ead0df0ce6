#include "vigil/backend/inmemory_backend.hpp"

#include <algorithm>
#include <unordered_set>

#include "vigil/text/fold.hpp"
#include "vigil/text/phonetic.hpp"

namespace vigil::backend {

namespace {

// Deadline polling granularity for the vector scan.
constexpr std::size_t kCheckInterval = 64;

auto surface_forms(const WatchlistRecord& r) -> std::vector<std::pair<std::string_view, PatternKind>> {
    std::vector<std::pair<std::string_view, PatternKind>> forms;
    forms.reserve(1 + r.aliases.size());
    forms.emplace_back(r.name, PatternKind::name);
    for (const auto& a : r.aliases) forms.emplace_back(a, PatternKind::alias);
    return forms;
}

auto union_of(const std::unordered_map<std::string, roaring::Roaring>& postings,
              const std::vector<std::string>& keys) -> roaring::Roaring {
    roaring::Roaring acc;
    for (const auto& k : keys) {
        if (auto it = postings.find(k); it != postings.end()) {
            acc |= it->second;
        }
    }
    return acc;
}

auto cancelled_or_expired(const CallOptions& call, const char* component)
    -> std::unexpected<core::error> {
    if (call.stop.stop_requested()) {
        return std::unexpected(core::error{core::error_code::cancelled, "call cancelled", component});
    }
    return std::unexpected(core::error{core::error_code::deadline_exceeded, "deadline passed", component});
}

} // anonymous namespace

auto InMemoryBackend::create(std::vector<WatchlistRecord> records,
                             std::shared_ptr<const text::NgramVectorizer> vectorizer)
    -> std::expected<std::unique_ptr<InMemoryBackend>, core::error> {
    if (records.empty()) {
        return std::unexpected(core::error{
            core::error_code::config_invalid, "watchlist is empty", "backend.inmemory"});
    }

    std::unordered_set<std::string> ids;
    for (const auto& r : records) {
        if (r.id.empty() || !ids.insert(r.id).second) {
            return std::unexpected(core::error{
                core::error_code::config_invalid,
                "record ids must be unique and non-empty: '" + r.id + "'",
                "backend.inmemory"});
        }
    }

    if (!vectorizer) {
        std::vector<std::string> corpus;
        for (const auto& r : records) {
            for (const auto& [form, _] : surface_forms(r)) {
                corpus.push_back(text::join(text::fold_text(form)));
            }
        }
        auto fitted = std::make_shared<text::NgramVectorizer>();
        if (auto r = fitted->fit(corpus); !r) {
            return std::unexpected(r.error());
        }
        vectorizer = std::move(fitted);
    } else if (!vectorizer->is_fitted()) {
        return std::unexpected(core::error{
            core::error_code::config_invalid, "vectorizer is not fitted", "backend.inmemory"});
    }

    std::unique_ptr<InMemoryBackend> backend(new InMemoryBackend());
    backend->records_ = std::move(records);
    backend->vectorizer_ = std::move(vectorizer);
    for (std::uint32_t i = 0; i < backend->records_.size(); ++i) {
        backend->index_record(i);
    }
    for (auto* postings : {&backend->surname_postings_, &backend->initial_postings_,
                           &backend->year_postings_}) {
        for (auto& [_, bm] : *postings) bm.runOptimize();
    }
    return backend;
}

auto InMemoryBackend::index_record(std::uint32_t ordinal) -> void {
    const auto& r = records_[ordinal];

    for (const auto& [form, kind] : surface_forms(r)) {
        auto tokens = text::fold_text(form);
        if (tokens.empty()) continue;

        for (const auto& t : text::drop_stopwords(tokens)) {
            if (auto code = text::soundex(t); !code.empty()) {
                surname_postings_[code].add(ordinal);
            }
            initial_postings_[t.substr(0, 1)].add(ordinal);
        }

        name_index_[text::join(tokens)].emplace_back(ordinal, kind);
        if (tokens.size() > 1) {
            name_index_[text::sorted_join(tokens)].emplace_back(ordinal, kind);
        }

        form_vectors_.push_back(vectorizer_->transform(text::join(tokens)));
        form_owner_.push_back(ordinal);
    }

    for (const auto& id : r.identifiers) {
        if (auto v = text::normalize_identifier(id); !v.empty()) {
            identifier_index_[v].push_back(ordinal);
        }
    }

    if (r.dob) {
        year_postings_[std::to_string(static_cast<int>(r.dob->year()))].add(ordinal);
    }
}

auto InMemoryBackend::export_patterns() const -> std::expected<PatternSet, core::error> {
    PatternSet out;
    out.records = records_;
    for (std::uint32_t ord = 0; ord < records_.size(); ++ord) {
        const auto& r = records_[ord];
        for (const auto& [form, kind] : surface_forms(r)) {
            out.patterns.push_back(ExactPattern{std::string(form), ord, kind});
        }
        for (const auto& id : r.identifiers) {
            out.patterns.push_back(ExactPattern{id, ord, PatternKind::identifier});
        }
    }
    return out;
}

auto InMemoryBackend::exact_lookup(const ExactQuery& query, const CallOptions& call) const
    -> std::expected<std::vector<ExactHit>, core::error> {
    if (call.expired()) return cancelled_or_expired(call, "backend.inmemory.exact");

    std::vector<ExactHit> hits;
    std::unordered_set<std::uint32_t> seen;

    for (const auto& id : query.identifiers) {
        auto it = identifier_index_.find(id);
        if (it == identifier_index_.end()) continue;
        for (auto ord : it->second) {
            if (seen.insert(ord).second) hits.push_back(ExactHit{records_[ord], PatternKind::identifier});
        }
    }

    if (!query.folded_tokens.empty()) {
        for (const auto& key : {text::join(query.folded_tokens), text::sorted_join(query.folded_tokens)}) {
            auto it = name_index_.find(key);
            if (it == name_index_.end()) continue;
            for (const auto& [ord, kind] : it->second) {
                if (seen.insert(ord).second) hits.push_back(ExactHit{records_[ord], kind});
            }
        }
    }
    return hits;
}

auto InMemoryBackend::blocking_search(const BlockingKeys& keys, std::size_t limit,
                                      const CallOptions& call) const
    -> std::expected<std::vector<BlockingHit>, core::error> {
    if (call.expired()) return cancelled_or_expired(call, "backend.inmemory.blocking");
    if (keys.surname.empty() || limit == 0) return std::vector<BlockingHit>{};

    const auto surname = union_of(surname_postings_, keys.surname);
    const auto initial = union_of(initial_postings_, keys.initial);
    const auto year = union_of(year_postings_, keys.birth_year);

    struct Scored {
        std::uint32_t ordinal;
        std::uint8_t kinds;
        int count;
    };
    std::vector<Scored> scored;
    scored.reserve(surname.cardinality());
    for (auto ord : surname) {
        std::uint8_t kinds = static_cast<std::uint8_t>(KeyKind::surname);
        int count = 1;
        if (initial.contains(ord)) { kinds |= static_cast<std::uint8_t>(KeyKind::initial); ++count; }
        if (year.contains(ord)) { kinds |= static_cast<std::uint8_t>(KeyKind::birth_year); ++count; }
        scored.push_back(Scored{ord, kinds, count});
    }

    // Most matched kinds first, then index order; cap at limit.
    std::stable_sort(scored.begin(), scored.end(),
                     [](const Scored& a, const Scored& b) { return a.count > b.count; });
    if (scored.size() > limit) scored.resize(limit);

    if (call.expired()) return cancelled_or_expired(call, "backend.inmemory.blocking");

    std::vector<BlockingHit> hits;
    hits.reserve(scored.size());
    for (const auto& s : scored) {
        hits.push_back(BlockingHit{records_[s.ordinal], s.kinds});
    }
    return hits;
}

auto InMemoryBackend::vector_search(const text::SparseVector& query, std::size_t k,
                                    const CallOptions& call) const
    -> std::expected<VectorSearchResult, core::error> {
    VectorSearchResult result;
    if (query.empty() || k == 0) return result;

    // Best cosine per record.
    std::vector<float> best(records_.size(), 0.0f);
    for (std::size_t i = 0; i < form_vectors_.size(); ++i) {
        if (i % kCheckInterval == 0 && call.expired()) {
            result.truncated = true;
            break;
        }
        const float c = text::NgramVectorizer::cosine(query, form_vectors_[i]);
        auto& slot = best[form_owner_[i]];
        slot = std::max(slot, c);
    }

    std::vector<std::uint32_t> order;
    for (std::uint32_t ord = 0; ord < best.size(); ++ord) {
        if (best[ord] > 0.0f) order.push_back(ord);
    }
    const auto top = std::min(k, order.size());
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(top), order.end(),
                      [&](std::uint32_t a, std::uint32_t b) {
                          if (best[a] != best[b]) return best[a] > best[b];
                          return records_[a].id < records_[b].id;
                      });
    order.resize(top);

    result.hits.reserve(order.size());
    for (auto ord : order) {
        result.hits.push_back(VectorHit{records_[ord], best[ord]});
    }
    return result;
}

} // namespace vigil::backend
