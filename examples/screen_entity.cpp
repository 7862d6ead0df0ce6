/**
 * Screening example
 *
 * This example demonstrates:
 * - Building an in-memory watchlist backend
 * - Loading configuration from VIGIL_* environment variables
 * - Screening a few entities and printing the decision trail
 *
 * Usage: screen_entity [name tokens...]
 */

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "vigil/backend/inmemory_backend.hpp"
#include "vigil/config.hpp"
#include "vigil/logging.hpp"
#include "vigil/screening/orchestrator.hpp"

namespace {

auto date(int y, unsigned m, unsigned d) -> vigil::Date {
    return vigil::Date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
}

auto watchlist() -> std::vector<vigil::backend::WatchlistRecord> {
    using vigil::backend::WatchlistRecord;
    std::vector<WatchlistRecord> out;

    WatchlistRecord a;
    a.id = "UA-001";
    a.name = "Ivan Petrov";
    a.aliases = {"Иван Петров"};
    a.identifiers = {"INN:1234567890"};
    a.dob = date(1975, 3, 12);
    a.program = "UA-NSDC";
    out.push_back(a);

    WatchlistRecord b;
    b.id = "UA-002";
    b.name = "Olena Kovalenko";
    b.dob = date(1982, 7, 1);
    b.program = "UA-NSDC";
    out.push_back(b);

    WatchlistRecord c;
    c.id = "UA-003";
    c.name = "OOO Romashka";
    c.entity_type = vigil::EntityType::organization;
    c.aliases = {"ООО Ромашка"};
    c.identifiers = {"EDRPOU:12345678"};
    c.program = "EU-RU";
    out.push_back(c);

    return out;
}

void print(const std::string& label, const vigil::ScreeningResult& r) {
    std::cout << label << "\n"
              << "  risk: " << vigil::to_string(r.decision.risk_level)
              << " (" << r.decision.risk_score << ")"
              << (r.decision.review_required ? " review" : "") << "\n";
    if (!r.candidates.empty()) {
        const auto& top = r.candidates.front();
        std::cout << "  top:  " << top.id << " " << top.matched_text
                  << " via " << vigil::to_string(top.source_tier)
                  << " conf " << top.confidence << "\n";
    }
    std::cout << "  why: ";
    for (const auto& reason : r.decision.decision_reasons) std::cout << " " << reason;
    std::cout << "\n  took " << r.elapsed.count() << " us" << (r.cache_hit ? " (cached)" : "") << "\n";
}

} // namespace

int main(int argc, char** argv) {
    using namespace vigil;

    init_logging();

    auto cfg = config_from_env();
    if (!cfg) {
        spdlog::error("invalid configuration: {}", cfg.error().message);
        return 1;
    }

    auto created = backend::InMemoryBackend::create(watchlist());
    if (!created) {
        spdlog::error("watchlist: {}", created.error().message);
        return 1;
    }
    std::shared_ptr<backend::InMemoryBackend> backend(std::move(*created));

    auto pool = std::make_shared<core::TaskPool>(2);
    auto tiers = screening::make_tier_set(backend, backend->vectorizer(), pool);
    if (!tiers) {
        spdlog::error("pipeline: {}", tiers.error().message);
        return 1;
    }
    auto cache = std::make_shared<cache::ShardedResultCache>(cfg->cache.max_entries, cfg->cache.num_shards);
    screening::ScreeningOrchestrator screener(*cfg, *tiers, cache, pool);

    std::vector<NormalizedEntity> inputs;
    if (argc > 1) {
        NormalizedEntity e;
        for (int i = 1; i < argc; ++i) e.tokens.emplace_back(argv[i]);
        e.signals.smartfilter_confidence = 0.7f;
        e.signals.person_confidence = 0.7f;
        e.signals.entity_type = EntityType::person;
        inputs.push_back(std::move(e));
    } else {
        NormalizedEntity exact;
        exact.tokens = {"Ivan", "Petrov"};
        exact.identifiers = {"INN:1234567890"};
        exact.signals = {true, 0.6f, 0.7f, 0.0f, EntityType::person};
        inputs.push_back(exact);

        NormalizedEntity fuzzy;
        fuzzy.tokens = {"Olena", "Kovalenkova"};
        fuzzy.signals = {true, 0.6f, 0.65f, 0.0f, EntityType::person};
        inputs.push_back(fuzzy);

        NormalizedEntity org;
        org.tokens = {"ООО", "Ромашка"};
        org.signals = {true, 0.8f, 0.0f, 0.9f, EntityType::organization};
        inputs.push_back(org);

        inputs.push_back(exact);
    }

    for (const auto& e : inputs) {
        std::string label;
        for (const auto& t : e.tokens) label += (label.empty() ? "" : " ") + t;
        auto r = screener.screen(e);
        if (!r) {
            spdlog::error("screening '{}' failed: {}", label, r.error().message);
            continue;
        }
        print(label, *r);
    }

    const auto stats = screener.get_stats();
    std::cout << "\nrequests " << stats.total_requests << ", cache hits " << stats.cache_hits
              << ", escalations " << stats.escalations << "\n";
    return 0;
}
