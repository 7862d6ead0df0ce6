#pragma once

/** \file decision_engine.hpp
 *  \brief Weighted fusion of upstream signals and match evidence into a risk decision.
 *
 * decide() is pure: no I/O, no clock, no shared state. Identical evidence and
 * configuration always produce an identical Decision, reasons included.
 */

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "vigil/config.hpp"
#include "vigil/error.hpp"
#include "vigil/types.hpp"

namespace vigil::decision {

/** \brief Everything the engine looks at. */
struct DecisionEvidence {
    UpstreamSignals signals;
    float similarity_top{0.0f};              /**< best calibrated candidate confidence */
    bool id_match{false};                    /**< best candidate matched an input identifier */
    bool dob_match{false};                   /**< best candidate matched the input DOB */
    bool identifiers_supplied{false};        /**< the input carried at least one identifier */
    bool dob_supplied{false};                /**< the input carried a DOB */
    std::optional<TierKind> decisive_tier;   /**< tier that produced the best candidate */
    std::vector<std::string> degradations;   /**< e.g. "backend_unavailable:vector", "cache_error" */
};

class DecisionEngine {
public:
    explicit DecisionEngine(DecisionConfig config = {});

    /** \brief Classify \p evidence.
     *
     * \return Decision, or internal when the configuration or the evidence is
     *         out of range (NaN, outside [0,1]); values are never clamped silently
     */
    [[nodiscard]] auto decide(const DecisionEvidence& evidence) const -> std::expected<Decision, core::error>;

    [[nodiscard]] auto config() const noexcept -> const DecisionConfig& { return config_; }

private:
    DecisionConfig config_;
};

} // namespace vigil::decision
