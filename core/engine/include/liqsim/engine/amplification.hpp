#pragma once

#include "liqsim/domain/agent_state.hpp"
#include "liqsim/engine/run_result.hpp"
#include "liqsim/market/market_state.hpp"

#include <vector>

namespace liqsim {

// -----------------------------------------------------------------------------
// accumulateLosses(agents, totals)
// -----------------------------------------------------------------------------
// Adds today's direct loss (E1) and total loss (E1 + E2) of every agent to
// its running horizon sums. The agent's own Stage 2 mitigation is netted out
// of the total, so the ratio isolates second-round effects:
//
//   direct = B0 - B1                 = E1
//   total  = (B0 - B3) + (B2 - B1)   = E1 + E2
//
// `totals` must have one entry per agent.
// -----------------------------------------------------------------------------
void accumulateLosses(const domain::Population& agents,
                      std::vector<LossTotals>& totals);

// -----------------------------------------------------------------------------
// computeAmplification(agents, totals, epsilon)
// -----------------------------------------------------------------------------
// ratio = max(total, eps) / max(direct, eps) per agent; per type and
// system-wide the floored per-agent sums are added first. Exactly 1.0 at
// every level when no second-round loss occurred.
//
// Throws std::invalid_argument when totals.size() != agents.size() or
// epsilon <= 0.
// -----------------------------------------------------------------------------
AmplificationReport computeAmplification(const domain::Population& agents,
                                         const std::vector<LossTotals>& totals,
                                         double epsilon);

// Cumulative counters and flags of the final population, plus the final
// market levels.
RunSummary summarizeRun(const domain::Population& agents,
                        const MarketState& market);

}  // namespace liqsim
