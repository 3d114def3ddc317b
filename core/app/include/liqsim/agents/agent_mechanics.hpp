#pragma once

#include "liqsim/agents/i_agent_behavior.hpp"
#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/market_variables.hpp"
#include "liqsim/domain/simulation_config.hpp"
#include "liqsim/market/market_state.hpp"

#include <string>

namespace liqsim {

// =============================================================================
// Three-stage agent mechanics
// =============================================================================
//
// Shared orchestration for every agent variant. Each function operates on one
// AgentState and delegates the variant rules to its IAgentBehavior.
//
// Daily order (driven by Simulation):
//
//   resetDaily → computeInitialBuffer → computeProvisionalShock (all agents)
//   → computeStage1 (all agents) → computeReactions + computeStage2
//   → registerActionsToMarket (all agents) → bank absorption
//   → applyStage3 per feedback iteration → snapshot → realizeSales
//
// Every function rejects a negative or NaN derived quantity with
// std::domain_error naming the agent and the quantity.
// =============================================================================

// B0 = max(raw buffer, size * floor fraction, min_buffer). Always > 0.
double computeInitialBuffer(const domain::AgentState& agent,
                            const IAgentBehavior& behavior,
                            const domain::SimulationConfig& config);

// |Σ items Σ vars amount * sensitivity * delta[var]| * MTM scale.
double markToMarketLoss(const domain::AgentState& agent,
                        const IAgentBehavior& behavior,
                        const domain::VariableMap& day_delta);

// Clears today's liquidity, shock, reaction flag and actions. Counters and
// profile run state are left alone, except the hedge-fund refused-today flag.
void resetDaily(domain::AgentState& agent);

// -----------------------------------------------------------------------------
// computeProvisionalShock(agent, behavior, ctx, day_delta)
// -----------------------------------------------------------------------------
// @brief  First pass of Stage 1: everything except network redemptions.
//
// @details
// Fills shock.mark_to_market, shock.margin_calls, shock.own_redemptions and
// shock.provisional_stress = (their sum) / B0. Fund-complexes read the
// provisional stress of their redeemers in computeStage1, so this pass must
// finish for the whole population first.
// -----------------------------------------------------------------------------
void computeProvisionalShock(domain::AgentState& agent,
                             const IAgentBehavior& behavior,
                             const ReactionContext& ctx,
                             const domain::VariableMap& day_delta);

// -----------------------------------------------------------------------------
// computeStage1(agent, behavior, ctx)
// -----------------------------------------------------------------------------
// @brief  Completes Stage 1 from the provisional shock.
//
// @details
//   E1 = MTM + margin + own redemptions + network redemptions
//   B1 = B0 - E1
// Margin calls and redemptions accumulate into the cumulative counters.
// -----------------------------------------------------------------------------
void computeStage1(domain::AgentState& agent, const IAgentBehavior& behavior,
                   const ReactionContext& ctx);

// E1 / B0 > θ * (1 + u). False when B0 is not positive.
bool shouldReact(const domain::AgentState& agent);

// -----------------------------------------------------------------------------
// computeReactions(agent, behavior, ctx)
// -----------------------------------------------------------------------------
// @brief  Runs the variant waterfall when the agent should react.
//
// @details
// For each step in order:
//
//   target = min(allocation, cap, outstanding shortfall)
//
// with shortfall = E1. A step that yields nothing is skipped and the next one
// is tried. The loop stops once the outstanding shortfall reaches zero.
// Whatever is left after the last step stays unmet.
//
// Sets `reacted` and `ever_reacted` and fills `actions`.
// -----------------------------------------------------------------------------
void computeReactions(domain::AgentState& agent, const IAgentBehavior& behavior,
                      const ReactionContext& ctx);

// Fraction of an action's amount that restores liquidity.
double actionEfficiency(const domain::AgentAction& action,
                        const MarketState& market,
                        const domain::SimulationConfig& config);

// True for holdings that trade in the gilt market (gilts, index-linked, basis).
bool isGiltMarketItem(const std::string& item);

// -----------------------------------------------------------------------------
// computeStage2(agent, behavior, ctx)
// -----------------------------------------------------------------------------
// @brief  B2 = B1 + Σ amount * efficiency, sale and repo counters, then the
//         behavior's afterReactions hook. Also sets B3 = B2 so that a day
//         without feedback iterations ends with E2 = 0.
// -----------------------------------------------------------------------------
void computeStage2(domain::AgentState& agent, const IAgentBehavior& behavior,
                   const ReactionContext& ctx);

// Posts today's gilt sales, corporate sales and repo into the market
// accumulators. Equity sales move no modelled market.
void registerActionsToMarket(const domain::AgentState& agent,
                             MarketState& market);

// E2 += e2; B3 = B2 - E2.
void applyStage3(domain::AgentState& agent, double e2);

// Reduces each sold holding by the amount sold, floored at zero.
void realizeSales(domain::AgentState& agent);

}  // namespace liqsim
