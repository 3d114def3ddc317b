#pragma once

#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/simulation_config.hpp"
#include "liqsim/market/market_state.hpp"
#include "liqsim/network/relationship_network.hpp"

namespace liqsim {

// Per-layer E2 contribution for one agent in one iteration.
struct FeedbackTerms {
  double bilateral{0.0};
  double broadcast{0.0};
  double reputation{0.0};
  double crowding{0.0};

  double total() const { return bilateral + broadcast + reputation + crowding; }
};

// -----------------------------------------------------------------------------
// FeedbackEngine: Stage 3 second-round losses
// -----------------------------------------------------------------------------
//
// @brief  Converts the day's reactions into additional losses E2 for every
//         agent, through the network and through the market.
//
// @details
// One iteration, with s = max(1, vix / base_vix) and R = agents that reacted
// today (an iteration adds nothing when R is empty):
//
//   1. Bilateral, routed over the relationship network only:
//        hedge fund    Σ over connected banks in R:
//                        repo borrowing * (Σ bank actions / max(bank B0, 1))
//                        * s * hf_funding_stress_coeff
//        bank          Σ over prime-brokerage hedge funds in R:
//                        (HF E1 / max(HF B0, 1)) * (HF repo borrowing / HF
//                        bank count) * bank_counterparty_loss_coeff * s
//        fund-complex  Σ over redeemers in R:
//                        Σ redeemer actions * redemption_pressure_coeff
//
//   2. Broadcast, paid by every agent:
//        Σ liquid items Σ sensitivities amount * |sens| * 1e-4 * s
//        * broadcast_coeff * |R| / N
//
//   3. Reputation, reacting agents only:
//        Σ own actions * (sqrt(s) - 1) * reputation_coeff
//
//   4. Crowding, reacting agents only:
//        Σ own actions * (same-type fraction in R)^2 * s * crowding_coeff
//
// run() applies `iterations` of these, each preceded by
// MarketState::applyEndogenousFeedback(), so E2 accumulates across
// iterations. Zero iterations leave E2 = 0 and B3 = B2.
//
// Only E2 and B3 change during Stage 3, and no term reads another agent's E2,
// so the order agents are visited in does not matter.
//
// Ownership:
//   Holds a copy of the feedback and market parameters. Does not own the
//   population, the market or the network.
// -----------------------------------------------------------------------------
class FeedbackEngine {
 public:
  explicit FeedbackEngine(const domain::SimulationConfig& config);

  // ---------------------------------------------------------------------------
  // run(agents, market, network)
  // ---------------------------------------------------------------------------
  // @brief  Runs the configured number of iterations.
  //
  // @return Total E2 added across all agents and iterations.
  // ---------------------------------------------------------------------------
  double run(domain::Population& agents, MarketState& market,
             const RelationshipNetwork& network) const;

  // One iteration without touching the market. Returns the E2 added.
  double iterate(domain::Population& agents, const MarketState& market,
                 const RelationshipNetwork& network) const;

  // Terms one agent would receive from one iteration; does not mutate.
  FeedbackTerms termsFor(const domain::AgentState& agent,
                         const domain::Population& agents,
                         const MarketState& market,
                         const RelationshipNetwork& network) const;

 private:
  double bilateral(const domain::AgentState& agent,
                   const domain::Population& agents,
                   const RelationshipNetwork& network, double s) const;

  domain::SimulationConfig::FeedbackParams params_;
  double base_vix_;
};

}  // namespace liqsim
