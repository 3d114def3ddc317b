#pragma once

#include "liqsim/agents/i_agent_behavior.hpp"
#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/simulation_config.hpp"
#include "liqsim/network/relationship_network.hpp"

#include <cstddef>

namespace liqsim {

struct RepoOutcome {
  double asked{0.0};
  double granted{0.0};
  std::size_t banks_contacted{0};
  bool refused_by_all{false};  // asked > 0, banks contacted, nothing granted
};

// -----------------------------------------------------------------------------
// assessRepoRequest(bank, requester, amount, network, config)
// -----------------------------------------------------------------------------
// @brief  Amount of new repo `bank` is willing to extend to `requester`.
//
// @details
//   0 if the two are not connected over the requester's bank edge kind.
//   Otherwise min(amount, repo_capacity * willingness_new * risk_appetite *
//   stress_scaling), with
//     stress_scaling = max(0, 1 - (E1/B0) / repo_refusal_stress_threshold)
//
// Reads the bank's Stage 1 stress and its willingness as of the start of the
// day, so the answer does not depend on the order agents react in.
// -----------------------------------------------------------------------------
double assessRepoRequest(const domain::AgentState& bank,
                         const domain::AgentState& requester, double amount,
                         const RelationshipNetwork& network,
                         const domain::SimulationConfig& config);

// -----------------------------------------------------------------------------
// seekRepo(requester, ask, ctx)
// -----------------------------------------------------------------------------
// @brief  Splits `ask` evenly across the requester's connected banks and sums
//         what each grants. A requester with no connected bank gets nothing.
// -----------------------------------------------------------------------------
RepoOutcome seekRepo(const domain::AgentState& requester, double ask,
                     const ReactionContext& ctx);

// -----------------------------------------------------------------------------
// tightenRepoWillingness(bank, config)
// -----------------------------------------------------------------------------
// @brief  Degrades a reacting bank's willingness to extend new repo and to
//         roll existing repo, permanently.
//
// @details
//   cut = (1 - risk_appetite) * tightening_rate
//   willingness_new  = max(0, willingness_new - cut)
//   willingness_roll = max(roll_floor, willingness_roll - cut / 2)
//
// Applied by the Simulation after every agent has finished Stage 2, so the
// tightening affects the following day's requests.
// -----------------------------------------------------------------------------
void tightenRepoWillingness(domain::AgentState& bank,
                            const domain::SimulationConfig& config);

}  // namespace liqsim
