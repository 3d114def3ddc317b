#pragma once

#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/simulation_config.hpp"
#include "liqsim/network/relationship_network.hpp"

#include <cstdint>

namespace liqsim {

// -----------------------------------------------------------------------------
// buildNetwork(population, params, seed)
// -----------------------------------------------------------------------------
//
// @brief  Draws the relationship network for a population.
//
// @details
// Banks are hubs; their in-degree emerges from the non-bank draws:
//
//   each hedge fund     → hedge_fund_banks   banks  (PrimeBrokerage)
//   each LDI scheme     → ldi_banks          banks  (Clearing)
//   each insurer        → insurer_banks      banks  (DerivativesRepo)
//   each HF/LDI/insurer → redemption_funds   funds  (Redemption)
//   each fund-complex   → fund_cross_holdings other funds (Redemption)
//
// Counterparties are drawn without replacement, weighted by AgentState::size
// (uniform when every candidate has zero size). The degree is drawn
// uniformly from the configured range, clamped to the candidate count.
//
// Deterministic: the same population, params and seed yield the same edges
// in the same order (std::mt19937_64, agents visited in id order).
// -----------------------------------------------------------------------------
RelationshipNetwork buildNetwork(const domain::Population& population,
                                 const domain::SimulationConfig::NetworkParams& params,
                                 std::uint64_t seed);

}  // namespace liqsim
