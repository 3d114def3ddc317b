#pragma once

#include "liqsim/domain/agent_action.hpp"
#include "liqsim/domain/agent_profiles.hpp"
#include "liqsim/domain/agent_type.hpp"
#include "liqsim/domain/balance_sheet_item.hpp"
#include "liqsim/domain/liquidity_position.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace liqsim {
namespace domain {

// Index of the agent in the population vector. Stable for the whole run.
using AgentId = std::size_t;

// Horizon-long totals. Never reset mid-run.
struct CumulativeCounters {
  double margin_calls{0.0};
  double asset_sales{0.0};
  double gilt_sales{0.0};
  double repo_demand{0.0};
  double redemptions{0.0};
};

// Today's Stage 1 components, kept for snapshots and for redemption routing.
struct ShockBreakdown {
  double mark_to_market{0.0};
  double margin_calls{0.0};
  double own_redemptions{0.0};      // levied by the agent's own investors
  double network_redemptions{0.0};  // routed from connected redeemers

  // (E1 excluding network_redemptions) / B0. Read by fund-complexes when
  // they aggregate redemption demand; see computeProvisionalShock().
  double provisional_stress{0.0};
};

// -----------------------------------------------------------------------------
// AgentState: the value the three-stage mechanics operate on
// -----------------------------------------------------------------------------
//
// @brief  Identity, behavioral parameters, balance sheet and run state of one
//         institution.
//
// @details
// AgentState carries no behavior. The per-variant rules live in an
// IAgentBehavior selected by `type`; the shared three-stage orchestration is
// the set of free functions in agents/agent_mechanics.hpp.
//
// Daily fields (liquidity, reacted, actions, shock) are cleared by
// resetDaily(). `counters` and the run-state fields of `profile` persist for
// the whole horizon.
//
// Ownership:
//   The Simulation owns the population as std::vector<AgentState>. Agents are
//   never added or removed during a run; AgentId == index.
// -----------------------------------------------------------------------------
struct AgentState {
  AgentId id{0};
  std::string name;
  AgentType type{AgentType::Bank};
  double size{0.0};  // total balance-sheet size, GBP mm

  double theta{0.3};             // reaction threshold on E1/B0
  double buffer_usability{0.0};  // u; effective threshold is theta * (1 + u)

  BalanceSheet balance_sheet;
  AgentProfile profile;

  LiquidityPosition liquidity;
  ShockBreakdown shock;
  bool reacted{false};
  bool ever_reacted{false};
  ActionList actions;
  CumulativeCounters counters;

  double effectiveThreshold() const { return theta * (1.0 + buffer_usability); }

  // Sum of today's action amounts.
  double actionTotal() const;

  // Amount of the named action today, 0.0 when not executed.
  double actionAmount(const std::string& action_name) const;

  // Typed access to the variant profile. Throws std::bad_variant_access when
  // the profile does not match.
  template <typename Profile>
  Profile& profileAs() {
    return std::get<Profile>(profile);
  }

  template <typename Profile>
  const Profile& profileAs() const {
    return std::get<Profile>(profile);
  }
};

using Population = std::vector<AgentState>;

// -----------------------------------------------------------------------------
// validatePopulation(population)
// -----------------------------------------------------------------------------
// @brief  Rejects a population the engine cannot run.
//
// @details
// Throws std::invalid_argument when: the population is empty; an id does not
// equal its index; a name is empty or duplicated; the profile alternative
// does not match the type tag; size, theta, usability or any item amount is
// negative or not finite; theta is zero.
// -----------------------------------------------------------------------------
void validatePopulation(const Population& population);

}  // namespace domain
}  // namespace liqsim
