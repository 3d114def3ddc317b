#pragma once

#include "liqsim/domain/agent_action.hpp"
#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/market_variables.hpp"
#include "liqsim/domain/simulation_config.hpp"
#include "liqsim/market/market_state.hpp"
#include "liqsim/network/relationship_network.hpp"

#include <string>
#include <vector>

namespace liqsim {

// -----------------------------------------------------------------------------
// WaterfallStep: one row of a variant's reaction table
// -----------------------------------------------------------------------------
//
// @brief  Names an action and the two caps that bound it.
//
// @details
// The amount executed by a step is
//
//   min(allocation, cap, outstanding shortfall)
//
// For behaviors with salesCoverUnmetRepo(), an AssetSale step's allocation
// also carries the part of earlier repo asks the banks did not grant.
//
// where allocation = shortfall_share * day's shortfall (behaviors may
// override, e.g. hedge-fund repo asks scale with repo dependence) and cap is
//
//   Holding  cap_fraction * amount of `item` on the balance sheet
//   Custom   computed by the behavior (facility remaining, bank-assessed repo,
//            redemption headroom, ...)
// -----------------------------------------------------------------------------
enum class CapBasis {
  Holding,
  Custom,
};

struct WaterfallStep {
  std::string action;
  domain::ActionClass action_class{domain::ActionClass::Other};
  double shortfall_share{0.0};
  double cap_fraction{0.0};
  std::string item;
  CapBasis cap_basis{CapBasis::Holding};
};

using WaterfallTable = std::vector<WaterfallStep>;

// Read-only view of the world handed to Stage 1 and Stage 2 computations.
struct ReactionContext {
  const MarketState& market;
  const RelationshipNetwork& network;
  const domain::Population& agents;
  const domain::SimulationConfig& config;
};

// -----------------------------------------------------------------------------
// IAgentBehavior: per-variant strategy object
// -----------------------------------------------------------------------------
//
// @brief  Everything that differs between the five agent variants: buffer
//         composition, margin and redemption rules, the waterfall table and
//         the default sensitivity table.
//
// @details
// Behaviors are stateless. All run state lives in AgentState (including the
// variant profile), so one behavior instance serves every agent of its type.
// The shared three-stage orchestration is in agents/agent_mechanics.hpp and
// calls into this interface.
//
// Implementations:
//   BankBehavior, HedgeFundBehavior, LdiBehavior, InsurerBehavior,
//   FundComplexBehavior. BehaviorRegistry maps AgentType → behavior.
//
// Thread model:
//   Const methods only (apart from the mutating hooks taking AgentState&);
//   safe to share.
// -----------------------------------------------------------------------------
class IAgentBehavior {
 public:
  virtual ~IAgentBehavior() = default;

  virtual domain::AgentType type() const = 0;

  // B0 before flooring.
  virtual double rawInitialBuffer(const domain::AgentState& agent) const = 0;

  // B0 floor as a fraction of AgentState::size.
  virtual double bufferFloorFraction() const = 0;

  // Multiplier on the summed mark-to-market loss (leverage, hedge offset).
  virtual double markToMarketScale(const domain::AgentState& agent) const {
    (void)agent;
    return 1.0;
  }

  virtual double marginCalls(const domain::AgentState& agent,
                             const MarketState& market,
                             const domain::VariableMap& day_delta) const = 0;

  // Outflows levied by the agent's own investors or policyholders.
  virtual double ownRedemptions(const domain::AgentState& agent,
                                const MarketState& market,
                                const RelationshipNetwork& network) const = 0;

  // Redemption demand routed to this agent from connected redeemers. Only
  // fund-complexes receive any.
  virtual double networkRedemptions(const domain::AgentState& agent,
                                    const ReactionContext& ctx) const {
    (void)agent;
    (void)ctx;
    return 0.0;
  }

  virtual const WaterfallTable& waterfall(
      const domain::AgentState& agent) const = 0;

  virtual double allocation(const WaterfallStep& step,
                            const domain::AgentState& agent,
                            double shortfall) const {
    (void)agent;
    return step.shortfall_share * shortfall;
  }

  // When true, repo asked for but not granted is added to the allocation of
  // the asset sales that follow it, still bounded by each holding.
  virtual bool salesCoverUnmetRepo() const { return false; }

  // Per-action ceiling. The default handles CapBasis::Holding; behaviors
  // with Custom steps override and fall back to this for the rest.
  virtual double stepCap(const WaterfallStep& step,
                         const domain::AgentState& agent,
                         const ReactionContext& ctx) const;

  // Executes a step for `target` (already capped) and returns the amount
  // actually obtained. Only repo steps can return less than `target`.
  virtual double executeStep(const WaterfallStep& step, double target,
                             domain::AgentState& agent,
                             const ReactionContext& ctx) const;

  // Hook run at the end of Stage 2 for every agent, reacted or not.
  virtual void afterReactions(domain::AgentState& agent,
                              const domain::SimulationConfig& config) const {
    (void)agent;
    (void)config;
  }

  // Default sensitivities for a balance-sheet item of this variant. Empty
  // when the item carries no direct mark-to-market exposure.
  virtual domain::SensitivityMap defaultSensitivities(
      const domain::AgentState& agent, const std::string& item) const = 0;
};

}  // namespace liqsim
