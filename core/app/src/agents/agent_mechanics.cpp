#include "liqsim/agents/agent_mechanics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <variant>

namespace liqsim {

using domain::ActionClass;
using domain::AgentAction;
using domain::AgentState;
namespace items = domain::items;

namespace {

// Negative or NaN quantities are invariant violations, never clamped.
void requireNonNegative(const AgentState& agent, const char* quantity,
                        double value) {
  if (std::isnan(value) || value < 0.0) {
    throw std::domain_error("agent " + agent.name + ": " + quantity +
                            " is negative or NaN (" + std::to_string(value) +
                            ")");
  }
}

void requireFinite(const AgentState& agent, const char* quantity,
                   double value) {
  if (!std::isfinite(value)) {
    throw std::domain_error("agent " + agent.name + ": " + quantity +
                            " is not finite");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Buffers and shocks
// -----------------------------------------------------------------------------
double computeInitialBuffer(const AgentState& agent,
                            const IAgentBehavior& behavior,
                            const domain::SimulationConfig& config) {
  const double raw = behavior.rawInitialBuffer(agent);
  requireFinite(agent, "raw buffer", raw);
  const double floor = std::max(agent.size * behavior.bufferFloorFraction(),
                                config.min_buffer);
  return std::max(raw, floor);
}

double markToMarketLoss(const AgentState& agent, const IAgentBehavior& behavior,
                        const domain::VariableMap& day_delta) {
  double value_change = 0.0;
  for (const auto& item : agent.balance_sheet) {
    for (const auto& [variable, sensitivity] : item.sensitivities) {
      value_change +=
          item.amount * sensitivity * domain::valueOr(day_delta, variable);
    }
  }
  return std::abs(value_change) * behavior.markToMarketScale(agent);
}

void resetDaily(AgentState& agent) {
  agent.liquidity = domain::LiquidityPosition{};
  agent.shock = domain::ShockBreakdown{};
  agent.reacted = false;
  agent.actions.clear();
  if (auto* hf = std::get_if<domain::HedgeFundProfile>(&agent.profile)) {
    hf->repo_refused_today = false;
  }
}

void computeProvisionalShock(AgentState& agent, const IAgentBehavior& behavior,
                             const ReactionContext& ctx,
                             const domain::VariableMap& day_delta) {
  auto& shock = agent.shock;
  shock.mark_to_market = markToMarketLoss(agent, behavior, day_delta);
  shock.margin_calls = behavior.marginCalls(agent, ctx.market, day_delta);
  shock.own_redemptions =
      behavior.ownRedemptions(agent, ctx.market, ctx.network);
  shock.network_redemptions = 0.0;

  requireNonNegative(agent, "mark-to-market loss", shock.mark_to_market);
  requireNonNegative(agent, "margin calls", shock.margin_calls);
  requireNonNegative(agent, "own redemptions", shock.own_redemptions);

  const double b0 = agent.liquidity.B0;
  if (b0 <= 0.0) {
    throw std::domain_error("agent " + agent.name +
                            ": B0 must be positive before Stage 1");
  }
  shock.provisional_stress =
      (shock.mark_to_market + shock.margin_calls + shock.own_redemptions) / b0;
}

void computeStage1(AgentState& agent, const IAgentBehavior& behavior,
                   const ReactionContext& ctx) {
  auto& shock = agent.shock;
  shock.network_redemptions = behavior.networkRedemptions(agent, ctx);
  requireNonNegative(agent, "network redemptions", shock.network_redemptions);

  auto& liq = agent.liquidity;
  liq.E1 = shock.mark_to_market + shock.margin_calls + shock.own_redemptions +
           shock.network_redemptions;
  requireNonNegative(agent, "E1", liq.E1);
  liq.B1 = liq.B0 - liq.E1;

  agent.counters.margin_calls += shock.margin_calls;
  agent.counters.redemptions +=
      shock.own_redemptions + shock.network_redemptions;
}

bool shouldReact(const AgentState& agent) {
  const auto& liq = agent.liquidity;
  if (liq.B0 <= 0.0) {
    return false;
  }
  return liq.E1 / liq.B0 > agent.effectiveThreshold();
}

// -----------------------------------------------------------------------------
// Stage 2
// -----------------------------------------------------------------------------
void computeReactions(AgentState& agent, const IAgentBehavior& behavior,
                      const ReactionContext& ctx) {
  if (!shouldReact(agent)) {
    return;
  }
  agent.reacted = true;
  agent.ever_reacted = true;

  const double shortfall = agent.liquidity.E1;
  double outstanding = shortfall;
  double unmet_repo = 0.0;  // refused repo still to be raised by sales
  const bool fire_sale = behavior.salesCoverUnmetRepo();

  for (const WaterfallStep& step : behavior.waterfall(agent)) {
    if (outstanding <= 0.0) {
      break;
    }
    const bool sale = step.action_class == ActionClass::AssetSale;
    const double base = behavior.allocation(step, agent, shortfall);
    const double allocation = (fire_sale && sale) ? base + unmet_repo : base;
    const double cap = behavior.stepCap(step, agent, ctx);
    const double target = std::min({allocation, cap, outstanding});
    if (!(target > 0.0)) {
      continue;
    }

    const double obtained = behavior.executeStep(step, target, agent, ctx);
    requireNonNegative(agent, step.action.c_str(), obtained);
    if (fire_sale && step.action_class == ActionClass::Repo) {
      unmet_repo += target - obtained;
    } else if (fire_sale && sale) {
      unmet_repo -= std::min(unmet_repo, std::max(0.0, obtained - base));
    }
    if (obtained <= 0.0) {
      continue;
    }
    agent.actions.push_back(
        AgentAction{step.action, step.action_class, obtained, step.item});
    outstanding -= obtained;
  }
}

bool isGiltMarketItem(const std::string& item) {
  return item == items::kGilts || item == items::kIndexLinkedGilts ||
         item == items::kBasisPositions;
}

double actionEfficiency(const AgentAction& action, const MarketState& market,
                        const domain::SimulationConfig& config) {
  const auto& eff = config.efficiency;
  switch (action.action_class) {
    case ActionClass::AssetSale: {
      const double spread = isGiltMarketItem(action.item)
                                ? market.giltBidAskBps()
                                : market.corpBidAskBps();
      return std::max(eff.sale_floor, 1.0 - spread / eff.spread_divisor);
    }
    case ActionClass::Repo:
    case ActionClass::RepoLendingCut:
      return market.repoAvailability();
    case ActionClass::CentralBankFacility:
      return eff.central_bank;
    case ActionClass::Redemption:
      return eff.redemption;
    case ActionClass::Other:
      return eff.other;
  }
  return eff.other;
}

void computeStage2(AgentState& agent, const IAgentBehavior& behavior,
                   const ReactionContext& ctx) {
  auto& liq = agent.liquidity;
  double mitigation = 0.0;

  for (const AgentAction& action : agent.actions) {
    requireNonNegative(agent, action.name.c_str(), action.amount);
    mitigation +=
        action.amount * actionEfficiency(action, ctx.market, ctx.config);

    if (action.action_class == ActionClass::AssetSale) {
      agent.counters.asset_sales += action.amount;
      if (isGiltMarketItem(action.item)) {
        agent.counters.gilt_sales += action.amount;
      }
    } else if (action.action_class == ActionClass::Repo) {
      agent.counters.repo_demand += action.amount;
    }
  }

  requireNonNegative(agent, "Stage 2 mitigation", mitigation);
  liq.B2 = liq.B1 + mitigation;
  liq.E2 = 0.0;
  liq.B3 = liq.B2;

  behavior.afterReactions(agent, ctx.config);
}

void registerActionsToMarket(const AgentState& agent, MarketState& market) {
  for (const AgentAction& action : agent.actions) {
    if (action.action_class == ActionClass::AssetSale) {
      if (isGiltMarketItem(action.item)) {
        market.registerGiltSale(action.amount);
      } else if (action.item == items::kCorporateBonds) {
        market.registerCorpSale(action.amount);
      }
    } else if (action.action_class == ActionClass::Repo) {
      market.registerRepoDemand(action.amount);
    }
  }
}

// -----------------------------------------------------------------------------
// Stage 3 and end of day
// -----------------------------------------------------------------------------
void applyStage3(AgentState& agent, double e2) {
  requireNonNegative(agent, "E2 increment", e2);
  auto& liq = agent.liquidity;
  liq.E2 += e2;
  liq.B3 = liq.B2 - liq.E2;
}

void realizeSales(AgentState& agent) {
  for (const AgentAction& action : agent.actions) {
    if (action.action_class != ActionClass::AssetSale) {
      continue;
    }
    if (auto* item = domain::findItem(agent.balance_sheet, action.item)) {
      item->amount = std::max(0.0, item->amount - action.amount);
    }
  }
}

}  // namespace liqsim
