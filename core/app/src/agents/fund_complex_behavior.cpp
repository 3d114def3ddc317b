#include "liqsim/agents/fund_complex_behavior.hpp"

#include <iostream>

namespace liqsim {

using domain::ActionClass;
using domain::AgentState;
using domain::AgentType;
using domain::FundComplexProfile;
namespace items = domain::items;
namespace vars = domain::vars;

namespace {

using RedemptionParams = domain::SimulationConfig::RedemptionParams;

double redeemerWeight(const AgentState& redeemer,
                      const FundComplexProfile& fund,
                      const RedemptionParams& params) {
  switch (redeemer.type) {
    case AgentType::LdiPension:
      return params.ldi_weight * fund.pension_investor_pct;
    case AgentType::Insurer:
      return params.insurer_weight * fund.insurer_investor_pct;
    case AgentType::HedgeFund:
      return params.hedge_fund_weight;
    case AgentType::FundComplex:
      return params.fund_complex_weight;
    case AgentType::Bank:
      break;
  }
  return 0.0;
}

}  // namespace

double computeRedemptionDemand(const AgentState& fund,
                               const ReactionContext& ctx) {
  const auto& profile = fund.profileAs<FundComplexProfile>();
  const auto& params = ctx.config.redemption;

  double demand = 0.0;
  for (domain::AgentId id : ctx.network.redeemers(fund.id)) {
    const AgentState& redeemer = ctx.agents[id];
    const double stress = redeemer.shock.provisional_stress;
    if (stress <= redeemer.effectiveThreshold()) {
      continue;
    }
    demand += redeemer.size * params.rate * stress *
              redeemerWeight(redeemer, profile, params);
  }

  if (profile.gated) {
    demand *= 1.0 - params.gate_dampening;
  }
  return demand;
}

FundComplexBehavior::FundComplexBehavior()
    : waterfall_{
          {"use_cash_buffer", ActionClass::Other, 1.0, 1.0, items::kCashBuffer,
           CapBasis::Holding},
          {"sell_gilts", ActionClass::AssetSale, 1.0, 0.20, items::kGilts,
           CapBasis::Holding},
          {"sell_corporate_bonds", ActionClass::AssetSale, 1.0, 0.20,
           items::kCorporateBonds, CapBasis::Holding},
      } {}

double FundComplexBehavior::rawInitialBuffer(const AgentState& agent) const {
  return domain::itemAmount(agent.balance_sheet, items::kCashBuffer) * 0.5;
}

double FundComplexBehavior::marginCalls(
    const AgentState& agent, const MarketState& market,
    const domain::VariableMap& day_delta) const {
  (void)agent;
  (void)market;
  (void)day_delta;
  return 0.0;
}

double FundComplexBehavior::ownRedemptions(
    const AgentState& agent, const MarketState& market,
    const RelationshipNetwork& network) const {
  (void)agent;
  (void)market;
  (void)network;
  return 0.0;
}

double FundComplexBehavior::networkRedemptions(
    const AgentState& agent, const ReactionContext& ctx) const {
  return computeRedemptionDemand(agent, ctx);
}

const WaterfallTable& FundComplexBehavior::waterfall(
    const AgentState& agent) const {
  (void)agent;
  return waterfall_;
}

void FundComplexBehavior::afterReactions(
    AgentState& agent, const domain::SimulationConfig& config) const {
  auto& profile = agent.profileAs<FundComplexProfile>();
  if (profile.gated || agent.size <= 0.0) {
    return;
  }
  const double redeemed = agent.counters.redemptions / agent.size;
  if (redeemed > config.redemption.gate_threshold) {
    profile.gated = true;
    if (config.verbose) {
      std::cout << "[FundComplex] " << agent.name
                << " gated after cumulative redemptions of "
                << agent.counters.redemptions << "\n";
    }
  }
}

domain::SensitivityMap FundComplexBehavior::defaultSensitivities(
    const AgentState& agent, const std::string& item) const {
  (void)agent;
  if (item == items::kGilts) {
    return {{vars::kGilt10y, -0.0005}};
  }
  if (item == items::kCorporateBonds) {
    return {{vars::kIgSpread, -0.0004}};
  }
  if (item == items::kAbs) {
    return {{vars::kIgSpread, -0.0002}};
  }
  return {};
}

}  // namespace liqsim
