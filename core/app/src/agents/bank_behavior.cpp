#include "liqsim/agents/bank_behavior.hpp"

#include <algorithm>
#include <cmath>

namespace liqsim {

using domain::ActionClass;
using domain::AgentState;
namespace items = domain::items;
namespace vars = domain::vars;

BankBehavior::BankBehavior()
    : waterfall_{
          {"draw_central_bank_facility", ActionClass::CentralBankFacility,
           0.30, 0.50, items::kBoeEligible, CapBasis::Holding},
          {"reduce_repo_lending", ActionClass::RepoLendingCut, 0.30, 0.30,
           items::kRepoLending, CapBasis::Custom},
          {"sell_gilts", ActionClass::AssetSale, 0.10, 0.20, items::kGilts,
           CapBasis::Holding},
          {"sell_corporate_bonds", ActionClass::AssetSale, 0.08, 0.02,
           items::kCorporateBonds, CapBasis::Holding},
      } {}

double BankBehavior::rawInitialBuffer(const AgentState& agent) const {
  const auto& sheet = agent.balance_sheet;
  return domain::itemAmount(sheet, items::kBoeEligible) * 0.15 +
         domain::itemAmount(sheet, items::kCet1) * 0.08 -
         domain::itemAmount(sheet, items::kWholesaleFunding) * 0.10;
}

double BankBehavior::marginCalls(const AgentState& agent,
                                 const MarketState& market,
                                 const domain::VariableMap& day_delta) const {
  (void)day_delta;
  const double derivatives =
      domain::itemAmount(agent.balance_sheet, items::kDerivatives);
  const double s = market.stressIntensity();

  double margin =
      derivatives * std::abs(market.level(vars::kGilt10y)) * 1e-4 * 0.05;
  if (s > 1.0) {
    margin += derivatives * (s - 1.0) * 0.005;
  }
  return margin;
}

// Wholesale funding run-off in severe stress.
double BankBehavior::ownRedemptions(const AgentState& agent,
                                    const MarketState& market,
                                    const RelationshipNetwork& network) const {
  (void)network;
  const double s = market.stressIntensity();
  if (s <= 2.0) {
    return 0.0;
  }
  return domain::itemAmount(agent.balance_sheet, items::kWholesaleFunding) *
         (s - 2.0) * 0.02;
}

const WaterfallTable& BankBehavior::waterfall(const AgentState& agent) const {
  (void)agent;
  return waterfall_;
}

double BankBehavior::stepCap(const WaterfallStep& step, const AgentState& agent,
                             const ReactionContext& ctx) const {
  if (step.cap_basis == CapBasis::Custom) {
    const auto& profile = agent.profileAs<domain::BankProfile>();
    return domain::itemAmount(agent.balance_sheet, step.item) *
           (1.0 - profile.risk_appetite) * step.cap_fraction;
  }
  return IAgentBehavior::stepCap(step, agent, ctx);
}

domain::SensitivityMap BankBehavior::defaultSensitivities(
    const AgentState& agent, const std::string& item) const {
  (void)agent;
  if (item == items::kGilts) {
    return {{vars::kGilt10y, -0.00045}, {vars::kGilt30y, -0.00065}};
  }
  if (item == items::kCorporateBonds) {
    return {{vars::kIgSpread, -0.0004}, {vars::kHySpread, -0.0002}};
  }
  if (item == items::kEquity) {
    return {{vars::kEquity, 0.01}};
  }
  if (item == items::kDerivatives) {
    return {{vars::kGilt10y, -0.0002}, {vars::kSoniaSwap, -0.0002}};
  }
  return {};
}

}  // namespace liqsim
