#include "liqsim/agents/insurer_behavior.hpp"

#include <algorithm>
#include <cmath>

namespace liqsim {

using domain::ActionClass;
using domain::AgentState;
using domain::InsurerProfile;
namespace items = domain::items;
namespace vars = domain::vars;

InsurerBehavior::InsurerBehavior()
    : waterfall_{
          {"draw_repo_lines", ActionClass::Other, 0.30, 0.50,
           items::kCommittedRepoLines, CapBasis::Holding},
          {"draw_rcf", ActionClass::Other, 0.20, 0.50, items::kRevolvingCredit,
           CapBasis::Holding},
          {"sell_gilts", ActionClass::AssetSale, 0.15, 0.10, items::kGilts,
           CapBasis::Holding},
          {"sell_corporate_bonds", ActionClass::AssetSale, 0.08, 0.02,
           items::kCorporateBonds, CapBasis::Holding},
          {"sell_equity", ActionClass::AssetSale, 0.05, 0.025, items::kEquity,
           CapBasis::Holding},
          {"seek_repo", ActionClass::Repo, 0.80, 0.0, items::kRepoBorrowing,
           CapBasis::Custom},
          {"redeem_fund_holdings", ActionClass::Redemption, 0.15, 0.03, "",
           CapBasis::Custom},
      } {}

double InsurerBehavior::rawInitialBuffer(const AgentState& agent) const {
  const auto& sheet = agent.balance_sheet;
  return domain::itemAmount(sheet, items::kCash) * 0.5 +
         domain::itemAmount(sheet, items::kCommittedRepoLines) * 0.2 +
         domain::itemAmount(sheet, items::kRevolvingCredit) * 0.2;
}

double InsurerBehavior::markToMarketScale(const AgentState& agent) const {
  return 1.0 - agent.profileAs<InsurerProfile>().hedge_ratio * 0.3;
}

double InsurerBehavior::marginCalls(
    const AgentState& agent, const MarketState& market,
    const domain::VariableMap& day_delta) const {
  (void)day_delta;
  const auto& profile = agent.profileAs<InsurerProfile>();
  const double notional =
      domain::itemAmount(agent.balance_sheet, items::kDerivatives);
  const double s = market.stressIntensity();

  const double rates =
      notional * std::abs(market.level(vars::kGilt10y)) * 1e-4 * 0.008;
  const double stress = notional * std::max(0.0, s - 1.0) * 0.0008;
  // Dirty CSAs accept corporate collateral, so a wider corporate haircut
  // means topping up.
  const double dirty_csa = notional * profile.dirty_csa_fraction *
                           market.level(vars::kRepoHaircutCorp) * 0.01 * 0.05;
  return rates + stress + dirty_csa;
}

double InsurerBehavior::ownRedemptions(const AgentState& agent,
                                       const MarketState& market,
                                       const RelationshipNetwork& network) const {
  (void)network;
  return market.stressIntensity() > 2.5 ? agent.size * 0.005 : 0.0;
}

const WaterfallTable& InsurerBehavior::waterfall(const AgentState& agent) const {
  (void)agent;
  return waterfall_;
}

double InsurerBehavior::stepCap(const WaterfallStep& step,
                                const AgentState& agent,
                                const ReactionContext& ctx) const {
  if (step.action_class == ActionClass::Redemption) {
    if (ctx.network.neighbors(agent.id, EdgeKind::Redemption).empty()) {
      return 0.0;
    }
    return agent.size * step.cap_fraction;
  }
  return IAgentBehavior::stepCap(step, agent, ctx);
}

domain::SensitivityMap InsurerBehavior::defaultSensitivities(
    const AgentState& agent, const std::string& item) const {
  (void)agent;
  if (item == items::kGilts) {
    return {{vars::kGilt10y, -0.0005}, {vars::kGilt30y, -0.0007}};
  }
  if (item == items::kCorporateBonds) {
    return {{vars::kIgSpread, -0.0004}};
  }
  if (item == items::kEquity) {
    return {{vars::kEquity, 0.01}};
  }
  return {};
}

}  // namespace liqsim
