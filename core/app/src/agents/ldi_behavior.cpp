#include "liqsim/agents/ldi_behavior.hpp"

#include <algorithm>
#include <cmath>

namespace liqsim {

using domain::ActionClass;
using domain::AgentState;
using domain::LdiProfile;
namespace items = domain::items;
namespace vars = domain::vars;

LdiBehavior::LdiBehavior()
    : waterfall_{
          {"post_collateral", ActionClass::Other, 0.40, 0.50,
           items::kUnencumbered, CapBasis::Holding},
          {"sponsor_recapitalisation", ActionClass::Other, 0.30, 0.0, "",
           CapBasis::Custom},
          {"sell_gilts", ActionClass::AssetSale, 0.15, 0.15, items::kGilts,
           CapBasis::Holding},
          {"sell_index_linked_gilts", ActionClass::AssetSale, 0.08, 0.02,
           items::kIndexLinkedGilts, CapBasis::Holding},
          {"sell_corporate_bonds", ActionClass::AssetSale, 0.05, 0.015,
           items::kCorporateBonds, CapBasis::Holding},
          {"seek_repo", ActionClass::Repo, 0.85, 0.0, items::kRepoBorrowing,
           CapBasis::Custom},
          {"redeem_fund_holdings", ActionClass::Redemption, 0.20, 0.05, "",
           CapBasis::Custom},
      } {}

double LdiBehavior::rawInitialBuffer(const AgentState& agent) const {
  const auto& sheet = agent.balance_sheet;
  return domain::itemAmount(sheet, items::kCash) +
         domain::itemAmount(sheet, items::kUnencumbered) * 0.3;
}

double LdiBehavior::markToMarketScale(const AgentState& agent) const {
  return agent.profileAs<LdiProfile>().leverage * 0.5;
}

double LdiBehavior::yieldBufferConsumption(const AgentState& agent,
                                           const MarketState& market) {
  const double buffer_bps = agent.profileAs<LdiProfile>().yield_buffer_bps;
  if (buffer_bps <= 0.0) {
    return 1.0;
  }
  return std::min(1.0, std::abs(market.level(vars::kGilt10y)) / buffer_bps);
}

double LdiBehavior::marginCalls(const AgentState& agent,
                                const MarketState& market,
                                const domain::VariableMap& day_delta) const {
  (void)day_delta;
  const double notional =
      domain::itemAmount(agent.balance_sheet, items::kDerivatives);
  const double s = market.stressIntensity();
  const double move_10y = std::abs(market.level(vars::kGilt10y));
  const double move_30y = std::abs(market.level(vars::kGilt30y));

  const double variation =
      notional * std::max(move_10y, move_30y) * 1e-4 * 0.04;
  const double initial = notional * std::max(0.0, s - 1.0) * 0.003;

  double margin = variation + initial;
  if (yieldBufferConsumption(agent, market) >= 1.0) {
    const double excess =
        move_10y - agent.profileAs<LdiProfile>().yield_buffer_bps;
    margin += notional * std::max(0.0, excess) * 1e-4 * 0.06;
  }
  return margin;
}

// Scheme members pulling money once the yield buffer is mostly gone.
double LdiBehavior::ownRedemptions(const AgentState& agent,
                                   const MarketState& market,
                                   const RelationshipNetwork& network) const {
  if (network.neighbors(agent.id, EdgeKind::Redemption).empty()) {
    return 0.0;
  }
  const double consumption = yieldBufferConsumption(agent, market);
  if (consumption <= 0.7) {
    return 0.0;
  }
  return domain::itemAmount(agent.balance_sheet, items::kCash) * consumption *
         0.3;
}

const WaterfallTable& LdiBehavior::waterfall(const AgentState& agent) const {
  (void)agent;
  return waterfall_;
}

double LdiBehavior::stepCap(const WaterfallStep& step, const AgentState& agent,
                            const ReactionContext& ctx) const {
  if (step.action == "sponsor_recapitalisation") {
    const auto& profile = agent.profileAs<LdiProfile>();
    const double speed =
        profile.pooled ? 1.0 : std::max(1.0, profile.recap_speed_days);
    return std::max(0.0, profile.recap_capacity / speed);
  }
  if (step.action_class == ActionClass::Redemption) {
    if (ctx.network.neighbors(agent.id, EdgeKind::Redemption).empty()) {
      return 0.0;
    }
    const double liquid =
        domain::itemAmount(agent.balance_sheet, items::kCash) +
        domain::itemAmount(agent.balance_sheet, items::kMmfHoldings);
    return liquid * step.cap_fraction;
  }
  return IAgentBehavior::stepCap(step, agent, ctx);
}

double LdiBehavior::executeStep(const WaterfallStep& step, double target,
                                AgentState& agent,
                                const ReactionContext& ctx) const {
  if (step.action == "sponsor_recapitalisation") {
    auto& profile = agent.profileAs<LdiProfile>();
    profile.recap_capacity = std::max(0.0, profile.recap_capacity - target);
    return target;
  }
  return IAgentBehavior::executeStep(step, target, agent, ctx);
}

domain::SensitivityMap LdiBehavior::defaultSensitivities(
    const AgentState& agent, const std::string& item) const {
  (void)agent;
  if (item == items::kGilts) {
    return {{vars::kGilt10y, -0.0006}, {vars::kGilt30y, -0.0009}};
  }
  if (item == items::kIndexLinkedGilts) {
    return {{vars::kIndexLinkedGilt, -0.0007}};
  }
  if (item == items::kCorporateBonds) {
    return {{vars::kIgSpread, -0.0004}};
  }
  if (item == items::kDerivatives) {
    return {{vars::kGilt10y, -0.0003},
            {vars::kSoniaSwap, -0.0003},
            {vars::kGilt30y, -0.0004}};
  }
  return {};
}

}  // namespace liqsim
