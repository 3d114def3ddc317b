#include "liqsim/agents/hedge_fund_behavior.hpp"
#include "liqsim/agents/repo_market.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace liqsim {

using domain::ActionClass;
using domain::AgentState;
using domain::HedgeFundProfile;
using domain::HedgeFundStrategy;
namespace items = domain::items;
namespace vars = domain::vars;

namespace {

const char* const kSeekRepo = "seek_repo";
const char* const kRedeemFundHoldings = "redeem_fund_holdings";

WaterfallStep seekRepoStep() {
  return {kSeekRepo, ActionClass::Repo, 0.85, 0.0, items::kRepoBorrowing,
          CapBasis::Custom};
}

WaterfallStep redeemStep() {
  return {kRedeemFundHoldings, ActionClass::Redemption, 0.20, 0.05, "",
          CapBasis::Custom};
}

WaterfallStep sale(const char* action, const char* item, double share,
                   double cap) {
  return {action, ActionClass::AssetSale, share, cap, item, CapBasis::Holding};
}

std::vector<const char*> primaryVariables(HedgeFundStrategy strategy) {
  switch (strategy) {
    case HedgeFundStrategy::MacroRates:
      return {vars::kGilt10y, vars::kGilt30y, vars::kSoniaSwap};
    case HedgeFundStrategy::RelativeValue:
      return {vars::kGilt10y, vars::kBondFuturesBasis};
    case HedgeFundStrategy::LongShortEquity:
      return {vars::kEquity};
    case HedgeFundStrategy::CreditLongShort:
      return {vars::kIgSpread, vars::kHySpread};
    case HedgeFundStrategy::MultiStrategy:
      return {vars::kGilt10y, vars::kEquity, vars::kIgSpread};
  }
  return {vars::kGilt10y};
}

}  // namespace

HedgeFundBehavior::HedgeFundBehavior() {
  auto table = [this](HedgeFundStrategy s) -> WaterfallTable& {
    return waterfalls_[static_cast<std::size_t>(s)];
  };

  table(HedgeFundStrategy::MacroRates) = {
      seekRepoStep(),
      sale("sell_gilts", items::kGilts, 0.10, 0.10),
      redeemStep(),
  };
  table(HedgeFundStrategy::RelativeValue) = {
      seekRepoStep(),
      sale("unwind_basis", items::kBasisPositions, 0.10, 0.04),
      sale("sell_gilts", items::kGilts, 0.10, 0.10),
      redeemStep(),
  };
  table(HedgeFundStrategy::LongShortEquity) = {
      seekRepoStep(),
      sale("sell_equity", items::kEquity, 0.10, 0.025),
      redeemStep(),
  };
  table(HedgeFundStrategy::CreditLongShort) = {
      seekRepoStep(),
      sale("sell_corporate_bonds", items::kCorporateBonds, 0.10, 0.025),
      redeemStep(),
  };
  table(HedgeFundStrategy::MultiStrategy) = {
      seekRepoStep(),
      sale("sell_gilts", items::kGilts, 0.05, 0.03),
      sale("sell_corporate_bonds", items::kCorporateBonds, 0.05, 0.03),
      sale("sell_equity", items::kEquity, 0.05, 0.03),
      redeemStep(),
  };
}

double HedgeFundBehavior::rawInitialBuffer(const AgentState& agent) const {
  return domain::itemAmount(agent.balance_sheet, items::kCash);
}

double HedgeFundBehavior::markToMarketScale(const AgentState& agent) const {
  const auto& profile = agent.profileAs<HedgeFundProfile>();
  return 1.0 + (profile.leverage - 1.0) * 0.3;
}

double HedgeFundBehavior::marginCalls(
    const AgentState& agent, const MarketState& market,
    const domain::VariableMap& day_delta) const {
  (void)day_delta;
  const auto& profile = agent.profileAs<HedgeFundProfile>();
  const double s = market.stressIntensity();
  const double dep = domain::repoDependenceMultiplier(profile.repo_dependence);
  const double gross = profile.aum * profile.leverage;

  double primary = 0.0;
  for (const char* variable : primaryVariables(profile.strategy)) {
    primary = std::max(primary, std::abs(market.level(variable)));
  }

  double margin = gross * primary * 1e-4 * 0.022 +
                  gross * std::max(0.0, s - 1.0) * 0.002;
  if (dep > 0.5) {
    margin += profile.aum * dep * market.level(vars::kRepoHaircutGilt) * 0.003;
  }
  return margin;
}

double HedgeFundBehavior::ownRedemptions(
    const AgentState& agent, const MarketState& market,
    const RelationshipNetwork& network) const {
  (void)network;
  const auto& profile = agent.profileAs<HedgeFundProfile>();
  if (market.stressIntensity() > 2.5 && profile.var_utilisation > 0.85) {
    return profile.aum * 0.02;
  }
  return 0.0;
}

const WaterfallTable& HedgeFundBehavior::waterfall(
    const AgentState& agent) const {
  const auto& profile = agent.profileAs<HedgeFundProfile>();
  return waterfalls_[static_cast<std::size_t>(profile.strategy)];
}

double HedgeFundBehavior::allocation(const WaterfallStep& step,
                                     const AgentState& agent,
                                     double shortfall) const {
  if (step.action_class == ActionClass::Repo) {
    const auto& profile = agent.profileAs<HedgeFundProfile>();
    const double dep =
        domain::repoDependenceMultiplier(profile.repo_dependence);
    return shortfall * std::max(dep, 0.6) * step.shortfall_share;
  }
  return IAgentBehavior::allocation(step, agent, shortfall);
}

double HedgeFundBehavior::stepCap(const WaterfallStep& step,
                                  const AgentState& agent,
                                  const ReactionContext& ctx) const {
  if (step.action_class == ActionClass::Redemption) {
    if (ctx.network.neighbors(agent.id, EdgeKind::Redemption).empty()) {
      return 0.0;
    }
    return agent.profileAs<HedgeFundProfile>().aum * step.cap_fraction;
  }
  return IAgentBehavior::stepCap(step, agent, ctx);
}

double HedgeFundBehavior::executeStep(const WaterfallStep& step, double target,
                                      AgentState& agent,
                                      const ReactionContext& ctx) const {
  if (step.action_class != ActionClass::Repo) {
    return IAgentBehavior::executeStep(step, target, agent, ctx);
  }

  const RepoOutcome outcome = seekRepo(agent, target, ctx);
  auto& profile = agent.profileAs<HedgeFundProfile>();
  profile.has_ever_sought_repo = true;
  if (outcome.refused_by_all) {
    profile.repo_refused_today = true;
    profile.repo_refused_by_all = true;
  }
  return outcome.granted;
}

domain::SensitivityMap HedgeFundBehavior::defaultSensitivities(
    const AgentState& agent, const std::string& item) const {
  const HedgeFundStrategy strategy =
      agent.profileAs<HedgeFundProfile>().strategy;

  if (item == items::kGilts) {
    switch (strategy) {
      case HedgeFundStrategy::MacroRates:
        return {{vars::kGilt10y, -0.0006},
                {vars::kGilt30y, -0.0008},
                {vars::kSoniaSwap, -0.0003}};
      case HedgeFundStrategy::RelativeValue:
      case HedgeFundStrategy::MultiStrategy:
        return {{vars::kGilt10y, -0.0006}};
      default:
        return {{vars::kGilt10y, -0.0002}};
    }
  }
  if (item == items::kEquity) {
    if (strategy == HedgeFundStrategy::LongShortEquity ||
        strategy == HedgeFundStrategy::MultiStrategy) {
      return {{vars::kEquity, 0.012}};
    }
    return {{vars::kEquity, 0.002}};
  }
  if (item == items::kCorporateBonds) {
    switch (strategy) {
      case HedgeFundStrategy::CreditLongShort:
        return {{vars::kIgSpread, -0.0005}, {vars::kHySpread, -0.0003}};
      case HedgeFundStrategy::MultiStrategy:
        return {{vars::kIgSpread, -0.0005}};
      default:
        return {{vars::kIgSpread, -0.0002}};
    }
  }
  if (item == items::kBasisPositions) {
    return {{vars::kBondFuturesBasis, -0.001}, {vars::kGilt10y, -0.0003}};
  }
  return {};
}

}  // namespace liqsim
