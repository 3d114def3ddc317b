#pragma once

#include "liqsim/agents/i_agent_behavior.hpp"

#include <array>

namespace liqsim {

// -----------------------------------------------------------------------------
// HedgeFundBehavior: leveraged funds financed by prime-brokerage repo
// -----------------------------------------------------------------------------
//
// @brief  Buffer, margin and waterfall rules for hedge funds. The waterfall
//         and the sensitivity table depend on the fund's strategy.
//
// @details
// Buffer: unencumbered cash, floored at 0.5% of size.
//
// Stage 1:
//   MTM scale = 1 + (leverage - 1) * 0.3
//   margin    = AUM * lev * max|primary level| * 1e-4 * 0.022
//               + AUM * lev * max(0, s - 1) * 0.002
//               + AUM * dep * gilt repo haircut * 0.003    when dep > 0.5
//   investor redemptions = AUM * 0.02 when s > 2.5 and VaR utilisation > 0.85
//
// Waterfall:
//   1. seek_repo             ask = shortfall * max(dep, 0.6) * 0.85,
//                            granted by the connected banks only
//   2. strategy sales        see the tables in the constructor
//   3. redeem_fund_holdings  0.20 / 0.05 * AUM, nothing without a fund link
//
// A fund whose connected banks all refuse is flagged repo_refused_by_all.
// Whatever part of the ask was not granted is added to the strategy sales
// (fire sale), each still capped by its holding.
// -----------------------------------------------------------------------------
class HedgeFundBehavior final : public IAgentBehavior {
 public:
  HedgeFundBehavior();

  domain::AgentType type() const override {
    return domain::AgentType::HedgeFund;
  }

  double rawInitialBuffer(const domain::AgentState& agent) const override;
  double bufferFloorFraction() const override { return 0.005; }

  double markToMarketScale(const domain::AgentState& agent) const override;

  double marginCalls(const domain::AgentState& agent, const MarketState& market,
                     const domain::VariableMap& day_delta) const override;

  double ownRedemptions(const domain::AgentState& agent,
                        const MarketState& market,
                        const RelationshipNetwork& network) const override;

  const WaterfallTable& waterfall(
      const domain::AgentState& agent) const override;

  double allocation(const WaterfallStep& step, const domain::AgentState& agent,
                    double shortfall) const override;

  bool salesCoverUnmetRepo() const override { return true; }

  double stepCap(const WaterfallStep& step, const domain::AgentState& agent,
                 const ReactionContext& ctx) const override;

  double executeStep(const WaterfallStep& step, double target,
                     domain::AgentState& agent,
                     const ReactionContext& ctx) const override;

  domain::SensitivityMap defaultSensitivities(
      const domain::AgentState& agent, const std::string& item) const override;

 private:
  // Indexed by HedgeFundStrategy.
  std::array<WaterfallTable, 5> waterfalls_;
};

}  // namespace liqsim
