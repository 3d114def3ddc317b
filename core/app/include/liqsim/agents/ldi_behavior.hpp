#pragma once

#include "liqsim/agents/i_agent_behavior.hpp"

namespace liqsim {

// -----------------------------------------------------------------------------
// LdiBehavior: leveraged liability-driven pension schemes
// -----------------------------------------------------------------------------
//
// @brief  Buffer, margin and waterfall rules for LDI funds, pooled or
//         segregated.
//
// @details
// Buffer: cash + unencumbered collateral * 0.3, floored at 0.5% of size.
// MTM scale: leverage * 0.5.
//
// Margin on the derivatives notional:
//   VM  = notional * max(|10y|, |30y|) * 1e-4 * 0.04
//   IM  = notional * max(0, s - 1) * 0.003
//   consumption = min(1, |10y| / yield_buffer_bps); once the yield buffer is
//   exhausted the excess move adds notional * excess * 1e-4 * 0.06.
//
// Investor redemptions = cash * consumption * 0.3 when consumption > 0.7 and
// the scheme is linked to at least one fund-complex.
//
// Waterfall:
//   1. post_collateral            0.40 / 0.5 of unencumbered collateral
//   2. sponsor_recapitalisation   0.30 / remaining capacity / speed days
//   3. sell_gilts                 0.15 / 0.15
//   4. sell_index_linked_gilts    0.08 / 0.02
//   5. sell_corporate_bonds       0.05 / 0.015
//   6. seek_repo                  0.85, bank-assessed
//   7. redeem_fund_holdings       0.20 / 0.05 of cash + MMF holdings
// -----------------------------------------------------------------------------
class LdiBehavior final : public IAgentBehavior {
 public:
  LdiBehavior();

  domain::AgentType type() const override {
    return domain::AgentType::LdiPension;
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

  double stepCap(const WaterfallStep& step, const domain::AgentState& agent,
                 const ReactionContext& ctx) const override;

  double executeStep(const WaterfallStep& step, double target,
                     domain::AgentState& agent,
                     const ReactionContext& ctx) const override;

  domain::SensitivityMap defaultSensitivities(
      const domain::AgentState& agent, const std::string& item) const override;

  // Fraction of the yield buffer eaten by the current 10y level, in [0, 1].
  static double yieldBufferConsumption(const domain::AgentState& agent,
                                       const MarketState& market);

 private:
  WaterfallTable waterfall_;
};

}  // namespace liqsim
