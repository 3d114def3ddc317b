#pragma once

#include "liqsim/agents/i_agent_behavior.hpp"

namespace liqsim {

// -----------------------------------------------------------------------------
// InsurerBehavior: life insurers hedging with derivatives
// -----------------------------------------------------------------------------
//
// Buffer: cash * 0.5 + committed repo lines * 0.2 + RCF * 0.2, floored at
// 0.2% of size. Hedging offsets part of the mark-to-market loss.
//
// Waterfall:
//   1. draw_repo_lines        0.30 / 0.5 of committed lines
//   2. draw_rcf               0.20 / 0.5 of the revolving credit facility
//   3. sell_gilts             0.15 / 0.10
//   4. sell_corporate_bonds   0.08 / 0.02
//   5. sell_equity            0.05 / 0.025
//   6. seek_repo              0.80, bank-assessed
//   7. redeem_fund_holdings   0.15 / 0.03 * size
// -----------------------------------------------------------------------------
class InsurerBehavior final : public IAgentBehavior {
 public:
  InsurerBehavior();

  domain::AgentType type() const override { return domain::AgentType::Insurer; }

  double rawInitialBuffer(const domain::AgentState& agent) const override;
  double bufferFloorFraction() const override { return 0.002; }

  double markToMarketScale(const domain::AgentState& agent) const override;

  double marginCalls(const domain::AgentState& agent, const MarketState& market,
                     const domain::VariableMap& day_delta) const override;

  // Policyholder surrenders.
  double ownRedemptions(const domain::AgentState& agent,
                        const MarketState& market,
                        const RelationshipNetwork& network) const override;

  const WaterfallTable& waterfall(
      const domain::AgentState& agent) const override;

  double stepCap(const WaterfallStep& step, const domain::AgentState& agent,
                 const ReactionContext& ctx) const override;

  domain::SensitivityMap defaultSensitivities(
      const domain::AgentState& agent, const std::string& item) const override;

 private:
  WaterfallTable waterfall_;
};

}  // namespace liqsim
