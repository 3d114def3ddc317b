#pragma once

#include "liqsim/agents/i_agent_behavior.hpp"

namespace liqsim {

// -----------------------------------------------------------------------------
// BankBehavior: dealer banks, the hubs of the network
// -----------------------------------------------------------------------------
//
// @brief  Buffer, margin and waterfall rules for banks.
//
// @details
// Buffer:
//   B0 = BoE-eligible * 0.15 + CET1 * 0.08 - wholesale funding * 0.10
//   floored at 0.2% of size.
//
// Stage 1:
//   margin    = derivatives * |gilt 10y level| * 1e-4 * 0.05
//               + derivatives * (s - 1) * 0.005          when s > 1
//   run-off   = wholesale funding * (s - 2) * 0.02        when s > 2
//
// Waterfall (share of shortfall / cap):
//   1. draw_central_bank_facility  0.30 / 0.5 of BoE-eligible
//   2. reduce_repo_lending         0.30 / repo lending * (1 - appetite) * 0.3
//   3. sell_gilts                  0.10 / 0.20 of gilts
//   4. sell_corporate_bonds        0.08 / 0.02 of corporate bonds
//
// Market making, repo assessment and tightening are free functions
// (agents/market_making.hpp, agents/repo_market.hpp) because they act
// across agents rather than on the bank alone.
// -----------------------------------------------------------------------------
class BankBehavior final : public IAgentBehavior {
 public:
  BankBehavior();

  domain::AgentType type() const override { return domain::AgentType::Bank; }

  double rawInitialBuffer(const domain::AgentState& agent) const override;
  double bufferFloorFraction() const override { return 0.002; }

  double marginCalls(const domain::AgentState& agent, const MarketState& market,
                     const domain::VariableMap& day_delta) const override;

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
