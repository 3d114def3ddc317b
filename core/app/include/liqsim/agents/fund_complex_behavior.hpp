#pragma once

#include "liqsim/agents/i_agent_behavior.hpp"

namespace liqsim {

// -----------------------------------------------------------------------------
// computeRedemptionDemand(fund, ctx)
// -----------------------------------------------------------------------------
// @brief  Redemption demand placed on a fund-complex by its connected
//         redeemers today.
//
// @details
// Sums over every redeemer linked to `fund` whose provisional stress (Stage 1
// stress before network redemptions) exceeds its effective threshold:
//
//   size * rate * provisional stress * weight
//
//   weight: LDI         ldi_weight * fund's pension investor share
//           insurer     insurer_weight * fund's insurer investor share
//           hedge fund  hedge_fund_weight
//           fund        fund_complex_weight
//
// A gated fund receives (1 - gate_dampening) of the sum.
//
// Because every redeemer's provisional stress is computed before any fund
// reads it, the result does not depend on agent order, including for
// fund-complex cross holdings.
// -----------------------------------------------------------------------------
double computeRedemptionDemand(const domain::AgentState& fund,
                               const ReactionContext& ctx);

// -----------------------------------------------------------------------------
// FundComplexBehavior: open-ended funds and MMFs
// -----------------------------------------------------------------------------
//
// Buffer: cash buffer * 0.5, floored at 1% of size. No margin and no own
// investor base beyond the network redeemers.
//
// Waterfall (funds meet redemptions in full where they can):
//   1. use_cash_buffer        1.0 / the whole cash buffer
//   2. sell_gilts             1.0 / 0.20 of gilts
//   3. sell_corporate_bonds   1.0 / 0.20 of corporate bonds
//
// After Stage 2 the fund gates once cumulative redemptions / size exceed the
// gate threshold. The gate raises no cash; it dampens later demand.
// -----------------------------------------------------------------------------
class FundComplexBehavior final : public IAgentBehavior {
 public:
  FundComplexBehavior();

  domain::AgentType type() const override {
    return domain::AgentType::FundComplex;
  }

  double rawInitialBuffer(const domain::AgentState& agent) const override;
  double bufferFloorFraction() const override { return 0.01; }

  double marginCalls(const domain::AgentState& agent, const MarketState& market,
                     const domain::VariableMap& day_delta) const override;

  double ownRedemptions(const domain::AgentState& agent,
                        const MarketState& market,
                        const RelationshipNetwork& network) const override;

  double networkRedemptions(const domain::AgentState& agent,
                            const ReactionContext& ctx) const override;

  const WaterfallTable& waterfall(
      const domain::AgentState& agent) const override;

  void afterReactions(domain::AgentState& agent,
                      const domain::SimulationConfig& config) const override;

  domain::SensitivityMap defaultSensitivities(
      const domain::AgentState& agent, const std::string& item) const override;

 private:
  WaterfallTable waterfall_;
};

}  // namespace liqsim
