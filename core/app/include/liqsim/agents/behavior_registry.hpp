#pragma once

#include "liqsim/agents/bank_behavior.hpp"
#include "liqsim/agents/fund_complex_behavior.hpp"
#include "liqsim/agents/hedge_fund_behavior.hpp"
#include "liqsim/agents/insurer_behavior.hpp"
#include "liqsim/agents/ldi_behavior.hpp"

namespace liqsim {

// -----------------------------------------------------------------------------
// BehaviorRegistry: AgentType → IAgentBehavior
// -----------------------------------------------------------------------------
//
// Owns one stateless instance of each variant behavior. The Simulation holds
// a registry by value; JSON population parsing uses one to fill in default
// sensitivities.
// -----------------------------------------------------------------------------
class BehaviorRegistry {
 public:
  const IAgentBehavior& behaviorFor(domain::AgentType type) const;

 private:
  BankBehavior bank_;
  HedgeFundBehavior hedge_fund_;
  LdiBehavior ldi_;
  InsurerBehavior insurer_;
  FundComplexBehavior fund_complex_;
};

}  // namespace liqsim
