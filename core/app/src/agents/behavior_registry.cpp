#include "liqsim/agents/behavior_registry.hpp"

#include <stdexcept>

namespace liqsim {

const IAgentBehavior& BehaviorRegistry::behaviorFor(
    domain::AgentType type) const {
  switch (type) {
    case domain::AgentType::Bank:
      return bank_;
    case domain::AgentType::HedgeFund:
      return hedge_fund_;
    case domain::AgentType::LdiPension:
      return ldi_;
    case domain::AgentType::Insurer:
      return insurer_;
    case domain::AgentType::FundComplex:
      return fund_complex_;
  }
  throw std::invalid_argument("BehaviorRegistry: unknown agent type");
}

}  // namespace liqsim
