#include "liqsim/domain/agent_type.hpp"

#include <stdexcept>

namespace liqsim {
namespace domain {

const char* toString(AgentType type) {
  switch (type) {
    case AgentType::Bank:
      return "bank";
    case AgentType::HedgeFund:
      return "hedge_fund";
    case AgentType::LdiPension:
      return "ldi_pension";
    case AgentType::Insurer:
      return "insurer";
    case AgentType::FundComplex:
      return "fund_complex";
  }
  return "unknown";
}

AgentType parseAgentType(const std::string& name) {
  for (AgentType type : kAllAgentTypes) {
    if (name == toString(type)) {
      return type;
    }
  }
  throw std::invalid_argument("unknown agent type: " + name);
}

}  // namespace domain
}  // namespace liqsim
