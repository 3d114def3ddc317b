#pragma once

#include <array>
#include <string>

namespace liqsim {
namespace domain {

// -----------------------------------------------------------------------------
// AgentType: the five institution variants
// -----------------------------------------------------------------------------
//
// @brief  Tag selecting the behavior (waterfall table, sensitivity table,
//         buffer and margin rules) applied to an AgentState.
//
// @details
// Banks are the hubs of the relationship network. Every other variant is a
// non-bank financial institution (NBFI). FundComplex covers open-ended funds
// and money-market funds; it is the target of redemption actions.
// -----------------------------------------------------------------------------
enum class AgentType {
  Bank,
  HedgeFund,
  LdiPension,
  Insurer,
  FundComplex,
};

inline constexpr std::array<AgentType, 5> kAllAgentTypes{
    AgentType::Bank, AgentType::HedgeFund, AgentType::LdiPension,
    AgentType::Insurer, AgentType::FundComplex};

const char* toString(AgentType type);

// Throws std::invalid_argument for an unknown name.
AgentType parseAgentType(const std::string& name);

inline bool isBank(AgentType type) { return type == AgentType::Bank; }

}  // namespace domain
}  // namespace liqsim
