#include "liqsim/domain/agent_state.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <variant>

namespace liqsim {
namespace domain {

const char* toString(ActionClass action_class) {
  switch (action_class) {
    case ActionClass::AssetSale:
      return "asset_sale";
    case ActionClass::Repo:
      return "repo";
    case ActionClass::RepoLendingCut:
      return "repo_lending_cut";
    case ActionClass::CentralBankFacility:
      return "central_bank_facility";
    case ActionClass::Redemption:
      return "redemption";
    case ActionClass::Other:
      return "other";
  }
  return "unknown";
}

double AgentState::actionTotal() const {
  double total = 0.0;
  for (const auto& action : actions) {
    total += action.amount;
  }
  return total;
}

double AgentState::actionAmount(const std::string& action_name) const {
  for (const auto& action : actions) {
    if (action.name == action_name) {
      return action.amount;
    }
  }
  return 0.0;
}

namespace {

void requireNonNegative(double value, const AgentState& agent,
                        const std::string& field) {
  if (!std::isfinite(value) || value < 0.0) {
    throw std::invalid_argument("agent '" + agent.name + "': " + field +
                                " must be finite and >= 0, got " +
                                std::to_string(value));
  }
}

void requireFraction(double value, const AgentState& agent,
                     const std::string& field) {
  if (!(value >= 0.0 && value <= 1.0)) {
    throw std::invalid_argument("agent '" + agent.name + "': " + field +
                                " must be in [0, 1], got " +
                                std::to_string(value));
  }
}

void requireLeverage(double value, const AgentState& agent) {
  if (!std::isfinite(value) || value < 1.0) {
    throw std::invalid_argument("agent '" + agent.name +
                                "': leverage must be finite and >= 1, got " +
                                std::to_string(value));
  }
}

// -----------------------------------------------------------------------------
// Per-variant profile checks, run once before day 0.
// -----------------------------------------------------------------------------
struct ProfileValidator {
  const AgentState& agent;

  void operator()(const BankProfile& p) const {
    requireFraction(p.risk_appetite, agent, "risk_appetite");
    requireFraction(p.willingness_new_repo, agent, "willingness_new_repo");
    requireFraction(p.willingness_roll_repo, agent, "willingness_roll_repo");
    requireNonNegative(p.repo_capacity, agent, "repo_capacity");
    requireNonNegative(p.gilt_mm_capacity, agent, "gilt_mm_capacity");
    requireNonNegative(p.gilt_mm_used, agent, "gilt_mm_used");
    requireNonNegative(p.corp_mm_capacity, agent, "corp_mm_capacity");
    requireNonNegative(p.corp_mm_used, agent, "corp_mm_used");
    if (p.gilt_mm_used > p.gilt_mm_capacity ||
        p.corp_mm_used > p.corp_mm_capacity) {
      throw std::invalid_argument("agent '" + agent.name +
                                  "': market-making capacity already "
                                  "exceeded");
    }
  }

  void operator()(const HedgeFundProfile& p) const {
    requireNonNegative(p.aum, agent, "aum");
    requireLeverage(p.leverage, agent);
    requireNonNegative(p.var_utilisation, agent, "var_utilisation");
  }

  void operator()(const LdiProfile& p) const {
    requireLeverage(p.leverage, agent);
    requireNonNegative(p.yield_buffer_bps, agent, "yield_buffer_bps");
    requireNonNegative(p.recap_capacity, agent, "recap_capacity");
    requireNonNegative(p.recap_speed_days, agent, "recap_speed_days");
  }

  void operator()(const InsurerProfile& p) const {
    requireFraction(p.hedge_ratio, agent, "hedge_ratio");
    requireFraction(p.dirty_csa_fraction, agent, "dirty_csa_fraction");
  }

  void operator()(const FundComplexProfile& p) const {
    requireFraction(p.pension_investor_pct, agent, "pension_investor_pct");
    requireFraction(p.insurer_investor_pct, agent, "insurer_investor_pct");
  }
};

// The AgentProfile alternatives are declared in AgentType order.
bool profileMatchesType(const AgentState& agent) {
  return agent.profile.index() == static_cast<std::size_t>(agent.type);
}

}  // namespace

void validatePopulation(const Population& population) {
  if (population.empty()) {
    throw std::invalid_argument("population is empty");
  }

  std::unordered_set<std::string> names;
  for (std::size_t i = 0; i < population.size(); ++i) {
    const AgentState& agent = population[i];

    if (agent.id != i) {
      throw std::invalid_argument(
          "agent at index " + std::to_string(i) + " has id " +
          std::to_string(agent.id) + "; ids must equal population index");
    }
    if (agent.name.empty()) {
      throw std::invalid_argument("agent at index " + std::to_string(i) +
                                  " has an empty name");
    }
    if (!names.insert(agent.name).second) {
      throw std::invalid_argument("duplicate agent name: " + agent.name);
    }
    if (!profileMatchesType(agent)) {
      throw std::invalid_argument("agent '" + agent.name +
                                  "': profile does not match type " +
                                  toString(agent.type));
    }

    std::visit(ProfileValidator{agent}, agent.profile);

    requireNonNegative(agent.size, agent, "size");
    requireNonNegative(agent.theta, agent, "theta");
    requireNonNegative(agent.buffer_usability, agent, "buffer_usability");
    if (agent.theta == 0.0) {
      throw std::invalid_argument("agent '" + agent.name +
                                  "': theta must be > 0");
    }

    for (const auto& item : agent.balance_sheet) {
      requireNonNegative(item.amount, agent, "item '" + item.name + "'");
      for (const auto& [variable, sensitivity] : item.sensitivities) {
        if (!std::isfinite(sensitivity)) {
          throw std::invalid_argument("agent '" + agent.name + "': item '" +
                                      item.name + "' sensitivity to " +
                                      variable + " is not finite");
        }
      }
    }
  }
}

}  // namespace domain
}  // namespace liqsim
