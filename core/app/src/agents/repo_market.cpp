#include "liqsim/agents/repo_market.hpp"

#include <algorithm>

namespace liqsim {

using domain::AgentState;
using domain::BankProfile;

double assessRepoRequest(const AgentState& bank, const AgentState& requester,
                         double amount, const RelationshipNetwork& network,
                         const domain::SimulationConfig& config) {
  const auto kind = bankEdgeKindFor(requester.type);
  if (!kind || !network.connected(requester.id, bank.id, *kind)) {
    return 0.0;
  }

  const BankProfile& profile = bank.profileAs<BankProfile>();
  const double stress =
      bank.liquidity.E1 / std::max(bank.liquidity.B0, config.min_buffer);
  const double stress_scaling = std::max(
      0.0, 1.0 - stress / config.bank.repo_refusal_stress_threshold);

  const double willing = profile.repo_capacity * profile.willingness_new_repo *
                         profile.risk_appetite * stress_scaling;
  return std::max(0.0, std::min(amount, willing));
}

RepoOutcome seekRepo(const AgentState& requester, double ask,
                     const ReactionContext& ctx) {
  RepoOutcome outcome;
  outcome.asked = ask;

  const auto& banks = ctx.network.connectedBanks(requester.id);
  outcome.banks_contacted = banks.size();
  if (banks.empty() || ask <= 0.0) {
    return outcome;
  }

  const double per_bank = ask / static_cast<double>(banks.size());
  for (domain::AgentId bank_id : banks) {
    outcome.granted += assessRepoRequest(ctx.agents[bank_id], requester,
                                         per_bank, ctx.network, ctx.config);
  }
  outcome.refused_by_all = outcome.granted <= 0.0;
  return outcome;
}

void tightenRepoWillingness(AgentState& bank,
                            const domain::SimulationConfig& config) {
  BankProfile& profile = bank.profileAs<BankProfile>();
  const double cut =
      (1.0 - profile.risk_appetite) * config.bank.tightening_rate;
  profile.willingness_new_repo =
      std::max(0.0, profile.willingness_new_repo - cut);
  profile.willingness_roll_repo =
      std::max(config.bank.roll_willingness_floor,
               profile.willingness_roll_repo - cut * 0.5);
}

}  // namespace liqsim
