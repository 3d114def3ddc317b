#include "liqsim/engine/amplification.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>

namespace liqsim {

using domain::AgentState;

void accumulateLosses(const domain::Population& agents,
                      std::vector<LossTotals>& totals) {
  if (totals.size() != agents.size()) {
    throw std::invalid_argument(
        "accumulateLosses: one LossTotals entry per agent required");
  }
  for (std::size_t i = 0; i < agents.size(); ++i) {
    const auto& liq = agents[i].liquidity;
    // (B0 - B3) + (B2 - B1) reduces to direct + E2; summed that way so a
    // day without feedback contributes identical direct and total.
    const double direct = liq.B0 - liq.B1;
    const double total = direct + liq.E2;
    totals[i].direct += direct;
    totals[i].total += total;
  }
}

AmplificationReport computeAmplification(const domain::Population& agents,
                                         const std::vector<LossTotals>& totals,
                                         double epsilon) {
  if (totals.size() != agents.size()) {
    throw std::invalid_argument(
        "computeAmplification: one LossTotals entry per agent required");
  }
  if (!(epsilon > 0.0)) {
    throw std::invalid_argument("computeAmplification: epsilon must be > 0");
  }

  AmplificationReport report;
  std::map<std::string, LossTotals> by_type;
  LossTotals system;

  for (std::size_t i = 0; i < agents.size(); ++i) {
    const double direct = std::max(totals[i].direct, epsilon);
    const double total = std::max(totals[i].total, epsilon);
    report.per_agent[agents[i].name] = total / direct;

    LossTotals& type_sum = by_type[domain::toString(agents[i].type)];
    type_sum.direct += direct;
    type_sum.total += total;
    system.direct += direct;
    system.total += total;
  }

  for (const auto& [type, sums] : by_type) {
    report.per_type[type] = sums.total / sums.direct;
  }
  report.system_wide =
      system.direct > 0.0 ? system.total / system.direct : 1.0;
  return report;
}

RunSummary summarizeRun(const domain::Population& agents,
                        const MarketState& market) {
  RunSummary summary;
  summary.total_agents = agents.size();

  for (const AgentState& agent : agents) {
    if (agent.ever_reacted) ++summary.agents_reacted;
    summary.total_margin_calls += agent.counters.margin_calls;
    summary.total_asset_sales += agent.counters.asset_sales;
    summary.total_repo_demand += agent.counters.repo_demand;
    if (!domain::isBank(agent.type)) {
      summary.non_bank_gilt_sales += agent.counters.gilt_sales;
    }
    const auto* hf = std::get_if<domain::HedgeFundProfile>(&agent.profile);
    if (hf != nullptr) {
      if (hf->has_ever_sought_repo) ++summary.hedge_funds_sought_repo;
      if (hf->repo_refused_by_all) ++summary.hedge_funds_refused_by_all;
    }
  }

  summary.final_gilt_10y = market.level(domain::vars::kGilt10y);
  summary.final_ig_spread = market.level(domain::vars::kIgSpread);
  summary.final_repo_availability = market.repoAvailability();
  return summary;
}

}  // namespace liqsim
