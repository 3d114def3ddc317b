#pragma once

#include "liqsim/agents/market_making.hpp"
#include "liqsim/domain/agent_action.hpp"
#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/agent_type.hpp"
#include "liqsim/domain/liquidity_position.hpp"
#include "liqsim/market/market_state.hpp"
#include "liqsim/network/relationship_network.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace liqsim {

// One agent at the end of one day.
struct AgentSnapshot {
  int day{0};
  domain::AgentId agent_id{0};
  std::string name;
  domain::AgentType type{domain::AgentType::Bank};
  domain::LiquidityPosition liquidity;
  domain::ShockBreakdown shock;
  bool reacted{false};
  domain::ActionList actions;
  domain::CumulativeCounters counters;
};

struct DaySnapshot {
  int day{0};
  MarketSnapshot market;
  AbsorptionTotals absorbed;          // taken onto bank market-making books
  std::vector<AgentSnapshot> agents;  // in population order
};

// Horizon sums of first-round (direct) and first-plus-second-round (total)
// losses for one agent.
struct LossTotals {
  double direct{0.0};
  double total{0.0};
};

// -----------------------------------------------------------------------------
// AmplificationReport
// -----------------------------------------------------------------------------
// Ratio total / direct of buffer depletion, per agent, per agent type and
// system-wide. Per-agent sums are floored at epsilon before aggregation, so
// an agent that never lost anything still counts as epsilon / epsilon.
// -----------------------------------------------------------------------------
struct AmplificationReport {
  std::map<std::string, double> per_agent;  // keyed by agent name
  std::map<std::string, double> per_type;   // keyed by toString(AgentType)
  double system_wide{1.0};
};

struct RunSummary {
  std::size_t total_agents{0};
  std::size_t agents_reacted{0};  // reacted on at least one day
  double total_margin_calls{0.0};
  double total_asset_sales{0.0};
  double non_bank_gilt_sales{0.0};
  double total_repo_demand{0.0};
  double final_gilt_10y{0.0};
  double final_ig_spread{0.0};
  double final_repo_availability{1.0};
  std::size_t hedge_funds_sought_repo{0};
  std::size_t hedge_funds_refused_by_all{0};
};

// Everything a run produces.
struct RunResult {
  std::string scenario_name;
  std::vector<DaySnapshot> days;
  std::map<std::string, double> initial_buffers;  // day-0 B0 by agent name
  AmplificationReport amplification;
  RunSummary summary;
  NetworkSummary network;
};

}  // namespace liqsim
