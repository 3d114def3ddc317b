#pragma once

#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/agent_type.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace liqsim {

// -----------------------------------------------------------------------------
// Simulation events
// -----------------------------------------------------------------------------
//
// @brief  Notifications published by the Simulation on its EventBus while a
//         run is in progress.
//
// @details
// Every event carries the simulated `day` it belongs to and a
// `sequence_id` that increases by one per published event over the whole
// run, so a subscriber can order events without relying on wall-clock time.
//
// Thread model:
//   Plain data with value semantics. Published and consumed on the
//   simulation thread.
// -----------------------------------------------------------------------------

// Scenario levels for `day` have been applied to the market.
struct DayStartedEvent {
  int day{0};
  double vix{0.0};
  double stress_intensity{1.0};
  std::uint64_t sequence_id{0};
};

// An agent crossed its effective threshold and ran its waterfall.
struct AgentReactedEvent {
  int day{0};
  domain::AgentId agent_id{0};
  std::string agent_name;
  domain::AgentType agent_type{domain::AgentType::Bank};
  double stress_ratio{0.0};   // E1 / B0
  double action_total{0.0};   // Σ today's action amounts
  double unmet_shortfall{0.0};
  std::uint64_t sequence_id{0};
};

// Every bank connected to a hedge fund refused its repo request today.
struct RepoRefusedEvent {
  int day{0};
  domain::AgentId agent_id{0};
  std::string agent_name;
  std::size_t banks_contacted{0};
  std::uint64_t sequence_id{0};
};

// The day's snapshot has been recorded.
struct DayCompletedEvent {
  int day{0};
  std::size_t agents_reacted{0};
  double total_e1{0.0};
  double total_e2{0.0};
  double gilt_selling{0.0};
  double corp_selling{0.0};
  std::uint64_t sequence_id{0};
};

}  // namespace liqsim
