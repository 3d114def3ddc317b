#pragma once

#include "liqsim/agents/behavior_registry.hpp"
#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/scenario.hpp"
#include "liqsim/domain/simulation_config.hpp"
#include "liqsim/engine/run_result.hpp"
#include "liqsim/eventbus/event_bus.hpp"
#include "liqsim/feedback/feedback_engine.hpp"
#include "liqsim/market/market_state.hpp"
#include "liqsim/network/relationship_network.hpp"
#include "liqsim/time/simulation_clock.hpp"

#include <cstdint>
#include <vector>

namespace liqsim {

// -----------------------------------------------------------------------------
// Simulation
// -----------------------------------------------------------------------------
//
// @brief  Owns one run: the population, the relationship network, the market
//         state and the day loop that drives the three-stage mechanics.
//
// @details
// Each simulated day runs these steps in order, with the SimulationClock
// validating every phase change:
//
//   1. ScenarioApplied  deltas derived (day 0 against zero), scenario levels
//                       applied, daily state reset, B0 recomputed.
//   2. Shocked          provisional Stage 1 for everyone, then redemption
//                       demand and the final Stage 1.
//   3. Reacted          waterfalls and Stage 2.
//   4. Registered       every agent posts its sales and repo to the market.
//   5. Absorbed         banks absorb the day's total selling pro-rata to
//                       remaining capacity; reacting banks tighten repo.
//   6. FeedbackApplied  N feedback iterations (E2, B3).
//   7. Recorded         loss totals accumulated, snapshots taken.
//   8. Committed        sold holdings removed from balance sheets.
//
// Steps 2-5 finish for every agent before the next starts, so no agent sees
// another's same-stage output and results do not depend on population order.
// There is no randomness inside the loop; the only seed is the network
// builder's.
//
// Events (published synchronously on eventBus()):
//   DayStartedEvent, AgentReactedEvent, RepoRefusedEvent, DayCompletedEvent.
//
// Error handling:
//   The constructor throws std::invalid_argument for an invalid config,
//   scenario, population, or a network that does not match the population.
//   A negative or NaN derived quantity during the run throws
//   std::domain_error. run() may be called once; a second call throws
//   std::logic_error.
//
// Thread model:
//   Single-threaded. run() executes entirely on the caller's thread.
//
// Ownership:
//   Simulation
//    ├── config_     (SimulationConfig: immutable copy)
//    ├── scenario_   (Scenario: immutable copy)
//    ├── agents_     (Population: the only mutable agent state)
//    ├── network_    (RelationshipNetwork: immutable after construction)
//    ├── market_     (MarketState)
//    ├── behaviors_  (BehaviorRegistry: stateless strategy objects)
//    ├── feedback_   (FeedbackEngine)
//    ├── clock_      (SimulationClock)
//    └── bus_        (EventBus)
// -----------------------------------------------------------------------------
class Simulation {
 public:
  Simulation(domain::SimulationConfig config, domain::Scenario scenario,
             domain::Population population, RelationshipNetwork network);

  // Builds the network from the population with buildNetwork(seed).
  Simulation(domain::SimulationConfig config, domain::Scenario scenario,
             domain::Population population, std::uint64_t network_seed);

  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  // ---------------------------------------------------------------------------
  // run()
  // ---------------------------------------------------------------------------
  // @brief  Simulates every day of the scenario horizon.
  //
  // @return Daily agent and market snapshots, day-0 buffers, amplification
  //         ratios, the run summary and the network summary.
  // ---------------------------------------------------------------------------
  RunResult run();

  EventBus& eventBus() { return bus_; }

  const domain::Population& agents() const { return agents_; }
  const RelationshipNetwork& network() const { return network_; }
  const MarketState& market() const { return market_; }
  const SimulationClock& clock() const { return clock_; }
  const domain::SimulationConfig& config() const { return config_; }

 private:
  void runDay(int day, RunResult& result);

  void applyScenario(int day);
  void computeShocks(const domain::VariableMap& day_delta);
  void computeReactionsForAll(int day);
  void registerAll();
  AbsorptionTotals absorbAndTighten();
  DaySnapshot recordDay(int day, const AbsorptionTotals& absorbed) const;

  const IAgentBehavior& behaviorOf(const domain::AgentState& agent) const;
  std::uint64_t nextSequence() { return next_sequence_++; }

  domain::SimulationConfig config_;
  domain::Scenario scenario_;
  domain::Population agents_;
  RelationshipNetwork network_;
  MarketState market_;
  BehaviorRegistry behaviors_;
  FeedbackEngine feedback_;
  SimulationClock clock_;
  EventBus bus_;

  std::vector<LossTotals> losses_;
  std::uint64_t next_sequence_{0};
};

}  // namespace liqsim
