#pragma once

namespace liqsim {
namespace domain {

// -----------------------------------------------------------------------------
// DayPhase: intra-day state machine of the simulation loop
// -----------------------------------------------------------------------------
//
// @brief  Every phase a simulated day passes through, in order.
//
// @details
// SimulationClock enforces the transition graph:
//
//   Idle ──> ScenarioApplied ──> Shocked ──> Reacted ──> Registered
//                 ▲                                          │
//                 │                                          ▼
//             Committed <── Recorded <── FeedbackApplied <── Absorbed
//                 │
//                 ▼
//             Finished   (only after the last day of the horizon)
//
// Idle is the state before day 0. Finished is terminal.
// -----------------------------------------------------------------------------
enum class DayPhase {
  Idle,
  ScenarioApplied,  // exogenous levels installed, daily state reset
  Shocked,          // Stage 1 done for every agent
  Reacted,          // waterfalls and Stage 2 done
  Registered,       // sales and repo posted to the market
  Absorbed,         // bank market making and repo tightening applied
  FeedbackApplied,  // Stage 3 iterations done
  Recorded,         // snapshots taken
  Committed,        // sales realized on balance sheets
  Finished,
};

const char* toString(DayPhase phase);

}  // namespace domain
}  // namespace liqsim
