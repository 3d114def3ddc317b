#pragma once

#include "liqsim/domain/day_phase.hpp"

namespace liqsim {

// -----------------------------------------------------------------------------
// SimulationClock: day counter plus phase validation
// -----------------------------------------------------------------------------
//
// @brief  Tracks which simulated day the run is on and which phase of that
//         day has completed, and refuses out-of-order progress.
//
// @details
// The Simulation calls advanceTo() after each step of the daily loop. An
// illegal transition (skipping a phase, going backwards, starting a day past
// the horizon) throws std::logic_error: it can only come from a broken loop,
// never from user input.
//
// Day numbering starts at 0. beginDay() moves Idle → day 0 and
// Committed(day d) → day d + 1.
//
// Thread model:
//   Not thread-safe. Owned and driven by the simulation thread.
// -----------------------------------------------------------------------------
class SimulationClock {
 public:
  // Throws std::invalid_argument when horizon_days < 1.
  explicit SimulationClock(int horizon_days);

  // Starts the next day (phase becomes ScenarioApplied).
  void beginDay();

  // Moves to `next` within the current day, or to Finished after the last
  // day has been committed.
  void advanceTo(domain::DayPhase next);

  // Pure transition rule; does not consult the horizon.
  static bool isValidTransition(domain::DayPhase current,
                                domain::DayPhase next);

  int day() const { return day_; }
  int horizonDays() const { return horizon_days_; }
  domain::DayPhase phase() const { return phase_; }
  bool isLastDay() const { return day_ == horizon_days_ - 1; }
  bool isFinished() const { return phase_ == domain::DayPhase::Finished; }

 private:
  int horizon_days_;
  int day_{0};
  domain::DayPhase phase_{domain::DayPhase::Idle};
};

}  // namespace liqsim
