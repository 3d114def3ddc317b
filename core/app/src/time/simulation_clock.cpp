#include "liqsim/time/simulation_clock.hpp"

#include <stdexcept>
#include <string>

namespace liqsim {

using domain::DayPhase;

namespace domain {

const char* toString(DayPhase phase) {
  switch (phase) {
    case DayPhase::Idle:
      return "idle";
    case DayPhase::ScenarioApplied:
      return "scenario_applied";
    case DayPhase::Shocked:
      return "shocked";
    case DayPhase::Reacted:
      return "reacted";
    case DayPhase::Registered:
      return "registered";
    case DayPhase::Absorbed:
      return "absorbed";
    case DayPhase::FeedbackApplied:
      return "feedback_applied";
    case DayPhase::Recorded:
      return "recorded";
    case DayPhase::Committed:
      return "committed";
    case DayPhase::Finished:
      return "finished";
  }
  return "unknown";
}

}  // namespace domain

SimulationClock::SimulationClock(int horizon_days)
    : horizon_days_(horizon_days) {
  if (horizon_days < 1) {
    throw std::invalid_argument("SimulationClock: horizon_days must be >= 1");
  }
}

// -----------------------------------------------------------------------------
// isValidTransition: the intra-day graph from day_phase.hpp
// -----------------------------------------------------------------------------
bool SimulationClock::isValidTransition(DayPhase current, DayPhase next) {
  using P = DayPhase;

  switch (current) {
    case P::Idle:
      return next == P::ScenarioApplied;
    case P::ScenarioApplied:
      return next == P::Shocked;
    case P::Shocked:
      return next == P::Reacted;
    case P::Reacted:
      return next == P::Registered;
    case P::Registered:
      return next == P::Absorbed;
    case P::Absorbed:
      return next == P::FeedbackApplied;
    case P::FeedbackApplied:
      return next == P::Recorded;
    case P::Recorded:
      return next == P::Committed;
    case P::Committed:
      return next == P::ScenarioApplied ||
             next == P::Finished;
    case P::Finished:
      return false;
  }

  return false;
}

void SimulationClock::beginDay() {
  if (phase_ == DayPhase::Committed) {
    if (isLastDay()) {
      throw std::logic_error("SimulationClock: day " + std::to_string(day_) +
                             " is the last day of the horizon");
    }
    ++day_;
  } else if (phase_ != DayPhase::Idle) {
    throw std::logic_error(
        std::string("SimulationClock: cannot begin a day from phase ") +
        domain::toString(phase_));
  }
  phase_ = DayPhase::ScenarioApplied;
}

void SimulationClock::advanceTo(DayPhase next) {
  if (next == DayPhase::ScenarioApplied) {
    beginDay();
    return;
  }
  if (!isValidTransition(phase_, next)) {
    throw std::logic_error(std::string("SimulationClock: illegal transition ") +
                           domain::toString(phase_) + " -> " +
                           domain::toString(next) + " on day " +
                           std::to_string(day_));
  }
  if (next == DayPhase::Finished && !isLastDay()) {
    throw std::logic_error("SimulationClock: cannot finish on day " +
                           std::to_string(day_) + " of " +
                           std::to_string(horizon_days_));
  }
  phase_ = next;
}

}  // namespace liqsim
