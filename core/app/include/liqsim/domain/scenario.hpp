#pragma once

#include "liqsim/domain/market_variables.hpp"

#include <map>
#include <string>
#include <vector>

namespace liqsim {
namespace domain {

// -----------------------------------------------------------------------------
// Scenario: exogenous market path for one run
// -----------------------------------------------------------------------------
//
// @brief  Day-indexed cumulative levels per market variable.
//
// @details
// Every path has exactly horizon_days entries. Values are cumulative levels
// (e.g. "+85 bps on the 10y gilt by day 2"), not daily moves; the engine
// derives deltas itself. Day 0's delta is measured against an implicit zero
// baseline.
//
// Produced by an external loader (or io::parseScenario) and validated once
// before day 0. Read-only thereafter.
// -----------------------------------------------------------------------------
struct Scenario {
  std::string name;
  int horizon_days{0};
  std::map<std::string, std::vector<double>> variable_paths;

  // Cumulative levels of every variable on `day`.
  VariableMap levelsFor(int day) const;

  // levelsFor(day) - levelsFor(day - 1); day 0 is measured against zero.
  VariableMap deltaFor(int day) const;

  // Throws std::invalid_argument if horizon_days <= 0, no paths are given, a
  // path length differs from horizon_days, or any value is not finite.
  void validate() const;
};

}  // namespace domain
}  // namespace liqsim
