#include "liqsim/domain/scenario.hpp"

#include <cmath>
#include <stdexcept>

namespace liqsim {
namespace domain {

VariableMap Scenario::levelsFor(int day) const {
  if (day < 0 || day >= horizon_days) {
    throw std::out_of_range("scenario day " + std::to_string(day) +
                            " outside horizon of " +
                            std::to_string(horizon_days));
  }

  VariableMap levels;
  for (const auto& [variable, path] : variable_paths) {
    levels[variable] = path.at(static_cast<std::size_t>(day));
  }
  return levels;
}

VariableMap Scenario::deltaFor(int day) const {
  VariableMap delta = levelsFor(day);
  if (day == 0) {
    return delta;
  }

  const VariableMap previous = levelsFor(day - 1);
  for (auto& [variable, value] : delta) {
    value -= valueOr(previous, variable);
  }
  return delta;
}

void Scenario::validate() const {
  if (horizon_days <= 0) {
    throw std::invalid_argument("scenario '" + name +
                                "': horizon_days must be > 0, got " +
                                std::to_string(horizon_days));
  }
  if (variable_paths.empty()) {
    throw std::invalid_argument("scenario '" + name +
                                "': no variable paths given");
  }

  for (const auto& [variable, path] : variable_paths) {
    if (path.size() != static_cast<std::size_t>(horizon_days)) {
      throw std::invalid_argument(
          "scenario '" + name + "': path for '" + variable + "' has " +
          std::to_string(path.size()) + " values, expected " +
          std::to_string(horizon_days));
    }
    for (std::size_t day = 0; day < path.size(); ++day) {
      if (!std::isfinite(path[day])) {
        throw std::invalid_argument("scenario '" + name + "': '" + variable +
                                    "' is not finite on day " +
                                    std::to_string(day));
      }
    }
  }
}

}  // namespace domain
}  // namespace liqsim
