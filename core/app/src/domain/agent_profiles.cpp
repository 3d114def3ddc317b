#include "liqsim/domain/agent_profiles.hpp"

#include <stdexcept>

namespace liqsim {
namespace domain {

double repoDependenceMultiplier(RepoDependence dependence) {
  switch (dependence) {
    case RepoDependence::Low:
      return 0.2;
    case RepoDependence::Medium:
      return 0.5;
    case RepoDependence::High:
      return 0.8;
    case RepoDependence::VeryHigh:
      return 1.0;
  }
  return 0.5;
}

const char* toString(HedgeFundStrategy strategy) {
  switch (strategy) {
    case HedgeFundStrategy::MacroRates:
      return "macro_rates";
    case HedgeFundStrategy::RelativeValue:
      return "relative_value";
    case HedgeFundStrategy::LongShortEquity:
      return "long_short_equity";
    case HedgeFundStrategy::CreditLongShort:
      return "credit_long_short";
    case HedgeFundStrategy::MultiStrategy:
      return "multi_strategy";
  }
  return "unknown";
}

const char* toString(RepoDependence dependence) {
  switch (dependence) {
    case RepoDependence::Low:
      return "low";
    case RepoDependence::Medium:
      return "medium";
    case RepoDependence::High:
      return "high";
    case RepoDependence::VeryHigh:
      return "very_high";
  }
  return "unknown";
}

HedgeFundStrategy parseHedgeFundStrategy(const std::string& name) {
  if (name == "macro_rates") return HedgeFundStrategy::MacroRates;
  if (name == "relative_value") return HedgeFundStrategy::RelativeValue;
  if (name == "long_short_equity") return HedgeFundStrategy::LongShortEquity;
  if (name == "credit_long_short") return HedgeFundStrategy::CreditLongShort;
  if (name == "multi_strategy") return HedgeFundStrategy::MultiStrategy;
  throw std::invalid_argument("unknown hedge fund strategy: " + name);
}

RepoDependence parseRepoDependence(const std::string& name) {
  if (name == "low") return RepoDependence::Low;
  if (name == "medium") return RepoDependence::Medium;
  if (name == "high") return RepoDependence::High;
  if (name == "very_high") return RepoDependence::VeryHigh;
  throw std::invalid_argument("unknown repo dependence: " + name);
}

}  // namespace domain
}  // namespace liqsim
