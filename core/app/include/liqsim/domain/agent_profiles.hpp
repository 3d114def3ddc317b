#pragma once

#include <string>
#include <variant>

namespace liqsim {
namespace domain {

// -----------------------------------------------------------------------------
// Variant-specific behavioral parameters
// -----------------------------------------------------------------------------
//
// @brief  One plain struct per agent variant, held by AgentState in the
//         AgentProfile variant. The alternative order matches AgentType.
//
// @details
// Profiles are fully resolved by the (external) population producer. The
// engine mutates only the fields documented as run state: bank willingness
// and market-making consumption, LDI remaining recap capacity, hedge-fund
// repo flags and the fund-complex gate.
// -----------------------------------------------------------------------------

struct BankProfile {
  double risk_appetite{0.5};  // in [0, 1]
  double repo_capacity{0.0};  // new repo the bank can extend, GBP mm

  // Run state: degraded when the bank reacts, never restored.
  double willingness_new_repo{1.0};
  double willingness_roll_repo{1.0};

  // Market-making capacity. `used` accumulates over the whole horizon and is
  // never replenished.
  double gilt_mm_capacity{0.0};
  double gilt_mm_used{0.0};
  double corp_mm_capacity{0.0};
  double corp_mm_used{0.0};

  double giltRemaining() const { return gilt_mm_capacity - gilt_mm_used; }
  double corpRemaining() const { return corp_mm_capacity - corp_mm_used; }
};

enum class HedgeFundStrategy {
  MacroRates,
  RelativeValue,
  LongShortEquity,
  CreditLongShort,
  MultiStrategy,
};

enum class RepoDependence {
  Low,
  Medium,
  High,
  VeryHigh,
};

struct HedgeFundProfile {
  HedgeFundStrategy strategy{HedgeFundStrategy::MacroRates};
  double aum{0.0};
  double leverage{1.0};
  RepoDependence repo_dependence{RepoDependence::Medium};
  double var_utilisation{0.5};

  // Run state.
  bool has_ever_sought_repo{false};
  bool repo_refused_today{false};
  bool repo_refused_by_all{false};  // sticky across the horizon
};

struct LdiProfile {
  bool pooled{false};
  double leverage{2.0};
  double yield_buffer_bps{250.0};
  double recap_capacity{0.0};     // remaining sponsor capacity (run state)
  double recap_speed_days{5.0};   // segregated schemes; pooled use 1
};

struct InsurerProfile {
  double hedge_ratio{0.5};
  double dirty_csa_fraction{0.0};
};

struct FundComplexProfile {
  double pension_investor_pct{0.2};
  double insurer_investor_pct{0.2};
  bool gated{false};  // run state: swing pricing / redemption gate active
};

using AgentProfile = std::variant<BankProfile, HedgeFundProfile, LdiProfile,
                                  InsurerProfile, FundComplexProfile>;

// Multiplier applied to the repo ask of a hedge fund.
double repoDependenceMultiplier(RepoDependence dependence);

const char* toString(HedgeFundStrategy strategy);
const char* toString(RepoDependence dependence);

// Both throw std::invalid_argument for an unknown name.
HedgeFundStrategy parseHedgeFundStrategy(const std::string& name);
RepoDependence parseRepoDependence(const std::string& name);

}  // namespace domain
}  // namespace liqsim
