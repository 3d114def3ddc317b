#pragma once

#include <map>
#include <string>

namespace liqsim {
namespace domain {

// Market-variable identifier → value (level or day-over-day delta).
using VariableMap = std::map<std::string, double>;

// -----------------------------------------------------------------------------
// Market-variable identifiers
// -----------------------------------------------------------------------------
// Keys shared by scenario paths, balance-sheet sensitivities and the market
// state. Yields, spreads and basis are changes in bps; equity and FX are
// percent changes; haircut variables are percentage-point changes; vix is a
// level.
// -----------------------------------------------------------------------------
namespace vars {
inline constexpr const char* kGilt10y = "gilt_10y_yield";
inline constexpr const char* kGilt30y = "gilt_30y_yield";
inline constexpr const char* kIndexLinkedGilt = "il_gilt_yield";
inline constexpr const char* kUst10y = "ust_10y_yield";
inline constexpr const char* kIgSpread = "ig_corp_spread";
inline constexpr const char* kHySpread = "hy_corp_spread";
inline constexpr const char* kEquity = "equity";
inline constexpr const char* kSoniaSwap = "sonia_swap";
inline constexpr const char* kFxGbpUsd = "fx_gbpusd";
inline constexpr const char* kRepoHaircutGilt = "repo_haircut_gilt";
inline constexpr const char* kRepoHaircutCorp = "repo_haircut_corp";
inline constexpr const char* kBondFuturesBasis = "bond_futures_basis";
inline constexpr const char* kVix = "vix";
}  // namespace vars

// Value of `key` in `values`, or `fallback` when absent.
inline double valueOr(const VariableMap& values, const std::string& key,
                      double fallback = 0.0) {
  auto it = values.find(key);
  return it != values.end() ? it->second : fallback;
}

}  // namespace domain
}  // namespace liqsim
