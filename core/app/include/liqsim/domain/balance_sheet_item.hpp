#pragma once

#include <map>
#include <string>
#include <vector>

namespace liqsim {
namespace domain {

// -----------------------------------------------------------------------------
// ItemCategory: accounting bucket of a balance-sheet line
// -----------------------------------------------------------------------------
enum class ItemCategory {
  LiquidAsset,
  IlliquidAsset,
  Liability,
  Equity,
  OffBalanceSheet,
};

// Market-variable identifier → fractional value change per unit move.
using SensitivityMap = std::map<std::string, double>;

// -----------------------------------------------------------------------------
// BalanceSheetItem: a single named position held by one agent
// -----------------------------------------------------------------------------
//
// @brief  Leaf data entity of the simulation. Carries the amount held, the
//         mark-to-market sensitivities and the flags the waterfalls read.
//
// @details
// Amounts are in GBP millions. The sensitivity map is keyed by market
// variable identifier (see domain/market_variables.hpp); an empty map means
// the item has no direct mark-to-market exposure.
//
//   eligible            → usable as pledgeable collateral / counted in B0
//   reaction_instrument → may be sold by a waterfall step
//
// Ownership:
//   Owned exclusively by one AgentState. Mutated only by realizeSales()
//   after the day's snapshot has been recorded.
// -----------------------------------------------------------------------------
struct BalanceSheetItem {
  std::string name;
  double amount{0.0};
  ItemCategory category{ItemCategory::LiquidAsset};
  SensitivityMap sensitivities;
  bool eligible{false};
  bool reaction_instrument{false};
  double haircut_pct{0.0};
};

using BalanceSheet = std::vector<BalanceSheetItem>;

// Canonical item names shared by the variant tables. Populations may carry
// additional items under other names; waterfalls only touch these.
namespace items {
inline constexpr const char* kGilts = "Gilt Holdings";
inline constexpr const char* kIndexLinkedGilts = "Index-Linked Gilts";
inline constexpr const char* kCorporateBonds = "Corporate Bonds";
inline constexpr const char* kEquity = "Equity Holdings";
inline constexpr const char* kBasisPositions = "Basis Positions";
inline constexpr const char* kCash = "Cash";
inline constexpr const char* kCashBuffer = "Cash Buffer";
inline constexpr const char* kMmfHoldings = "MMF Holdings";
inline constexpr const char* kBoeEligible = "BoE Eligible Collateral";
inline constexpr const char* kRepoLending = "Repo Lending";
inline constexpr const char* kRepoBorrowing = "Repo Borrowing";
inline constexpr const char* kDerivatives = "Derivatives";
inline constexpr const char* kWholesaleFunding = "Wholesale Funding";
inline constexpr const char* kCet1 = "CET1 Capital";
inline constexpr const char* kUnencumbered = "Unencumbered Collateral";
inline constexpr const char* kCommittedRepoLines = "Committed Repo Lines";
inline constexpr const char* kRevolvingCredit = "Revolving Credit Facility";
inline constexpr const char* kAbs = "ABS Holdings";
}  // namespace items

// Returns the first item with the given name, or nullptr.
const BalanceSheetItem* findItem(const BalanceSheet& sheet,
                                 const std::string& name);
BalanceSheetItem* findItem(BalanceSheet& sheet, const std::string& name);

// Amount of the named item, 0.0 when the agent does not hold it.
double itemAmount(const BalanceSheet& sheet, const std::string& name);

// Sum of asset-side amounts (liquid + illiquid); the agent's size proxy.
double totalAssets(const BalanceSheet& sheet);

const char* toString(ItemCategory category);

// Throws std::invalid_argument for an unknown name.
ItemCategory parseItemCategory(const std::string& name);

}  // namespace domain
}  // namespace liqsim
