#pragma once

#include <string>
#include <vector>

namespace liqsim {
namespace domain {

// -----------------------------------------------------------------------------
// ActionClass: how an action restores liquidity
// -----------------------------------------------------------------------------
//
// Selects the Stage 2 realization efficiency and whether the action feeds the
// market's selling / repo accumulators:
//
//   AssetSale           → bid/ask-dependent efficiency, selling pressure
//   Repo                → market repo availability, repo demand
//   RepoLendingCut      → market repo availability; a lender pulling repo
//                         adds no repo demand
//   CentralBankFacility → fixed (~95%)
//   Redemption          → fixed (~90%)
//   Other               → fixed (~80%): collateral posting, recap, line draws
// -----------------------------------------------------------------------------
enum class ActionClass {
  AssetSale,
  Repo,
  RepoLendingCut,
  CentralBankFacility,
  Redemption,
  Other,
};

// -----------------------------------------------------------------------------
// AgentAction: one executed waterfall step for the current day
// -----------------------------------------------------------------------------
struct AgentAction {
  std::string name;  // e.g. "sell_gilts", "seek_repo"
  ActionClass action_class{ActionClass::Other};
  double amount{0.0};
  std::string item;  // balance-sheet item sold or drawn; empty when none
};

// Ordered in waterfall priority. Names are unique within a day.
using ActionList = std::vector<AgentAction>;

const char* toString(ActionClass action_class);

}  // namespace domain
}  // namespace liqsim
