// =============================================================================
// test_population.hpp
// =============================================================================
// Small hand-built agents, populations and scenarios shared by the test
// suites. Amounts are chosen so the hand-computed expectations in the tests
// stay readable.
// =============================================================================
#pragma once

#include "liqsim/agents/behavior_registry.hpp"
#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/balance_sheet_item.hpp"
#include "liqsim/domain/market_variables.hpp"
#include "liqsim/domain/scenario.hpp"
#include "liqsim/domain/simulation_config.hpp"

#include <string>
#include <utility>
#include <vector>

namespace liqsim_test {

using liqsim::domain::AgentId;
using liqsim::domain::AgentState;
using liqsim::domain::AgentType;
using liqsim::domain::BalanceSheetItem;
using liqsim::domain::ItemCategory;
using liqsim::domain::Population;

inline BalanceSheetItem item(const std::string& name, double amount,
                             ItemCategory category = ItemCategory::LiquidAsset,
                             bool reaction_instrument = true) {
  BalanceSheetItem i;
  i.name = name;
  i.amount = amount;
  i.category = category;
  i.eligible = category == ItemCategory::LiquidAsset;
  i.reaction_instrument = reaction_instrument;
  return i;
}

// Fills every item's sensitivities from the variant's default table.
inline void applyDefaultSensitivities(AgentState& agent) {
  const liqsim::BehaviorRegistry registry{};
  const auto& behavior = registry.behaviorFor(agent.type);
  for (auto& i : agent.balance_sheet) {
    i.sensitivities = behavior.defaultSensitivities(agent, i.name);
  }
}

inline void finish(AgentState& agent) {
  agent.size = liqsim::domain::totalAssets(agent.balance_sheet);
  applyDefaultSensitivities(agent);
}

// raw B0 = 2000 * 0.15 + 500 * 0.08 - 1000 * 0.10 = 240
inline AgentState makeBank(AgentId id, const std::string& name,
                           double repo_capacity = 1000.0,
                           double risk_appetite = 0.5,
                           double gilt_mm_capacity = 500.0,
                           double corp_mm_capacity = 200.0) {
  namespace items = liqsim::domain::items;
  AgentState a;
  a.id = id;
  a.name = name;
  a.type = AgentType::Bank;
  a.theta = 0.3;
  a.balance_sheet = {
      item(items::kBoeEligible, 2000.0),
      item(items::kGilts, 3000.0),
      item(items::kCorporateBonds, 1000.0),
      item(items::kRepoLending, 800.0),
      item(items::kCet1, 500.0, ItemCategory::Equity, false),
      item(items::kWholesaleFunding, 1000.0, ItemCategory::Liability, false),
      item(items::kDerivatives, 2000.0, ItemCategory::OffBalanceSheet, false),
  };

  liqsim::domain::BankProfile profile;
  profile.risk_appetite = risk_appetite;
  profile.repo_capacity = repo_capacity;
  profile.gilt_mm_capacity = gilt_mm_capacity;
  profile.corp_mm_capacity = corp_mm_capacity;
  a.profile = profile;
  finish(a);
  return a;
}

// B0 = cash = 200; size 4200.
inline AgentState makeHedgeFund(
    AgentId id, const std::string& name,
    liqsim::domain::RepoDependence dependence =
        liqsim::domain::RepoDependence::High) {
  namespace items = liqsim::domain::items;
  AgentState a;
  a.id = id;
  a.name = name;
  a.type = AgentType::HedgeFund;
  a.theta = 0.3;
  a.balance_sheet = {
      item(items::kCash, 200.0, ItemCategory::LiquidAsset, false),
      item(items::kGilts, 4000.0),
      item(items::kRepoBorrowing, 3000.0, ItemCategory::Liability, false),
  };

  liqsim::domain::HedgeFundProfile profile;
  profile.strategy = liqsim::domain::HedgeFundStrategy::MacroRates;
  profile.aum = 1000.0;
  profile.leverage = 4.0;
  profile.repo_dependence = dependence;
  profile.var_utilisation = 0.6;
  a.profile = profile;
  finish(a);
  return a;
}

inline AgentState makeLdi(AgentId id, const std::string& name) {
  namespace items = liqsim::domain::items;
  AgentState a;
  a.id = id;
  a.name = name;
  a.type = AgentType::LdiPension;
  a.theta = 0.3;
  a.balance_sheet = {
      item(items::kCash, 300.0, ItemCategory::LiquidAsset, false),
      item(items::kUnencumbered, 1000.0),
      item(items::kGilts, 5000.0),
      item(items::kIndexLinkedGilts, 1000.0),
      item(items::kCorporateBonds, 500.0),
      item(items::kDerivatives, 8000.0, ItemCategory::OffBalanceSheet, false),
      item(items::kRepoBorrowing, 1000.0, ItemCategory::Liability, false),
  };

  liqsim::domain::LdiProfile profile;
  profile.leverage = 3.0;
  profile.yield_buffer_bps = 250.0;
  profile.recap_capacity = 500.0;
  a.profile = profile;
  finish(a);
  return a;
}

inline AgentState makeInsurer(AgentId id, const std::string& name) {
  namespace items = liqsim::domain::items;
  AgentState a;
  a.id = id;
  a.name = name;
  a.type = AgentType::Insurer;
  a.theta = 0.3;
  a.balance_sheet = {
      item(items::kCash, 500.0, ItemCategory::LiquidAsset, false),
      item(items::kGilts, 6000.0),
      item(items::kCorporateBonds, 4000.0),
      item(items::kEquity, 2000.0),
      item(items::kDerivatives, 3000.0, ItemCategory::OffBalanceSheet, false),
      item(items::kCommittedRepoLines, 500.0, ItemCategory::OffBalanceSheet),
      item(items::kRevolvingCredit, 300.0, ItemCategory::OffBalanceSheet),
  };

  liqsim::domain::InsurerProfile profile;
  profile.hedge_ratio = 0.6;
  a.profile = profile;
  finish(a);
  return a;
}

inline AgentState makeFundComplex(AgentId id, const std::string& name,
                                  double cash_buffer = 300.0,
                                  double gilts = 2000.0,
                                  double corporate_bonds = 2000.0) {
  namespace items = liqsim::domain::items;
  AgentState a;
  a.id = id;
  a.name = name;
  a.type = AgentType::FundComplex;
  a.theta = 0.3;
  a.balance_sheet = {
      item(items::kCashBuffer, cash_buffer),
      item(items::kGilts, gilts),
      item(items::kCorporateBonds, corporate_bonds),
  };

  liqsim::domain::FundComplexProfile profile;
  profile.pension_investor_pct = 0.3;
  profile.insurer_investor_pct = 0.3;
  a.profile = profile;
  finish(a);
  return a;
}

// Two banks, two hedge funds, one LDI scheme, one insurer, one fund-complex.
inline Population mixedPopulation() {
  Population p;
  p.push_back(makeBank(0, "Bank_A"));
  p.push_back(makeBank(1, "Bank_B", 600.0, 0.3, 300.0, 100.0));
  p.push_back(makeHedgeFund(2, "HF_Macro"));
  p.push_back(makeHedgeFund(3, "HF_Low", liqsim::domain::RepoDependence::Low));
  p.push_back(makeLdi(4, "LDI_1"));
  p.push_back(makeInsurer(5, "Insurer_1"));
  p.push_back(makeFundComplex(6, "Fund_1"));
  return p;
}

// Rising gilt yields, wider spreads, falling equities and a vix spike.
inline liqsim::domain::Scenario stressScenario(int days = 3) {
  namespace vars = liqsim::domain::vars;
  liqsim::domain::Scenario s;
  s.name = "gilt_stress";
  s.horizon_days = days;
  for (int d = 0; d < days; ++d) {
    const double step = static_cast<double>(d + 1);
    s.variable_paths[vars::kGilt10y].push_back(50.0 * step);
    s.variable_paths[vars::kGilt30y].push_back(60.0 * step);
    s.variable_paths[vars::kIgSpread].push_back(20.0 * step);
    s.variable_paths[vars::kEquity].push_back(-4.0 * step);
    s.variable_paths[vars::kRepoHaircutGilt].push_back(1.0 * step);
    s.variable_paths[vars::kVix].push_back(20.0 + 10.0 * step);
  }
  return s;
}

// A scenario in which nothing moves.
inline liqsim::domain::Scenario calmScenario(int days = 2) {
  namespace vars = liqsim::domain::vars;
  liqsim::domain::Scenario s;
  s.name = "calm";
  s.horizon_days = days;
  s.variable_paths[vars::kGilt10y] = std::vector<double>(days, 0.0);
  s.variable_paths[vars::kVix] = std::vector<double>(days, 15.0);
  return s;
}

inline liqsim::domain::SimulationConfig quietConfig() {
  liqsim::domain::SimulationConfig config;
  config.verbose = false;
  return config;
}

}  // namespace liqsim_test
