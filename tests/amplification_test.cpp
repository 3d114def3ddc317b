// =============================================================================
// amplification_test.cpp
// =============================================================================
// Unit tests for the horizon loss accounting in engine/amplification.hpp.
//
// Validates:
//   - With no second-round loss every ratio is exactly 1.0
//   - Per-agent, per-type and system-wide ratios from known totals
//   - Epsilon flooring of agents that never lost anything
//   - Size mismatches and a non-positive epsilon are rejected
//   - summarizeRun() totals counters and hedge-fund repo flags
// =============================================================================

#include "liqsim/engine/amplification.hpp"

#include "test_population.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>
#include <vector>

using namespace liqsim;
using namespace liqsim_test;
using domain::HedgeFundProfile;
namespace vars = domain::vars;

namespace {

constexpr double kEps = 0.001;

}  // namespace

// =============================================================================
// Fixture: the mixed population, one LossTotals per agent.
//   0 Bank_A, 1 Bank_B, 2 HF_Macro, 3 HF_Low, 4 LDI_1, 5 Insurer_1, 6 Fund_1
// =============================================================================
class AmplificationTest : public ::testing::Test {
 protected:
  Population population = mixedPopulation();
  std::vector<LossTotals> totals =
      std::vector<LossTotals>(population.size());
};

// -----------------------------------------------------------------------------
// 1. Two days of Stage 1 losses with E2 = 0: every ratio is exactly 1.0.
// -----------------------------------------------------------------------------
TEST_F(AmplificationTest, NoFeedbackMeansExactlyOne) {
  for (int day = 0; day < 2; ++day) {
    for (std::size_t i = 0; i < population.size(); ++i) {
      auto& liq = population[i].liquidity;
      liq.B0 = 200.0;
      liq.E1 = 10.0 * static_cast<double>(i) + day;
      liq.B1 = liq.B0 - liq.E1;
      liq.B2 = liq.B1 + 3.0;
      liq.E2 = 0.0;
      liq.B3 = liq.B2;
    }
    accumulateLosses(population, totals);
  }

  const AmplificationReport report =
      computeAmplification(population, totals, kEps);
  for (const auto& entry : report.per_agent) {
    EXPECT_EQ(entry.second, 1.0) << entry.first;
  }
  for (const auto& entry : report.per_type) {
    EXPECT_EQ(entry.second, 1.0) << entry.first;
  }
  EXPECT_EQ(report.system_wide, 1.0);
}

// -----------------------------------------------------------------------------
// 2. Direct sums E1, total sums E1 + E2; mitigation does not count.
// -----------------------------------------------------------------------------
TEST_F(AmplificationTest, AccumulatesDirectAndTotal) {
  auto& liq = population[2].liquidity;
  liq.B0 = 200.0;
  liq.E1 = 80.0;
  liq.B1 = 120.0;
  liq.B2 = 170.0;  // 50 of mitigation
  liq.E2 = 20.0;
  liq.B3 = 150.0;

  accumulateLosses(population, totals);
  accumulateLosses(population, totals);

  EXPECT_DOUBLE_EQ(totals[2].direct, 160.0);
  EXPECT_DOUBLE_EQ(totals[2].total, 200.0);
  EXPECT_DOUBLE_EQ(totals[0].direct, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Ratios from known totals.
//      Bank_A   100 -> 125      1.25
//      HF_Macro 200 -> 200      1.00
//      HF_Low    50 -> 100      2.00
//      others     0 -> 0        eps / eps = 1
// -----------------------------------------------------------------------------
TEST_F(AmplificationTest, RatiosFromKnownTotals) {
  totals[0] = {100.0, 125.0};
  totals[2] = {200.0, 200.0};
  totals[3] = {50.0, 100.0};

  const AmplificationReport report =
      computeAmplification(population, totals, kEps);

  EXPECT_DOUBLE_EQ(report.per_agent.at("Bank_A"), 1.25);
  EXPECT_DOUBLE_EQ(report.per_agent.at("Bank_B"), 1.0);
  EXPECT_DOUBLE_EQ(report.per_agent.at("HF_Macro"), 1.0);
  EXPECT_DOUBLE_EQ(report.per_agent.at("HF_Low"), 2.0);
  EXPECT_DOUBLE_EQ(report.per_agent.at("Fund_1"), 1.0);

  EXPECT_NEAR(report.per_type.at("bank"), (125.0 + kEps) / (100.0 + kEps),
              1e-12);
  EXPECT_DOUBLE_EQ(report.per_type.at("hedge_fund"), 300.0 / 250.0);
  EXPECT_DOUBLE_EQ(report.per_type.at("insurer"), 1.0);
  EXPECT_EQ(report.per_type.size(), 5u);

  const double floored = 4 * kEps;  // Bank_B, LDI_1, Insurer_1, Fund_1
  EXPECT_NEAR(report.system_wide,
              (425.0 + floored) / (350.0 + floored), 1e-12);
}

// -----------------------------------------------------------------------------
// 4. An agent with no direct loss but some feedback is floored at epsilon,
//    so the ratio is large but finite.
// -----------------------------------------------------------------------------
TEST_F(AmplificationTest, EpsilonFloorsTinyDirectLoss) {
  totals[6] = {0.0, 0.5};
  const AmplificationReport report =
      computeAmplification(population, totals, kEps);
  EXPECT_NEAR(report.per_agent.at("Fund_1"), 0.5 / kEps, 1e-9);
}

// -----------------------------------------------------------------------------
// 5. Mismatched sizes and a non-positive epsilon are rejected.
// -----------------------------------------------------------------------------
TEST_F(AmplificationTest, RejectsBadInput) {
  std::vector<LossTotals> short_totals(3);
  EXPECT_THROW(accumulateLosses(population, short_totals),
               std::invalid_argument);
  EXPECT_THROW(computeAmplification(population, short_totals, kEps),
               std::invalid_argument);
  EXPECT_THROW(computeAmplification(population, totals, 0.0),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 6. summarizeRun adds counters over the population; bank gilt sales are not
//    counted as non-bank selling.
// -----------------------------------------------------------------------------
TEST(RunSummaryTest, TotalsCountersAndFlags) {
  domain::SimulationConfig config = quietConfig();
  MarketState market(config.market);
  market.applyExogenousScenario(0, {{vars::kGilt10y, 75.0},
                                    {vars::kIgSpread, 12.0}});

  Population population = mixedPopulation();
  population[0].counters.gilt_sales = 500.0;  // bank
  population[0].counters.asset_sales = 500.0;
  population[0].ever_reacted = true;
  population[2].counters.gilt_sales = 300.0;
  population[2].counters.asset_sales = 350.0;
  population[2].counters.margin_calls = 40.0;
  population[2].counters.repo_demand = 600.0;
  population[2].ever_reacted = true;
  population[4].counters.gilt_sales = 100.0;
  population[4].counters.margin_calls = 60.0;

  auto& hf = population[2].profileAs<HedgeFundProfile>();
  hf.has_ever_sought_repo = true;
  hf.repo_refused_by_all = true;
  population[3].profileAs<HedgeFundProfile>().has_ever_sought_repo = true;

  const RunSummary summary = summarizeRun(population, market);
  EXPECT_EQ(summary.total_agents, 7u);
  EXPECT_EQ(summary.agents_reacted, 2u);
  EXPECT_DOUBLE_EQ(summary.non_bank_gilt_sales, 400.0);
  EXPECT_DOUBLE_EQ(summary.total_asset_sales, 850.0);
  EXPECT_DOUBLE_EQ(summary.total_margin_calls, 100.0);
  EXPECT_DOUBLE_EQ(summary.total_repo_demand, 600.0);
  EXPECT_EQ(summary.hedge_funds_sought_repo, 2u);
  EXPECT_EQ(summary.hedge_funds_refused_by_all, 1u);
  EXPECT_DOUBLE_EQ(summary.final_gilt_10y, 75.0);
  EXPECT_DOUBLE_EQ(summary.final_ig_spread, 12.0);
  EXPECT_DOUBLE_EQ(summary.final_repo_availability, 1.0);
}
