// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the JSON codecs in io/json_codec.hpp.
//
// Validates:
//   - parseConfig() patches only what the document names and reports the
//     offending key on a type error
//   - parseScenario() requires horizon and paths and validates them
//   - parsePopulation() assigns ids by position, fills default sensitivities
//     only when the key is absent, and defaults size to total assets
//   - formatRunResult() carries every section of a run
//   - loadJsonFile() reports unreadable and malformed files
// =============================================================================

#include "liqsim/engine/simulation.hpp"
#include "liqsim/io/json_codec.hpp"

#include "test_population.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <string>

using namespace liqsim;
using namespace liqsim_test;
using nlohmann::json;
namespace items = domain::items;
namespace vars = domain::vars;

namespace {

template <typename Fn>
std::string invalidArgumentMessage(Fn fn) {
  try {
    fn();
  } catch (const std::invalid_argument& e) {
    return e.what();
  }
  return "";
}

const char* const kPopulationDoc = R"([
  { "name": "Bank_A", "type": "bank", "theta": 0.25,
    "balance_sheet": [
      { "name": "BoE Eligible Collateral", "amount": 2000 },
      { "name": "Wholesale Funding", "amount": 1000, "category": "liability",
        "reaction_instrument": false }
    ],
    "profile": { "risk_appetite": 0.4, "repo_capacity": 900,
                 "gilt_mm_capacity": 300 } },
  { "name": "HF_Macro", "type": "hedge_fund", "size": 9000,
    "balance_sheet": [
      { "name": "Cash", "amount": 200 },
      { "name": "Gilt Holdings", "amount": 4000 },
      { "name": "Corporate Bonds", "amount": 500, "sensitivities": {} },
      { "name": "Repo Borrowing", "amount": 3000, "category": "liability" }
    ],
    "profile": { "strategy": "macro_rates", "repo_dependence": "very_high",
                 "aum": 1000, "leverage": 4 } }
])";

}  // namespace

// -----------------------------------------------------------------------------
// 1. An empty document is the default calibration.
// -----------------------------------------------------------------------------
TEST(ParseConfigTest, EmptyDocumentGivesDefaults) {
  const domain::SimulationConfig config = io::parseConfig(json::object());
  const domain::SimulationConfig defaults;
  EXPECT_DOUBLE_EQ(config.market.base_vix, defaults.market.base_vix);
  EXPECT_EQ(config.feedback.iterations, defaults.feedback.iterations);
  EXPECT_DOUBLE_EQ(config.bank.repo_refusal_stress_threshold,
                   defaults.bank.repo_refusal_stress_threshold);
  EXPECT_TRUE(config.verbose);
}

// -----------------------------------------------------------------------------
// 2. Named fields are patched; everything else keeps its default.
// -----------------------------------------------------------------------------
TEST(ParseConfigTest, PatchesNamedFields) {
  const json doc = json::parse(R"({
    "market": { "base_vix": 20.0 },
    "feedback": { "iterations": 0, "broadcast_coeff": 0.1 },
    "network": { "hedge_fund_banks": { "min": 1, "max": 1 } },
    "verbose": false
  })");

  const domain::SimulationConfig config = io::parseConfig(doc);
  EXPECT_DOUBLE_EQ(config.market.base_vix, 20.0);
  EXPECT_DOUBLE_EQ(config.market.gilt_depth_base, 5000.0);
  EXPECT_EQ(config.feedback.iterations, 0);
  EXPECT_DOUBLE_EQ(config.feedback.broadcast_coeff, 0.1);
  EXPECT_DOUBLE_EQ(config.feedback.crowding_coeff, 0.03);
  EXPECT_EQ(config.network.hedge_fund_banks.min, 1);
  EXPECT_EQ(config.network.hedge_fund_banks.max, 1);
  EXPECT_EQ(config.network.ldi_banks.max, 2);
  EXPECT_FALSE(config.verbose);
}

// -----------------------------------------------------------------------------
// 3. Type errors and invalid values are std::invalid_argument naming the key.
// -----------------------------------------------------------------------------
TEST(ParseConfigTest, ErrorsNameTheKey) {
  EXPECT_NE(invalidArgumentMessage([] {
              io::parseConfig(json::parse(R"({"feedback": {"iterations": "x"}})"));
            }).find("config.feedback.iterations"),
            std::string::npos);
  EXPECT_NE(invalidArgumentMessage([] {
              io::parseConfig(json::parse(R"({"market": 5})"));
            }).find("config.market"),
            std::string::npos);
  EXPECT_THROW(io::parseConfig(json::parse(R"({"min_buffer": 0})")),
               std::invalid_argument);
  EXPECT_THROW(io::parseConfig(json::array()), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 4. Scenario documents.
// -----------------------------------------------------------------------------
TEST(ParseScenarioTest, ParsesAndValidates) {
  const json doc = json::parse(R"({
    "name": "swes1", "horizon_days": 2,
    "variable_paths": { "gilt_10y_yield": [50, 120], "vix": [25, 40] }
  })");
  const domain::Scenario scenario = io::parseScenario(doc);
  EXPECT_EQ(scenario.name, "swes1");
  EXPECT_EQ(scenario.horizon_days, 2);
  EXPECT_DOUBLE_EQ(scenario.deltaFor(1).at(vars::kGilt10y), 70.0);

  json no_horizon = doc;
  no_horizon.erase("horizon_days");
  EXPECT_NE(invalidArgumentMessage([&] { io::parseScenario(no_horizon); })
                .find("scenario.horizon_days"),
            std::string::npos);

  json short_path = doc;
  short_path["horizon_days"] = 3;
  EXPECT_THROW(io::parseScenario(short_path), std::invalid_argument);

  json bad_values = doc;
  bad_values["variable_paths"]["vix"] = "high";
  EXPECT_THROW(io::parseScenario(bad_values), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 5. Population records: ids by position, profiles, size and sensitivities.
// -----------------------------------------------------------------------------
TEST(ParsePopulationTest, BuildsAgentsFromRecords) {
  const BehaviorRegistry behaviors;
  const Population population =
      io::parsePopulation(json::parse(kPopulationDoc), behaviors);
  ASSERT_EQ(population.size(), 2u);

  const AgentState& bank = population[0];
  EXPECT_EQ(bank.id, 0u);
  EXPECT_EQ(bank.type, AgentType::Bank);
  EXPECT_DOUBLE_EQ(bank.theta, 0.25);
  EXPECT_DOUBLE_EQ(bank.size, 2000.0);  // liabilities are not assets
  const auto& bp = bank.profileAs<domain::BankProfile>();
  EXPECT_DOUBLE_EQ(bp.risk_appetite, 0.4);
  EXPECT_DOUBLE_EQ(bp.repo_capacity, 900.0);
  EXPECT_DOUBLE_EQ(bp.gilt_mm_capacity, 300.0);
  EXPECT_DOUBLE_EQ(bp.gilt_mm_used, 0.0);

  const AgentState& hf = population[1];
  EXPECT_EQ(hf.id, 1u);
  EXPECT_DOUBLE_EQ(hf.size, 9000.0);
  EXPECT_DOUBLE_EQ(hf.theta, 0.3);
  const auto& hp = hf.profileAs<domain::HedgeFundProfile>();
  EXPECT_EQ(hp.strategy, domain::HedgeFundStrategy::MacroRates);
  EXPECT_EQ(hp.repo_dependence, domain::RepoDependence::VeryHigh);
  EXPECT_DOUBLE_EQ(hp.leverage, 4.0);

  // Missing sensitivities take the variant default; an explicit empty
  // object means no exposure.
  const auto* gilts = domain::findItem(hf.balance_sheet, items::kGilts);
  ASSERT_NE(gilts, nullptr);
  EXPECT_EQ(gilts->sensitivities,
            behaviors.behaviorFor(AgentType::HedgeFund)
                .defaultSensitivities(hf, items::kGilts));
  EXPECT_FALSE(gilts->sensitivities.empty());
  const auto* corp = domain::findItem(hf.balance_sheet, items::kCorporateBonds);
  ASSERT_NE(corp, nullptr);
  EXPECT_TRUE(corp->sensitivities.empty());

  const auto* repo = domain::findItem(hf.balance_sheet, items::kRepoBorrowing);
  ASSERT_NE(repo, nullptr);
  EXPECT_EQ(repo->category, domain::ItemCategory::Liability);
}

// -----------------------------------------------------------------------------
// 6. The {"agents": [...]} wrapper is accepted; malformed records are not.
// -----------------------------------------------------------------------------
TEST(ParsePopulationTest, WrapperAndErrors) {
  const BehaviorRegistry behaviors;
  json wrapped;
  wrapped["agents"] = json::parse(kPopulationDoc);
  EXPECT_EQ(io::parsePopulation(wrapped, behaviors).size(), 2u);

  json missing_name = json::parse(kPopulationDoc);
  missing_name[1].erase("name");
  EXPECT_NE(invalidArgumentMessage([&] {
              io::parsePopulation(missing_name, behaviors);
            }).find("agents[1].name"),
            std::string::npos);

  json bad_type = json::parse(kPopulationDoc);
  bad_type[0]["type"] = "pension";
  EXPECT_THROW(io::parsePopulation(bad_type, behaviors), std::invalid_argument);

  json bad_strategy = json::parse(kPopulationDoc);
  bad_strategy[1]["profile"]["strategy"] = "momentum";
  EXPECT_THROW(io::parsePopulation(bad_strategy, behaviors),
               std::invalid_argument);

  json negative = json::parse(kPopulationDoc);
  negative[0]["balance_sheet"][0]["amount"] = -5;
  EXPECT_THROW(io::parsePopulation(negative, behaviors), std::invalid_argument);

  json duplicate = json::parse(kPopulationDoc);
  duplicate[1]["name"] = "Bank_A";
  EXPECT_THROW(io::parsePopulation(duplicate, behaviors), std::invalid_argument);

  EXPECT_THROW(io::parsePopulation(json::object(), behaviors),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 7. The run output carries every section, one entry per day and agent.
// -----------------------------------------------------------------------------
TEST(FormatRunResultTest, CarriesEverySection) {
  Simulation sim(quietConfig(), stressScenario(2), mixedPopulation(), 7);
  const json out = io::formatRunResult(sim.run());

  EXPECT_EQ(out.at("scenario"), "gilt_stress");
  ASSERT_EQ(out.at("days").size(), 2u);
  const json& day1 = out.at("days").at(1);
  EXPECT_EQ(day1.at("day"), 1);
  EXPECT_EQ(day1.at("agents").size(), 7u);
  EXPECT_TRUE(day1.at("market").contains("gilt_selling"));
  EXPECT_TRUE(day1.at("agents").at(0).at("liquidity").contains("B3"));

  EXPECT_EQ(out.at("initial_buffers").size(), 7u);
  EXPECT_DOUBLE_EQ(out.at("initial_buffers").at("Bank_A").get<double>(), 240.0);
  EXPECT_TRUE(out.at("amplification").contains("system_wide"));
  EXPECT_EQ(out.at("amplification").at("per_agent").size(), 7u);
  EXPECT_EQ(out.at("summary").at("total_agents"), 7);
  EXPECT_EQ(out.at("network").at("total_nodes"), 7);
}

// -----------------------------------------------------------------------------
// 8. Files: missing and malformed are reported, valid ones parse.
// -----------------------------------------------------------------------------
TEST(LoadJsonFileTest, ReportsUnreadableAndMalformed) {
  EXPECT_THROW(io::loadJsonFile("/nonexistent/liqsim/config.json"),
               std::invalid_argument);

  const std::string good = ::testing::TempDir() + "liqsim_good.json";
  {
    std::ofstream out(good);
    out << R"({"feedback": {"iterations": 2}})";
  }
  EXPECT_EQ(io::parseConfig(io::loadJsonFile(good)).feedback.iterations, 2);

  const std::string bad = ::testing::TempDir() + "liqsim_bad.json";
  {
    std::ofstream out(bad);
    out << "{ not json";
  }
  EXPECT_THROW(io::loadJsonFile(bad), std::invalid_argument);
}
