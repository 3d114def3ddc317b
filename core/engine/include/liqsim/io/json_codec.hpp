#pragma once

#include "liqsim/agents/behavior_registry.hpp"
#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/scenario.hpp"
#include "liqsim/domain/simulation_config.hpp"
#include "liqsim/engine/run_result.hpp"
#include "liqsim/network/relationship_network.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace liqsim {
namespace io {

// -----------------------------------------------------------------------------
// JSON codecs for run inputs and outputs
// -----------------------------------------------------------------------------
//
// @brief  Decoders for config, scenario and population documents and
//         encoders for the run output.
//
// @details
// Every decoder converts nlohmann::json::exception (missing key, wrong type,
// malformed text) into std::invalid_argument whose message names the
// offending key, then runs the matching validate() so the result is ready
// to hand to Simulation.
//
// Config document: every field optional, patched over the defaults.
//
//   { "market": { "base_vix": 15.0, ... },
//     "efficiency": { ... }, "feedback": { "iterations": 3, ... },
//     "bank": { ... }, "redemption": { ... },
//     "network": { "hedge_fund_banks": { "min": 2, "max": 3 }, ... },
//     "amplification_epsilon": 0.001, "min_buffer": 0.001, "verbose": true }
//
// Scenario document:
//
//   { "name": "swes1", "horizon_days": 10,
//     "variable_paths": { "gilt_10y_yield": [ ... ], "vix": [ ... ] } }
//
// Population document: an array of agent records, or { "agents": [...] }.
//
//   { "name": "HF_01", "type": "hedge_fund", "size": 5000,
//     "theta": 0.3, "buffer_usability": 0.2,
//     "balance_sheet": [ { "name": "Gilt Holdings", "amount": 1200,
//                          "category": "liquid_asset",
//                          "sensitivities": { "gilt_10y_yield": -0.0006 },
//                          "eligible": true, "reaction_instrument": true,
//                          "haircut_pct": 2.0 } ],
//     "profile": { "strategy": "macro_rates", "aum": 1000, ... } }
//
// An item without "sensitivities" gets the variant's default table; an
// explicit empty object means no mark-to-market exposure. A missing "size"
// defaults to the sum of asset items.
// -----------------------------------------------------------------------------

// Reads and parses a JSON file. Throws std::invalid_argument when the file
// cannot be opened or does not parse.
nlohmann::json loadJsonFile(const std::string& path);

domain::SimulationConfig parseConfig(const nlohmann::json& document);

domain::Scenario parseScenario(const nlohmann::json& document);

domain::Population parsePopulation(const nlohmann::json& document,
                                   const BehaviorRegistry& behaviors);

nlohmann::json formatNetworkSummary(const NetworkSummary& summary);

nlohmann::json formatDaySnapshot(const DaySnapshot& snapshot);

// Whole run: scenario name, day snapshots, initial buffers, amplification,
// summary and network summary.
nlohmann::json formatRunResult(const RunResult& result);

}  // namespace io
}  // namespace liqsim
