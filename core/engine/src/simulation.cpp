#include "liqsim/engine/simulation.hpp"
#include "liqsim/agents/agent_mechanics.hpp"
#include "liqsim/agents/market_making.hpp"
#include "liqsim/agents/repo_market.hpp"
#include "liqsim/engine/amplification.hpp"
#include "liqsim/network/network_builder.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace liqsim {

using domain::AgentState;
using domain::DayPhase;

namespace {

domain::SimulationConfig checkedConfig(domain::SimulationConfig config) {
  config.validate();
  return config;
}

domain::Scenario checkedScenario(domain::Scenario scenario) {
  scenario.validate();
  return scenario;
}

domain::Population checkedPopulation(domain::Population population) {
  domain::validatePopulation(population);
  return population;
}

RelationshipNetwork seededNetwork(const domain::Population& population,
                                  const domain::SimulationConfig& config,
                                  std::uint64_t seed) {
  domain::validatePopulation(population);
  config.validate();
  return buildNetwork(population, config.network, seed);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructors: validate every input before day 0
// -----------------------------------------------------------------------------
Simulation::Simulation(domain::SimulationConfig config,
                       domain::Scenario scenario,
                       domain::Population population,
                       RelationshipNetwork network)
    : config_(checkedConfig(std::move(config))),
      scenario_(checkedScenario(std::move(scenario))),
      agents_(checkedPopulation(std::move(population))),
      network_(std::move(network)),
      market_(config_.market),
      feedback_(config_),
      clock_(scenario_.horizon_days),
      losses_(agents_.size()) {
  if (network_.agentCount() != agents_.size()) {
    throw std::invalid_argument(
        "Simulation: network has " + std::to_string(network_.agentCount()) +
        " nodes for " + std::to_string(agents_.size()) + " agents");
  }
  for (const AgentState& agent : agents_) {
    if (network_.typeOf(agent.id) != agent.type) {
      throw std::invalid_argument("Simulation: network node " +
                                  std::to_string(agent.id) +
                                  " does not match the type of " + agent.name);
    }
  }
}

Simulation::Simulation(domain::SimulationConfig config,
                       domain::Scenario scenario,
                       domain::Population population,
                       std::uint64_t network_seed)
    : Simulation(config, std::move(scenario), population,
                 seededNetwork(population, config, network_seed)) {}

const IAgentBehavior& Simulation::behaviorOf(const AgentState& agent) const {
  return behaviors_.behaviorFor(agent.type);
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
RunResult Simulation::run() {
  if (clock_.phase() != DayPhase::Idle) {
    throw std::logic_error("Simulation: run() may only be called once");
  }

  RunResult result;
  result.scenario_name = scenario_.name;
  result.network = network_.summary();

  if (config_.verbose) {
    std::cout << "[Simulation] starting '" << scenario_.name << "': "
              << agents_.size() << " agents, " << result.network.total_edges
              << " edges, " << scenario_.horizon_days << " days, "
              << config_.feedback.iterations << " feedback iterations\n";
  }

  for (int day = 0; day < scenario_.horizon_days; ++day) {
    runDay(day, result);
  }
  clock_.advanceTo(DayPhase::Finished);

  result.amplification =
      computeAmplification(agents_, losses_, config_.amplification_epsilon);
  result.summary = summarizeRun(agents_, market_);

  if (config_.verbose) {
    std::cout << "[Simulation] finished. agents reacted="
              << result.summary.agents_reacted << "/"
              << result.summary.total_agents
              << ", system amplification=" << result.amplification.system_wide
              << "\n";
  }
  return result;
}

// -----------------------------------------------------------------------------
// runDay(): the eight phases of one simulated day
// -----------------------------------------------------------------------------
void Simulation::runDay(int day, RunResult& result) {
  // ---  1) Scenario ----------------------------------------------------------
  clock_.advanceTo(DayPhase::ScenarioApplied);
  applyScenario(day);
  if (day == 0) {
    for (const AgentState& agent : agents_) {
      result.initial_buffers[agent.name] = agent.liquidity.B0;
    }
  }

  DayStartedEvent started;
  started.day = day;
  started.vix = market_.vix();
  started.stress_intensity = market_.stressIntensity();
  started.sequence_id = nextSequence();
  bus_.publish(started);

  // ---  2) Stage 1 ----------------------------------------------------------
  computeShocks(scenario_.deltaFor(day));
  clock_.advanceTo(DayPhase::Shocked);

  // ---  3) Stage 2 ----------------------------------------------------------
  computeReactionsForAll(day);
  clock_.advanceTo(DayPhase::Reacted);

  // ---  4) Register every agent's sales before anyone absorbs ---------------
  registerAll();
  clock_.advanceTo(DayPhase::Registered);

  // ---  5) Bank absorption and repo tightening ------------------------------
  const AbsorptionTotals absorbed = absorbAndTighten();
  clock_.advanceTo(DayPhase::Absorbed);

  // ---  6) Stage 3 ----------------------------------------------------------
  const double e2_added = feedback_.run(agents_, market_, network_);
  clock_.advanceTo(DayPhase::FeedbackApplied);

  // ---  7) Record -----------------------------------------------------------
  accumulateLosses(agents_, losses_);
  result.days.push_back(recordDay(day, absorbed));
  clock_.advanceTo(DayPhase::Recorded);

  DayCompletedEvent completed;
  completed.day = day;
  completed.total_e2 = e2_added;
  completed.gilt_selling = market_.giltSelling();
  completed.corp_selling = market_.corpSelling();
  for (const AgentState& agent : agents_) {
    if (agent.reacted) ++completed.agents_reacted;
    completed.total_e1 += agent.liquidity.E1;
  }
  completed.sequence_id = nextSequence();
  bus_.publish(completed);

  if (config_.verbose) {
    std::cout << "[Simulation] day " << day << ": vix=" << market_.vix()
              << " reacted=" << completed.agents_reacted
              << " E1=" << completed.total_e1 << " E2=" << completed.total_e2
              << " gilt_selling=" << completed.gilt_selling
              << " absorbed=" << absorbed.gilt + absorbed.corp << "\n";
  }

  // ---  8) Commit sold holdings ----------------------------------------------
  for (AgentState& agent : agents_) {
    realizeSales(agent);
  }
  clock_.advanceTo(DayPhase::Committed);
}

void Simulation::applyScenario(int day) {
  market_.applyExogenousScenario(day, scenario_.levelsFor(day));
  for (AgentState& agent : agents_) {
    resetDaily(agent);
    agent.liquidity.B0 =
        computeInitialBuffer(agent, behaviorOf(agent), config_);
  }
}

// Provisional pass for everyone first: fund-complexes read their redeemers'
// provisional stress when computing redemption demand.
void Simulation::computeShocks(const domain::VariableMap& day_delta) {
  const ReactionContext ctx{market_, network_, agents_, config_};
  for (AgentState& agent : agents_) {
    computeProvisionalShock(agent, behaviorOf(agent), ctx, day_delta);
  }
  for (AgentState& agent : agents_) {
    computeStage1(agent, behaviorOf(agent), ctx);
  }
}

void Simulation::computeReactionsForAll(int day) {
  const ReactionContext ctx{market_, network_, agents_, config_};
  for (AgentState& agent : agents_) {
    const IAgentBehavior& behavior = behaviorOf(agent);
    computeReactions(agent, behavior, ctx);
    computeStage2(agent, behavior, ctx);
  }

  for (const AgentState& agent : agents_) {
    if (agent.reacted) {
      AgentReactedEvent reacted;
      reacted.day = day;
      reacted.agent_id = agent.id;
      reacted.agent_name = agent.name;
      reacted.agent_type = agent.type;
      reacted.stress_ratio = agent.liquidity.E1 / agent.liquidity.B0;
      reacted.action_total = agent.actionTotal();
      reacted.unmet_shortfall =
          std::max(0.0, agent.liquidity.E1 - reacted.action_total);
      reacted.sequence_id = nextSequence();
      bus_.publish(reacted);
    }

    const auto* hf = std::get_if<domain::HedgeFundProfile>(&agent.profile);
    if (hf && hf->repo_refused_today) {
      RepoRefusedEvent refused;
      refused.day = day;
      refused.agent_id = agent.id;
      refused.agent_name = agent.name;
      refused.banks_contacted = network_.connectedBanks(agent.id).size();
      refused.sequence_id = nextSequence();
      bus_.publish(refused);

      if (config_.verbose) {
        std::cerr << "[Simulation] WARNING: day " << day << ": all "
                  << refused.banks_contacted << " banks refused repo to "
                  << agent.name << "\n";
      }
    }
  }
}

void Simulation::registerAll() {
  for (const AgentState& agent : agents_) {
    registerActionsToMarket(agent, market_);
  }
}

// Tightening waits until every agent has finished Stage 2 so that all of
// today's repo requests saw the same willingness.
AbsorptionTotals Simulation::absorbAndTighten() {
  const AbsorptionTotals absorbed = absorbSellingPressure(
      agents_, market_.giltSelling(), market_.corpSelling());
  for (AgentState& agent : agents_) {
    if (domain::isBank(agent.type) && agent.reacted) {
      tightenRepoWillingness(agent, config_);
    }
  }
  return absorbed;
}

DaySnapshot Simulation::recordDay(int day,
                                  const AbsorptionTotals& absorbed) const {
  DaySnapshot snapshot;
  snapshot.day = day;
  snapshot.market = market_.snapshot();
  snapshot.absorbed = absorbed;
  snapshot.agents.reserve(agents_.size());
  for (const AgentState& agent : agents_) {
    AgentSnapshot a;
    a.day = day;
    a.agent_id = agent.id;
    a.name = agent.name;
    a.type = agent.type;
    a.liquidity = agent.liquidity;
    a.shock = agent.shock;
    a.reacted = agent.reacted;
    a.actions = agent.actions;
    a.counters = agent.counters;
    snapshot.agents.push_back(std::move(a));
  }
  return snapshot;
}

}  // namespace liqsim
