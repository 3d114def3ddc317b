#include "liqsim/io/json_codec.hpp"
#include "liqsim/domain/agent_profiles.hpp"

#include <cstddef>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace liqsim {
namespace io {

using nlohmann::json;
using domain::AgentState;
using domain::AgentType;

namespace {

// Sets `field` from obj[key] when present. A type mismatch becomes
// std::invalid_argument naming "<path>.<key>".
template <typename T>
void patch(const json& obj, const std::string& path, const char* key,
           T& field) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  try {
    field = it->get<T>();
  } catch (const json::exception& e) {
    throw std::invalid_argument(path + "." + key + ": " + e.what());
  }
}

const json& section(const json& document, const char* key) {
  static const json kEmpty = json::object();
  auto it = document.find(key);
  if (it == document.end()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw std::invalid_argument(std::string("config.") + key +
                                ": expected an object");
  }
  return *it;
}

void patchRange(const json& obj, const std::string& path, const char* key,
                domain::DegreeRange& range) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  const std::string full = path + "." + key;
  if (!it->is_object()) {
    throw std::invalid_argument(full + ": expected {\"min\", \"max\"}");
  }
  patch(*it, full, "min", range.min);
  patch(*it, full, "max", range.max);
}

template <typename T>
T required(const json& obj, const std::string& path, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    throw std::invalid_argument(path + "." + key + ": missing");
  }
  try {
    return it->get<T>();
  } catch (const json::exception& e) {
    throw std::invalid_argument(path + "." + key + ": " + e.what());
  }
}

// -----------------------------------------------------------------------------
// Population helpers
// -----------------------------------------------------------------------------
domain::AgentProfile parseProfile(AgentType type, const json& obj,
                                  const std::string& path) {
  switch (type) {
    case AgentType::Bank: {
      domain::BankProfile p;
      patch(obj, path, "risk_appetite", p.risk_appetite);
      patch(obj, path, "repo_capacity", p.repo_capacity);
      patch(obj, path, "willingness_new_repo", p.willingness_new_repo);
      patch(obj, path, "willingness_roll_repo", p.willingness_roll_repo);
      patch(obj, path, "gilt_mm_capacity", p.gilt_mm_capacity);
      patch(obj, path, "corp_mm_capacity", p.corp_mm_capacity);
      return p;
    }
    case AgentType::HedgeFund: {
      domain::HedgeFundProfile p;
      std::string strategy = domain::toString(p.strategy);
      std::string dependence = domain::toString(p.repo_dependence);
      patch(obj, path, "strategy", strategy);
      patch(obj, path, "repo_dependence", dependence);
      p.strategy = domain::parseHedgeFundStrategy(strategy);
      p.repo_dependence = domain::parseRepoDependence(dependence);
      patch(obj, path, "aum", p.aum);
      patch(obj, path, "leverage", p.leverage);
      patch(obj, path, "var_utilisation", p.var_utilisation);
      return p;
    }
    case AgentType::LdiPension: {
      domain::LdiProfile p;
      patch(obj, path, "pooled", p.pooled);
      patch(obj, path, "leverage", p.leverage);
      patch(obj, path, "yield_buffer_bps", p.yield_buffer_bps);
      patch(obj, path, "recap_capacity", p.recap_capacity);
      patch(obj, path, "recap_speed_days", p.recap_speed_days);
      return p;
    }
    case AgentType::Insurer: {
      domain::InsurerProfile p;
      patch(obj, path, "hedge_ratio", p.hedge_ratio);
      patch(obj, path, "dirty_csa_fraction", p.dirty_csa_fraction);
      return p;
    }
    case AgentType::FundComplex: {
      domain::FundComplexProfile p;
      patch(obj, path, "pension_investor_pct", p.pension_investor_pct);
      patch(obj, path, "insurer_investor_pct", p.insurer_investor_pct);
      return p;
    }
  }
  throw std::invalid_argument(path + ": unknown agent type");
}

domain::BalanceSheetItem parseItem(const json& obj, const std::string& path,
                                   bool& has_sensitivities) {
  if (!obj.is_object()) {
    throw std::invalid_argument(path + ": expected an object");
  }
  domain::BalanceSheetItem item;
  item.name = required<std::string>(obj, path, "name");
  item.amount = required<double>(obj, path, "amount");

  std::string category = domain::toString(item.category);
  patch(obj, path, "category", category);
  item.category = domain::parseItemCategory(category);

  has_sensitivities = obj.contains("sensitivities");
  patch(obj, path, "sensitivities", item.sensitivities);
  patch(obj, path, "eligible", item.eligible);
  patch(obj, path, "reaction_instrument", item.reaction_instrument);
  patch(obj, path, "haircut_pct", item.haircut_pct);
  return item;
}

AgentState parseAgent(const json& obj, std::size_t index,
                      const BehaviorRegistry& behaviors) {
  const std::string path = "agents[" + std::to_string(index) + "]";
  if (!obj.is_object()) {
    throw std::invalid_argument(path + ": expected an object");
  }

  AgentState agent;
  agent.id = index;
  agent.name = required<std::string>(obj, path, "name");
  agent.type = domain::parseAgentType(required<std::string>(obj, path, "type"));
  patch(obj, path, "theta", agent.theta);
  patch(obj, path, "buffer_usability", agent.buffer_usability);

  static const json kEmpty = json::object();
  auto profile_it = obj.find("profile");
  agent.profile = parseProfile(
      agent.type, profile_it != obj.end() ? *profile_it : kEmpty,
      path + ".profile");

  const json& sheet = required<json>(obj, path, "balance_sheet");
  if (!sheet.is_array()) {
    throw std::invalid_argument(path + ".balance_sheet: expected an array");
  }
  const IAgentBehavior& behavior = behaviors.behaviorFor(agent.type);
  for (std::size_t i = 0; i < sheet.size(); ++i) {
    bool has_sensitivities = false;
    domain::BalanceSheetItem item =
        parseItem(sheet[i], path + ".balance_sheet[" + std::to_string(i) + "]",
                  has_sensitivities);
    if (!has_sensitivities) {
      item.sensitivities = behavior.defaultSensitivities(agent, item.name);
    }
    agent.balance_sheet.push_back(std::move(item));
  }

  agent.size = domain::totalAssets(agent.balance_sheet);
  patch(obj, path, "size", agent.size);
  return agent;
}

// -----------------------------------------------------------------------------
// Output helpers
// -----------------------------------------------------------------------------
json formatLiquidity(const domain::LiquidityPosition& liq) {
  return json{{"B0", liq.B0}, {"B1", liq.B1}, {"B2", liq.B2},
              {"B3", liq.B3}, {"E1", liq.E1}, {"E2", liq.E2}};
}

json formatCounters(const domain::CumulativeCounters& c) {
  return json{{"margin_calls", c.margin_calls},
              {"asset_sales", c.asset_sales},
              {"gilt_sales", c.gilt_sales},
              {"repo_demand", c.repo_demand},
              {"redemptions", c.redemptions}};
}

json formatAgentSnapshot(const AgentSnapshot& a) {
  json j;
  j["day"] = a.day;
  j["agent_id"] = a.agent_id;
  j["name"] = a.name;
  j["type"] = domain::toString(a.type);
  j["liquidity"] = formatLiquidity(a.liquidity);
  j["reacted"] = a.reacted;
  j["shock"] = json{{"mark_to_market", a.shock.mark_to_market},
                    {"margin_calls", a.shock.margin_calls},
                    {"own_redemptions", a.shock.own_redemptions},
                    {"network_redemptions", a.shock.network_redemptions}};

  json actions = json::array();
  for (const auto& action : a.actions) {
    actions.push_back(json{{"name", action.name},
                           {"class", domain::toString(action.action_class)},
                           {"amount", action.amount},
                           {"item", action.item}});
  }
  j["actions"] = std::move(actions);
  j["counters"] = formatCounters(a.counters);
  return j;
}

json formatMarketSnapshot(const MarketSnapshot& m) {
  json j;
  j["day"] = m.day;
  j["levels"] = m.levels;
  j["stress_intensity"] = m.stress_intensity;
  j["gilt_bid_ask_bps"] = m.gilt_bid_ask_bps;
  j["corp_bid_ask_bps"] = m.corp_bid_ask_bps;
  j["repo_availability"] = m.repo_availability;
  j["gilt_depth"] = m.gilt_depth;
  j["corp_depth"] = m.corp_depth;
  j["gilt_selling"] = m.gilt_selling;
  j["corp_selling"] = m.corp_selling;
  j["repo_demand"] = m.repo_demand;
  j["gilt_yield_add_bps"] = m.gilt_yield_add_bps;
  j["ig_spread_add_bps"] = m.ig_spread_add_bps;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// loadJsonFile
// -----------------------------------------------------------------------------
json loadJsonFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::invalid_argument("cannot open " + path);
  }
  try {
    return json::parse(in);
  } catch (const json::exception& e) {
    throw std::invalid_argument(path + ": " + e.what());
  }
}

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
domain::SimulationConfig parseConfig(const json& document) {
  if (!document.is_object()) {
    throw std::invalid_argument("config: expected an object");
  }
  domain::SimulationConfig config;

  const json& m = section(document, "market");
  auto& mp = config.market;
  patch(m, "config.market", "base_vix", mp.base_vix);
  patch(m, "config.market", "normal_gilt_bid_ask_bps", mp.normal_gilt_bid_ask_bps);
  patch(m, "config.market", "normal_corp_bid_ask_bps", mp.normal_corp_bid_ask_bps);
  patch(m, "config.market", "repo_availability_floor", mp.repo_availability_floor);
  patch(m, "config.market", "repo_availability_stress_slope",
        mp.repo_availability_stress_slope);
  patch(m, "config.market", "gilt_depth_base", mp.gilt_depth_base);
  patch(m, "config.market", "gilt_depth_min", mp.gilt_depth_min);
  patch(m, "config.market", "corp_depth_base", mp.corp_depth_base);
  patch(m, "config.market", "corp_depth_min", mp.corp_depth_min);
  patch(m, "config.market", "gilt_impact_bps", mp.gilt_impact_bps);
  patch(m, "config.market", "corp_impact_bps", mp.corp_impact_bps);
  patch(m, "config.market", "gilt_10y_passthrough", mp.gilt_10y_passthrough);
  patch(m, "config.market", "gilt_30y_passthrough", mp.gilt_30y_passthrough);
  patch(m, "config.market", "ig_passthrough", mp.ig_passthrough);
  patch(m, "config.market", "hy_passthrough", mp.hy_passthrough);
  patch(m, "config.market", "system_repo_capacity", mp.system_repo_capacity);
  patch(m, "config.market", "repo_pressure_slope", mp.repo_pressure_slope);
  patch(m, "config.market", "gilt_bid_ask_per_sale", mp.gilt_bid_ask_per_sale);
  patch(m, "config.market", "corp_bid_ask_per_sale", mp.corp_bid_ask_per_sale);

  const json& e = section(document, "efficiency");
  patch(e, "config.efficiency", "sale_floor", config.efficiency.sale_floor);
  patch(e, "config.efficiency", "spread_divisor", config.efficiency.spread_divisor);
  patch(e, "config.efficiency", "central_bank", config.efficiency.central_bank);
  patch(e, "config.efficiency", "redemption", config.efficiency.redemption);
  patch(e, "config.efficiency", "other", config.efficiency.other);

  const json& f = section(document, "feedback");
  auto& fp = config.feedback;
  patch(f, "config.feedback", "iterations", fp.iterations);
  patch(f, "config.feedback", "hf_funding_stress_coeff", fp.hf_funding_stress_coeff);
  patch(f, "config.feedback", "bank_counterparty_loss_coeff",
        fp.bank_counterparty_loss_coeff);
  patch(f, "config.feedback", "redemption_pressure_coeff",
        fp.redemption_pressure_coeff);
  patch(f, "config.feedback", "broadcast_coeff", fp.broadcast_coeff);
  patch(f, "config.feedback", "reputation_coeff", fp.reputation_coeff);
  patch(f, "config.feedback", "crowding_coeff", fp.crowding_coeff);

  const json& b = section(document, "bank");
  patch(b, "config.bank", "repo_refusal_stress_threshold",
        config.bank.repo_refusal_stress_threshold);
  patch(b, "config.bank", "tightening_rate", config.bank.tightening_rate);
  patch(b, "config.bank", "roll_willingness_floor",
        config.bank.roll_willingness_floor);

  const json& r = section(document, "redemption");
  auto& rp = config.redemption;
  patch(r, "config.redemption", "rate", rp.rate);
  patch(r, "config.redemption", "ldi_weight", rp.ldi_weight);
  patch(r, "config.redemption", "insurer_weight", rp.insurer_weight);
  patch(r, "config.redemption", "hedge_fund_weight", rp.hedge_fund_weight);
  patch(r, "config.redemption", "fund_complex_weight", rp.fund_complex_weight);
  patch(r, "config.redemption", "gate_threshold", rp.gate_threshold);
  patch(r, "config.redemption", "gate_dampening", rp.gate_dampening);

  const json& n = section(document, "network");
  auto& np = config.network;
  patchRange(n, "config.network", "hedge_fund_banks", np.hedge_fund_banks);
  patchRange(n, "config.network", "ldi_banks", np.ldi_banks);
  patchRange(n, "config.network", "insurer_banks", np.insurer_banks);
  patchRange(n, "config.network", "redemption_funds", np.redemption_funds);
  patchRange(n, "config.network", "fund_cross_holdings", np.fund_cross_holdings);

  patch(document, "config", "amplification_epsilon",
        config.amplification_epsilon);
  patch(document, "config", "min_buffer", config.min_buffer);
  patch(document, "config", "verbose", config.verbose);

  config.validate();
  return config;
}

// -----------------------------------------------------------------------------
// parseScenario
// -----------------------------------------------------------------------------
domain::Scenario parseScenario(const json& document) {
  if (!document.is_object()) {
    throw std::invalid_argument("scenario: expected an object");
  }
  domain::Scenario scenario;
  patch(document, "scenario", "name", scenario.name);
  scenario.horizon_days = required<int>(document, "scenario", "horizon_days");
  scenario.variable_paths =
      required<std::map<std::string, std::vector<double>>>(
          document, "scenario", "variable_paths");
  scenario.validate();
  return scenario;
}

// -----------------------------------------------------------------------------
// parsePopulation
// -----------------------------------------------------------------------------
domain::Population parsePopulation(const json& document,
                                   const BehaviorRegistry& behaviors) {
  const json* records = &document;
  if (document.is_object()) {
    auto it = document.find("agents");
    if (it == document.end()) {
      throw std::invalid_argument("population.agents: missing");
    }
    records = &*it;
  }
  if (!records->is_array()) {
    throw std::invalid_argument("population: expected an array of agents");
  }

  domain::Population population;
  population.reserve(records->size());
  for (std::size_t i = 0; i < records->size(); ++i) {
    population.push_back(parseAgent((*records)[i], i, behaviors));
  }
  domain::validatePopulation(population);
  return population;
}

// -----------------------------------------------------------------------------
// Encoders
// -----------------------------------------------------------------------------
json formatNetworkSummary(const NetworkSummary& summary) {
  json j;
  j["total_nodes"] = summary.total_nodes;
  j["total_edges"] = summary.total_edges;
  j["prime_brokerage_edges"] = summary.prime_brokerage_edges;
  j["clearing_edges"] = summary.clearing_edges;
  j["derivatives_repo_edges"] = summary.derivatives_repo_edges;
  j["redemption_edges"] = summary.redemption_edges;
  return j;
}

json formatDaySnapshot(const DaySnapshot& snapshot) {
  json j;
  j["day"] = snapshot.day;
  j["market"] = formatMarketSnapshot(snapshot.market);
  j["absorbed"] = json{{"gilt", snapshot.absorbed.gilt},
                       {"corp", snapshot.absorbed.corp}};
  json agents = json::array();
  for (const auto& a : snapshot.agents) {
    agents.push_back(formatAgentSnapshot(a));
  }
  j["agents"] = std::move(agents);
  return j;
}

json formatRunResult(const RunResult& result) {
  json j;
  j["scenario"] = result.scenario_name;

  json days = json::array();
  for (const auto& day : result.days) {
    days.push_back(formatDaySnapshot(day));
  }
  j["days"] = std::move(days);
  j["initial_buffers"] = result.initial_buffers;

  j["amplification"] = json{{"per_agent", result.amplification.per_agent},
                            {"per_type", result.amplification.per_type},
                            {"system_wide", result.amplification.system_wide}};

  const RunSummary& s = result.summary;
  j["summary"] = json{{"total_agents", s.total_agents},
                      {"agents_reacted", s.agents_reacted},
                      {"total_margin_calls", s.total_margin_calls},
                      {"total_asset_sales", s.total_asset_sales},
                      {"non_bank_gilt_sales", s.non_bank_gilt_sales},
                      {"total_repo_demand", s.total_repo_demand},
                      {"final_gilt_10y", s.final_gilt_10y},
                      {"final_ig_spread", s.final_ig_spread},
                      {"final_repo_availability", s.final_repo_availability},
                      {"hedge_funds_sought_repo", s.hedge_funds_sought_repo},
                      {"hedge_funds_refused_by_all",
                       s.hedge_funds_refused_by_all}};

  j["network"] = formatNetworkSummary(result.network);
  return j;
}

}  // namespace io
}  // namespace liqsim
