#pragma once

#include "liqsim/domain/market_variables.hpp"
#include "liqsim/domain/simulation_config.hpp"

#include <string>

namespace liqsim {

// Point-in-time copy of the market state, recorded once per day.
struct MarketSnapshot {
  int day{0};
  domain::VariableMap levels;  // exogenous level plus endogenous add-ons
  double stress_intensity{1.0};
  double gilt_bid_ask_bps{0.0};
  double corp_bid_ask_bps{0.0};
  double repo_availability{1.0};
  double gilt_depth{0.0};
  double corp_depth{0.0};
  double gilt_selling{0.0};
  double corp_selling{0.0};
  double repo_demand{0.0};
  double gilt_yield_add_bps{0.0};
  double ig_spread_add_bps{0.0};
};

// -----------------------------------------------------------------------------
// MarketState: exogenous scenario levels plus endogenous accumulators
// -----------------------------------------------------------------------------
//
// @brief  The single piece of mutable state shared by every agent.
//
// @details
// Two layers:
//
//   Exogenous   Levels supplied by the scenario for the current day. Set by
//               applyExogenousScenario() and read-only afterwards, except for
//               the endogenous add-ons layered onto them.
//
//   Endogenous  Selling pressure (gilt, corporate), repo demand, repo
//               availability, bid/ask proxies and the yield/spread add-ons.
//               Recomputed from scratch when a new day's scenario is applied;
//               accumulated by registerSale()/registerRepoDemand() during
//               Stage 2 and converted into price impact by
//               applyEndogenousFeedback() once per feedback iteration.
//
// Derived quantities:
//   stress intensity  s   = vix / base_vix
//   bid/ask (gilt)        = normal_gilt_bid_ask * s  (+ selling widening)
//   repo availability     = max(floor, 1 - (s - 1) * slope)
//   depth (gilt)          = max(min_depth, base_depth / s)
//
// Bank market-making capacity is NOT held here: it is per-bank run state
// (BankProfile) and depletes permanently across the horizon.
//
// Thread model:
//   Single-threaded. Agents read it through const references; only the
//   Simulation, the FeedbackEngine and registerActionsToMarket() write.
// -----------------------------------------------------------------------------
class MarketState {
 public:
  explicit MarketState(domain::SimulationConfig::MarketParams params);

  // ---------------------------------------------------------------------------
  // applyExogenousScenario(day, levels)
  // ---------------------------------------------------------------------------
  // @brief  Installs the day's scenario levels and resets every endogenous
  //         accumulator and add-on.
  //
  // @param  day     Simulated day index.
  // @param  levels  Cumulative levels. Missing variables read as 0, a missing
  //                 vix reads as base_vix.
  // ---------------------------------------------------------------------------
  void applyExogenousScenario(int day, const domain::VariableMap& levels);

  // Accumulators. Throw std::domain_error on a negative or NaN amount.
  void registerGiltSale(double amount);
  void registerCorpSale(double amount);
  void registerRepoDemand(double amount);

  // ---------------------------------------------------------------------------
  // applyEndogenousFeedback()
  // ---------------------------------------------------------------------------
  // @brief  Converts the day's accumulated selling and repo demand into
  //         market moves.
  //
  // @details
  // Called once per feedback iteration, so impacts compound with the number
  // of iterations:
  //   gilt impact = gilt_selling / gilt_depth * gilt_impact_bps
  //       10y += impact * 0.5, 30y += impact * 0.7
  //   corp impact = corp_selling / corp_depth * corp_impact_bps
  //       IG  += impact * 0.6, HY  += impact * 1.2
  //   repo availability -= repo_demand / system_capacity * slope (floored)
  //   bid/ask widen linearly in the selling totals
  // ---------------------------------------------------------------------------
  void applyEndogenousFeedback();

  // Current level of a variable, including endogenous add-ons. 0 if unknown.
  double level(const std::string& variable) const;

  int day() const { return day_; }
  double vix() const { return vix_; }
  double stressIntensity() const;
  double giltBidAskBps() const { return gilt_bid_ask_bps_; }
  double corpBidAskBps() const { return corp_bid_ask_bps_; }
  double repoAvailability() const { return repo_availability_; }
  double giltDepth() const { return gilt_depth_; }
  double corpDepth() const { return corp_depth_; }
  double giltSelling() const { return gilt_selling_; }
  double corpSelling() const { return corp_selling_; }
  double repoDemand() const { return repo_demand_; }

  MarketSnapshot snapshot() const;

 private:
  domain::SimulationConfig::MarketParams params_;

  int day_{0};
  domain::VariableMap levels_;
  double vix_;

  double gilt_bid_ask_bps_;
  double corp_bid_ask_bps_;
  double repo_availability_{1.0};
  double gilt_depth_;
  double corp_depth_;

  double gilt_selling_{0.0};
  double corp_selling_{0.0};
  double repo_demand_{0.0};
  double gilt_yield_add_bps_{0.0};
  double ig_spread_add_bps_{0.0};
};

}  // namespace liqsim
