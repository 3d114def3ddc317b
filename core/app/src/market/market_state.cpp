#include "liqsim/market/market_state.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace liqsim {

namespace {

void requireAmount(double amount, const char* what) {
  if (!std::isfinite(amount) || amount < 0.0) {
    throw std::domain_error(std::string("[MarketState] ") + what +
                            " must be finite and >= 0, got " +
                            std::to_string(amount));
  }
}

}  // namespace

MarketState::MarketState(domain::SimulationConfig::MarketParams params)
    : params_(std::move(params)),
      vix_(params_.base_vix),
      gilt_bid_ask_bps_(params_.normal_gilt_bid_ask_bps),
      corp_bid_ask_bps_(params_.normal_corp_bid_ask_bps),
      gilt_depth_(params_.gilt_depth_base),
      corp_depth_(params_.corp_depth_base) {}

// -----------------------------------------------------------------------------
// applyExogenousScenario: new day, fresh endogenous layer
// -----------------------------------------------------------------------------
void MarketState::applyExogenousScenario(int day,
                                         const domain::VariableMap& levels) {
  day_ = day;
  levels_ = levels;
  vix_ = domain::valueOr(levels, domain::vars::kVix, params_.base_vix);
  levels_[domain::vars::kVix] = vix_;

  gilt_selling_ = 0.0;
  corp_selling_ = 0.0;
  repo_demand_ = 0.0;
  gilt_yield_add_bps_ = 0.0;
  ig_spread_add_bps_ = 0.0;

  const double s = stressIntensity();
  gilt_bid_ask_bps_ = params_.normal_gilt_bid_ask_bps * s;
  corp_bid_ask_bps_ = params_.normal_corp_bid_ask_bps * s;
  repo_availability_ =
      std::max(params_.repo_availability_floor,
               1.0 - (s - 1.0) * params_.repo_availability_stress_slope);
  repo_availability_ = std::min(repo_availability_, 1.0);

  // Dealers pull back as volatility rises.
  gilt_depth_ = std::max(params_.gilt_depth_min, params_.gilt_depth_base / s);
  corp_depth_ = std::max(params_.corp_depth_min, params_.corp_depth_base / s);
}

void MarketState::registerGiltSale(double amount) {
  requireAmount(amount, "gilt sale");
  gilt_selling_ += amount;
}

void MarketState::registerCorpSale(double amount) {
  requireAmount(amount, "corporate bond sale");
  corp_selling_ += amount;
}

void MarketState::registerRepoDemand(double amount) {
  requireAmount(amount, "repo demand");
  repo_demand_ += amount;
}

// -----------------------------------------------------------------------------
// applyEndogenousFeedback: selling pressure -> price impact
// -----------------------------------------------------------------------------
void MarketState::applyEndogenousFeedback() {
  const double gilt_impact =
      gilt_selling_ / gilt_depth_ * params_.gilt_impact_bps;
  gilt_yield_add_bps_ += gilt_impact;
  levels_[domain::vars::kGilt10y] += gilt_impact * params_.gilt_10y_passthrough;
  levels_[domain::vars::kGilt30y] += gilt_impact * params_.gilt_30y_passthrough;

  const double corp_impact =
      corp_selling_ / corp_depth_ * params_.corp_impact_bps;
  ig_spread_add_bps_ += corp_impact;
  levels_[domain::vars::kIgSpread] += corp_impact * params_.ig_passthrough;
  levels_[domain::vars::kHySpread] += corp_impact * params_.hy_passthrough;

  const double repo_pressure = repo_demand_ / params_.system_repo_capacity;
  const double depleted =
      repo_availability_ - repo_pressure * params_.repo_pressure_slope;
  repo_availability_ = std::max(params_.repo_availability_floor, depleted);

  gilt_bid_ask_bps_ += gilt_selling_ * params_.gilt_bid_ask_per_sale;
  corp_bid_ask_bps_ += corp_selling_ * params_.corp_bid_ask_per_sale;
}

double MarketState::level(const std::string& variable) const {
  return domain::valueOr(levels_, variable);
}

double MarketState::stressIntensity() const {
  return vix_ / params_.base_vix;
}

MarketSnapshot MarketState::snapshot() const {
  MarketSnapshot snap;
  snap.day = day_;
  snap.levels = levels_;
  snap.stress_intensity = stressIntensity();
  snap.gilt_bid_ask_bps = gilt_bid_ask_bps_;
  snap.corp_bid_ask_bps = corp_bid_ask_bps_;
  snap.repo_availability = repo_availability_;
  snap.gilt_depth = gilt_depth_;
  snap.corp_depth = corp_depth_;
  snap.gilt_selling = gilt_selling_;
  snap.corp_selling = corp_selling_;
  snap.repo_demand = repo_demand_;
  snap.gilt_yield_add_bps = gilt_yield_add_bps_;
  snap.ig_spread_add_bps = ig_spread_add_bps_;
  return snap;
}

}  // namespace liqsim
