#include "liqsim/domain/simulation_config.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace liqsim {
namespace domain {

namespace {

void requireNonNegative(double value, const char* field) {
  if (!std::isfinite(value) || value < 0.0) {
    throw std::invalid_argument(std::string("config.") + field +
                                " must be finite and >= 0, got " +
                                std::to_string(value));
  }
}

void requirePositive(double value, const char* field) {
  if (!std::isfinite(value) || value <= 0.0) {
    throw std::invalid_argument(std::string("config.") + field +
                                " must be finite and > 0, got " +
                                std::to_string(value));
  }
}

void requireFraction(double value, const char* field) {
  if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
    throw std::invalid_argument(std::string("config.") + field +
                                " must lie in [0, 1], got " +
                                std::to_string(value));
  }
}

void requireRange(const DegreeRange& range, const char* field) {
  if (range.min < 0 || range.max < range.min) {
    throw std::invalid_argument(std::string("config.") + field +
                                " must satisfy 0 <= min <= max, got [" +
                                std::to_string(range.min) + ", " +
                                std::to_string(range.max) + "]");
  }
}

}  // namespace

void SimulationConfig::validate() const {
  requirePositive(market.base_vix, "market.base_vix");
  requireNonNegative(market.normal_gilt_bid_ask_bps,
                     "market.normal_gilt_bid_ask_bps");
  requireNonNegative(market.normal_corp_bid_ask_bps,
                     "market.normal_corp_bid_ask_bps");
  requireFraction(market.repo_availability_floor,
                  "market.repo_availability_floor");
  requireNonNegative(market.repo_availability_stress_slope,
                     "market.repo_availability_stress_slope");
  requirePositive(market.gilt_depth_base, "market.gilt_depth_base");
  requirePositive(market.gilt_depth_min, "market.gilt_depth_min");
  requirePositive(market.corp_depth_base, "market.corp_depth_base");
  requirePositive(market.corp_depth_min, "market.corp_depth_min");
  requireNonNegative(market.gilt_impact_bps, "market.gilt_impact_bps");
  requireNonNegative(market.corp_impact_bps, "market.corp_impact_bps");
  requireNonNegative(market.gilt_10y_passthrough,
                     "market.gilt_10y_passthrough");
  requireNonNegative(market.gilt_30y_passthrough,
                     "market.gilt_30y_passthrough");
  requireNonNegative(market.ig_passthrough, "market.ig_passthrough");
  requireNonNegative(market.hy_passthrough, "market.hy_passthrough");
  requirePositive(market.system_repo_capacity, "market.system_repo_capacity");
  requireNonNegative(market.repo_pressure_slope, "market.repo_pressure_slope");
  requireNonNegative(market.gilt_bid_ask_per_sale,
                     "market.gilt_bid_ask_per_sale");
  requireNonNegative(market.corp_bid_ask_per_sale,
                     "market.corp_bid_ask_per_sale");

  requireFraction(efficiency.sale_floor, "efficiency.sale_floor");
  requirePositive(efficiency.spread_divisor, "efficiency.spread_divisor");
  requireFraction(efficiency.central_bank, "efficiency.central_bank");
  requireFraction(efficiency.redemption, "efficiency.redemption");
  requireFraction(efficiency.other, "efficiency.other");

  if (feedback.iterations < 0) {
    throw std::invalid_argument(
        "config.feedback.iterations must be >= 0, got " +
        std::to_string(feedback.iterations));
  }
  requireNonNegative(feedback.hf_funding_stress_coeff,
                     "feedback.hf_funding_stress_coeff");
  requireNonNegative(feedback.bank_counterparty_loss_coeff,
                     "feedback.bank_counterparty_loss_coeff");
  requireNonNegative(feedback.redemption_pressure_coeff,
                     "feedback.redemption_pressure_coeff");
  requireNonNegative(feedback.broadcast_coeff, "feedback.broadcast_coeff");
  requireNonNegative(feedback.reputation_coeff, "feedback.reputation_coeff");
  requireNonNegative(feedback.crowding_coeff, "feedback.crowding_coeff");

  requirePositive(bank.repo_refusal_stress_threshold,
                  "bank.repo_refusal_stress_threshold");
  requireFraction(bank.tightening_rate, "bank.tightening_rate");
  requireFraction(bank.roll_willingness_floor, "bank.roll_willingness_floor");

  requireNonNegative(redemption.rate, "redemption.rate");
  requireNonNegative(redemption.ldi_weight, "redemption.ldi_weight");
  requireNonNegative(redemption.insurer_weight, "redemption.insurer_weight");
  requireNonNegative(redemption.hedge_fund_weight,
                     "redemption.hedge_fund_weight");
  requireNonNegative(redemption.fund_complex_weight,
                     "redemption.fund_complex_weight");
  requirePositive(redemption.gate_threshold, "redemption.gate_threshold");
  requireFraction(redemption.gate_dampening, "redemption.gate_dampening");

  requireRange(network.hedge_fund_banks, "network.hedge_fund_banks");
  requireRange(network.ldi_banks, "network.ldi_banks");
  requireRange(network.insurer_banks, "network.insurer_banks");
  requireRange(network.redemption_funds, "network.redemption_funds");
  requireRange(network.fund_cross_holdings, "network.fund_cross_holdings");

  requirePositive(amplification_epsilon, "amplification_epsilon");
  requirePositive(min_buffer, "min_buffer");
}

}  // namespace domain
}  // namespace liqsim
