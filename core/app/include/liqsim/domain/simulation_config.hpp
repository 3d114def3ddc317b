#pragma once

namespace liqsim {
namespace domain {

// Inclusive [min, max] number of counterparties drawn by the network builder.
struct DegreeRange {
  int min{1};
  int max{1};
};

// -----------------------------------------------------------------------------
// SimulationConfig: run-wide calibration
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of calibration parameters read by the market
//         state, the agent mechanics, the network builder and the feedback
//         engine.
//
// @details
// Loaded once before a run (defaults below, optionally patched from JSON by
// io::parseConfig) and copied into the Simulation at construction. Nothing
// mutates it while a run is in progress.
//
// Units follow the scenario conventions: yields and spreads in bps, equity
// and FX in percent, amounts in GBP millions.
//
// The default values reproduce the SWES-1 calibration anchors. The
// reputation and crowding coefficients are calibration knobs rather than
// published constants.
//
// Thread model:
//   Plain data struct with value semantics, copied into components.
// -----------------------------------------------------------------------------
struct SimulationConfig {
  struct MarketParams {
    double base_vix{15.0};  // vix level at which stress intensity == 1
    double normal_gilt_bid_ask_bps{2.0};
    double normal_corp_bid_ask_bps{5.0};
    double repo_availability_floor{0.5};
    double repo_availability_stress_slope{0.15};
    double gilt_depth_base{5000.0};
    double gilt_depth_min{1000.0};
    double corp_depth_base{2000.0};
    double corp_depth_min{500.0};
    double gilt_impact_bps{20.0};  // per unit of selling / depth
    double corp_impact_bps{30.0};
    double gilt_10y_passthrough{0.5};
    double gilt_30y_passthrough{0.7};
    double ig_passthrough{0.6};
    double hy_passthrough{1.2};
    double system_repo_capacity{50000.0};
    double repo_pressure_slope{0.25};
    double gilt_bid_ask_per_sale{0.001};  // bps per GBP mm sold
    double corp_bid_ask_per_sale{0.002};
  } market;

  // Fraction of each action's amount that actually restores liquidity.
  struct EfficiencyParams {
    double sale_floor{0.5};
    double spread_divisor{100.0};
    double central_bank{0.95};
    double redemption{0.90};
    double other{0.80};
  } efficiency;

  struct FeedbackParams {
    int iterations{3};
    double hf_funding_stress_coeff{0.05};
    double bank_counterparty_loss_coeff{0.005};
    double redemption_pressure_coeff{0.1};
    double broadcast_coeff{0.05};
    double reputation_coeff{0.15};
    double crowding_coeff{0.03};
  } feedback;

  struct BankParams {
    // Stress ratio E1/B0 at which willingness to extend new repo hits zero.
    double repo_refusal_stress_threshold{0.266353};
    double tightening_rate{0.3};
    double roll_willingness_floor{0.5};
  } bank;

  struct RedemptionParams {
    double rate{0.001};
    double ldi_weight{2.0};      // times the fund's pension investor share
    double insurer_weight{1.5};  // times the fund's insurer investor share
    double hedge_fund_weight{0.5};
    double fund_complex_weight{0.5};
    double gate_threshold{0.15};  // cumulative redemptions / size
    double gate_dampening{0.5};
  } redemption;

  struct NetworkParams {
    DegreeRange hedge_fund_banks{2, 3};
    DegreeRange ldi_banks{1, 2};
    DegreeRange insurer_banks{1, 3};
    DegreeRange redemption_funds{1, 3};
    DegreeRange fund_cross_holdings{0, 1};
  } network;

  double amplification_epsilon{0.001};

  // Absolute floor under every B0 so a zero-asset agent still has B0 > 0.
  double min_buffer{0.001};

  // Per-day progress lines on std::cout.
  bool verbose{true};

  // ---------------------------------------------------------------------------
  // validate()
  // ---------------------------------------------------------------------------
  // @brief  Rejects a calibration that cannot drive a run.
  //
  // @details
  // Throws std::invalid_argument naming the first offending field. Checks:
  // finite and non-negative coefficients, strictly positive divisors and
  // floors, efficiencies within [0, 1], iterations >= 0 and well-formed
  // degree ranges (0 <= min <= max).
  // ---------------------------------------------------------------------------
  void validate() const;
};

}  // namespace domain
}  // namespace liqsim
