#pragma once

namespace liqsim {
namespace domain {

// -----------------------------------------------------------------------------
// LiquidityPosition: one agent's buffers and losses for the current day
// -----------------------------------------------------------------------------
//
// @brief  B0..B3 track liquidity headroom through the day's three stages;
//         E1/E2 are the first- and second-round drains.
//
// @details
//   B0  day-start buffer (floored, always > 0)
//   B1  = B0 - E1               after the exogenous shock
//   B2  = B1 + mitigation       after the agent's own reactions
//   B3  = B2 - E2               after systemic feedback
//
// E1 and E2 are losses and are always non-negative. E2 accumulates across
// feedback iterations within a day and is cleared by resetDaily().
//
// Thread model:
//   Plain value type. Written only by the simulation thread.
// -----------------------------------------------------------------------------
struct LiquidityPosition {
  double B0{0.0};
  double B1{0.0};
  double B2{0.0};
  double B3{0.0};
  double E1{0.0};
  double E2{0.0};
};

}  // namespace domain
}  // namespace liqsim
