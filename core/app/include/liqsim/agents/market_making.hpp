#pragma once

#include "liqsim/domain/agent_profiles.hpp"
#include "liqsim/domain/agent_state.hpp"

namespace liqsim {

struct AbsorptionTotals {
  double gilt{0.0};
  double corp{0.0};
};

// Absorbs up to `offered` gilt (or corporate) selling into one bank's
// remaining capacity: min(offered, remaining * risk_appetite). The absorbed
// amount is added to the used capacity permanently.
double absorbGiltSelling(domain::BankProfile& bank, double offered);
double absorbCorpSelling(domain::BankProfile& bank, double offered);

// -----------------------------------------------------------------------------
// absorbSellingPressure(agents, gilt_selling, corp_selling)
// -----------------------------------------------------------------------------
// @brief  Second pass of the register-then-absorb rule.
//
// @details
// Runs after every agent has registered its sales. Each bank is offered the
// day's total selling pro-rata to its remaining capacity, where the remaining
// capacities are all read before any bank absorbs:
//
//   offered_i = total * remaining_i / Σ remaining
//
// Gilt and corporate capacities are handled independently. Because the
// shares are fixed up front the outcome does not depend on bank order.
//
// @return Totals absorbed across all banks.
// -----------------------------------------------------------------------------
AbsorptionTotals absorbSellingPressure(domain::Population& agents,
                                       double gilt_selling,
                                       double corp_selling);

}  // namespace liqsim
