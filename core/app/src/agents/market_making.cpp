#include "liqsim/agents/market_making.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <variant>
#include <vector>

namespace liqsim {

using domain::BankProfile;

namespace {

double absorbInto(double remaining, double risk_appetite, double offered,
                  double& used) {
  if (std::isnan(offered) || offered < 0.0) {
    throw std::domain_error("market making: negative or NaN selling offered");
  }
  if (!(risk_appetite >= 0.0 && risk_appetite <= 1.0)) {
    throw std::domain_error("market making: risk appetite outside [0, 1]");
  }
  const double room = std::max(0.0, remaining) * risk_appetite;
  const double absorbed = std::max(0.0, std::min(offered, room));
  used += absorbed;
  return absorbed;
}

}  // namespace

double absorbGiltSelling(BankProfile& bank, double offered) {
  return absorbInto(bank.giltRemaining(), bank.risk_appetite, offered,
                    bank.gilt_mm_used);
}

double absorbCorpSelling(BankProfile& bank, double offered) {
  return absorbInto(bank.corpRemaining(), bank.risk_appetite, offered,
                    bank.corp_mm_used);
}

AbsorptionTotals absorbSellingPressure(domain::Population& agents,
                                       double gilt_selling,
                                       double corp_selling) {
  std::vector<BankProfile*> banks;
  double gilt_remaining_total = 0.0;
  double corp_remaining_total = 0.0;
  for (auto& agent : agents) {
    if (auto* bank = std::get_if<BankProfile>(&agent.profile)) {
      banks.push_back(bank);
      gilt_remaining_total += std::max(0.0, bank->giltRemaining());
      corp_remaining_total += std::max(0.0, bank->corpRemaining());
    }
  }

  // Shares are fixed before anyone absorbs.
  std::vector<double> gilt_offers(banks.size(), 0.0);
  std::vector<double> corp_offers(banks.size(), 0.0);
  for (std::size_t i = 0; i < banks.size(); ++i) {
    if (gilt_remaining_total > 0.0) {
      gilt_offers[i] = gilt_selling *
                       std::max(0.0, banks[i]->giltRemaining()) /
                       gilt_remaining_total;
    }
    if (corp_remaining_total > 0.0) {
      corp_offers[i] = corp_selling *
                       std::max(0.0, banks[i]->corpRemaining()) /
                       corp_remaining_total;
    }
  }

  AbsorptionTotals totals;
  for (std::size_t i = 0; i < banks.size(); ++i) {
    totals.gilt += absorbGiltSelling(*banks[i], gilt_offers[i]);
    totals.corp += absorbCorpSelling(*banks[i], corp_offers[i]);
  }
  return totals;
}

}  // namespace liqsim
