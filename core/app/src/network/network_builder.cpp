#include "liqsim/network/network_builder.hpp"

#include <algorithm>
#include <cstddef>
#include <random>
#include <vector>

namespace liqsim {

using domain::AgentId;
using domain::AgentType;

namespace {

std::vector<AgentId> idsOfType(const domain::Population& population,
                               AgentType type) {
  std::vector<AgentId> ids;
  for (const auto& agent : population) {
    if (agent.type == type) {
      ids.push_back(agent.id);
    }
  }
  return ids;
}

int drawDegree(std::mt19937_64& rng, const domain::DegreeRange& range,
               std::size_t candidates) {
  const int available = static_cast<int>(candidates);
  const int hi = std::min(range.max, available);
  const int lo = std::min(range.min, hi);
  if (hi <= 0) {
    return 0;
  }
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(rng);
}

// Size-weighted sampling without replacement.
std::vector<AgentId> weightedSample(std::mt19937_64& rng,
                                    const domain::Population& population,
                                    std::vector<AgentId> candidates,
                                    int count) {
  std::vector<AgentId> chosen;
  chosen.reserve(static_cast<std::size_t>(count));

  std::uniform_real_distribution<double> unit(0.0, 1.0);
  while (static_cast<int>(chosen.size()) < count && !candidates.empty()) {
    double total = 0.0;
    for (AgentId id : candidates) {
      total += population[id].size;
    }

    std::size_t pick = candidates.size() - 1;
    if (total > 0.0) {
      double target = unit(rng) * total;
      for (std::size_t i = 0; i < candidates.size(); ++i) {
        target -= population[candidates[i]].size;
        if (target < 0.0) {
          pick = i;
          break;
        }
      }
    } else {
      std::uniform_int_distribution<std::size_t> uniform(
          0, candidates.size() - 1);
      pick = uniform(rng);
    }

    chosen.push_back(candidates[pick]);
    candidates.erase(candidates.begin() +
                     static_cast<std::ptrdiff_t>(pick));
  }
  return chosen;
}

void linkToBanks(std::mt19937_64& rng, const domain::Population& population,
                 const std::vector<AgentId>& members,
                 const std::vector<AgentId>& banks,
                 const domain::DegreeRange& range, EdgeKind kind,
                 RelationshipNetwork& network) {
  for (AgentId member : members) {
    const int degree = drawDegree(rng, range, banks.size());
    for (AgentId bank : weightedSample(rng, population, banks, degree)) {
      network.connect(member, bank, kind);
    }
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// buildNetwork
// -----------------------------------------------------------------------------
RelationshipNetwork buildNetwork(
    const domain::Population& population,
    const domain::SimulationConfig::NetworkParams& params,
    std::uint64_t seed) {
  RelationshipNetwork network = RelationshipNetwork::forPopulation(population);
  std::mt19937_64 rng(seed);

  const auto banks = idsOfType(population, AgentType::Bank);
  const auto hedge_funds = idsOfType(population, AgentType::HedgeFund);
  const auto ldis = idsOfType(population, AgentType::LdiPension);
  const auto insurers = idsOfType(population, AgentType::Insurer);
  const auto funds = idsOfType(population, AgentType::FundComplex);

  linkToBanks(rng, population, hedge_funds, banks, params.hedge_fund_banks,
              EdgeKind::PrimeBrokerage, network);
  linkToBanks(rng, population, ldis, banks, params.ldi_banks,
              EdgeKind::Clearing, network);
  linkToBanks(rng, population, insurers, banks, params.insurer_banks,
              EdgeKind::DerivativesRepo, network);

  // Redemption links from every non-bank investor.
  std::vector<AgentId> investors;
  investors.insert(investors.end(), hedge_funds.begin(), hedge_funds.end());
  investors.insert(investors.end(), ldis.begin(), ldis.end());
  investors.insert(investors.end(), insurers.begin(), insurers.end());
  std::sort(investors.begin(), investors.end());

  for (AgentId investor : investors) {
    const int degree = drawDegree(rng, params.redemption_funds, funds.size());
    for (AgentId fund : weightedSample(rng, population, funds, degree)) {
      network.connect(investor, fund, EdgeKind::Redemption);
    }
  }

  // Fund-of-funds cross-holdings.
  for (AgentId fund : funds) {
    std::vector<AgentId> others;
    for (AgentId other : funds) {
      if (other != fund) {
        others.push_back(other);
      }
    }
    const int degree =
        drawDegree(rng, params.fund_cross_holdings, others.size());
    for (AgentId target : weightedSample(rng, population, others, degree)) {
      network.connect(fund, target, EdgeKind::Redemption);
    }
  }

  return network;
}

}  // namespace liqsim
