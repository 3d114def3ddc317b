#include "liqsim/feedback/feedback_engine.hpp"
#include "liqsim/agents/agent_mechanics.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace liqsim {

using domain::AgentState;
using domain::AgentType;
namespace items = domain::items;

FeedbackEngine::FeedbackEngine(const domain::SimulationConfig& config)
    : params_(config.feedback), base_vix_(config.market.base_vix) {}

// -----------------------------------------------------------------------------
// run: `iterations` rounds of market impact followed by E2 accumulation
// -----------------------------------------------------------------------------
double FeedbackEngine::run(domain::Population& agents, MarketState& market,
                           const RelationshipNetwork& network) const {
  double added = 0.0;
  for (int i = 0; i < params_.iterations; ++i) {
    market.applyEndogenousFeedback();
    added += iterate(agents, market, network);
  }
  return added;
}

double FeedbackEngine::iterate(domain::Population& agents,
                               const MarketState& market,
                               const RelationshipNetwork& network) const {
  double added = 0.0;
  for (AgentState& agent : agents) {
    const double e2 = termsFor(agent, agents, market, network).total();
    applyStage3(agent, e2);
    added += e2;
  }
  return added;
}

FeedbackTerms FeedbackEngine::termsFor(const AgentState& agent,
                                       const domain::Population& agents,
                                       const MarketState& market,
                                       const RelationshipNetwork& network) const {
  FeedbackTerms terms;
  if (agents.empty()) {
    return terms;
  }

  std::size_t reacting = 0;
  std::size_t same_type = 0;
  std::size_t same_type_reacting = 0;
  for (const AgentState& other : agents) {
    if (other.reacted) ++reacting;
    if (other.type == agent.type) {
      ++same_type;
      if (other.reacted) ++same_type_reacting;
    }
  }
  if (reacting == 0) {
    return terms;
  }

  const double s = std::max(1.0, market.vix() / base_vix_);

  terms.bilateral = bilateral(agent, agents, network, s);

  // Broadcast: crowded markets hurt holders of liquid assets, reacting or not.
  const double reacting_fraction =
      static_cast<double>(reacting) / static_cast<double>(agents.size());
  for (const auto& item : agent.balance_sheet) {
    if (item.category != domain::ItemCategory::LiquidAsset) {
      continue;
    }
    for (const auto& entry : item.sensitivities) {
      terms.broadcast += item.amount * std::abs(entry.second) * 1e-4 * s *
                         params_.broadcast_coeff * reacting_fraction;
    }
  }

  if (agent.reacted) {
    const double own_actions = agent.actionTotal();
    terms.reputation =
        own_actions * (std::sqrt(s) - 1.0) * params_.reputation_coeff;

    const double crowd = static_cast<double>(same_type_reacting) /
                         static_cast<double>(same_type);
    terms.crowding = own_actions * crowd * crowd * s * params_.crowding_coeff;
  }
  return terms;
}

// -----------------------------------------------------------------------------
// bilateral: network-routed losses from reacting counterparties
// -----------------------------------------------------------------------------
double FeedbackEngine::bilateral(const AgentState& agent,
                                 const domain::Population& agents,
                                 const RelationshipNetwork& network,
                                 double s) const {
  double loss = 0.0;

  switch (agent.type) {
    case AgentType::HedgeFund: {
      const double repo =
          domain::itemAmount(agent.balance_sheet, items::kRepoBorrowing);
      for (domain::AgentId id : network.connectedBanks(agent.id)) {
        const AgentState& bank = agents[id];
        if (!bank.reacted) continue;
        loss += repo * (bank.actionTotal() / std::max(bank.liquidity.B0, 1.0)) *
                s * params_.hf_funding_stress_coeff;
      }
      break;
    }
    case AgentType::Bank: {
      for (domain::AgentId id :
           network.neighbors(agent.id, EdgeKind::PrimeBrokerage)) {
        const AgentState& hf = agents[id];
        if (!hf.reacted) continue;
        const double hf_stress =
            hf.liquidity.E1 / std::max(hf.liquidity.B0, 1.0);
        const std::size_t hf_banks =
            std::max<std::size_t>(1, network.connectedBanks(id).size());
        const double exposure =
            domain::itemAmount(hf.balance_sheet, items::kRepoBorrowing) /
            static_cast<double>(hf_banks);
        loss += hf_stress * exposure * params_.bank_counterparty_loss_coeff * s;
      }
      break;
    }
    case AgentType::FundComplex: {
      for (domain::AgentId id : network.redeemers(agent.id)) {
        const AgentState& redeemer = agents[id];
        if (!redeemer.reacted) continue;
        loss += redeemer.actionTotal() * params_.redemption_pressure_coeff;
      }
      break;
    }
    case AgentType::LdiPension:
    case AgentType::Insurer:
      break;
  }
  return loss;
}

}  // namespace liqsim
