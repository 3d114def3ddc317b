#include "liqsim/network/relationship_network.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace liqsim {

using domain::AgentId;
using domain::AgentType;

namespace {

const std::vector<AgentId> kNoNeighbors;

}  // namespace

const char* toString(EdgeKind kind) {
  switch (kind) {
    case EdgeKind::PrimeBrokerage:
      return "prime_brokerage";
    case EdgeKind::Clearing:
      return "clearing";
    case EdgeKind::DerivativesRepo:
      return "derivatives_repo";
    case EdgeKind::Redemption:
      return "redemption";
  }
  return "unknown";
}

std::optional<EdgeKind> bankEdgeKindFor(AgentType type) {
  switch (type) {
    case AgentType::HedgeFund:
      return EdgeKind::PrimeBrokerage;
    case AgentType::LdiPension:
      return EdgeKind::Clearing;
    case AgentType::Insurer:
      return EdgeKind::DerivativesRepo;
    case AgentType::Bank:
    case AgentType::FundComplex:
      return std::nullopt;
  }
  return std::nullopt;
}

RelationshipNetwork::RelationshipNetwork(std::vector<AgentType> agent_types)
    : types_(std::move(agent_types)), adjacency_(types_.size()) {}

RelationshipNetwork RelationshipNetwork::forPopulation(
    const domain::Population& population) {
  std::vector<AgentType> types;
  types.reserve(population.size());
  for (const auto& agent : population) {
    types.push_back(agent.type);
  }
  return RelationshipNetwork(std::move(types));
}

RelationshipNetwork::Slot RelationshipNetwork::slotFor(EdgeKind kind) {
  switch (kind) {
    case EdgeKind::PrimeBrokerage:
      return kPrimeBrokerageSlot;
    case EdgeKind::Clearing:
      return kClearingSlot;
    case EdgeKind::DerivativesRepo:
      return kDerivativesRepoSlot;
    case EdgeKind::Redemption:
      return kRedemptionTargetsSlot;
  }
  return kRedemptionTargetsSlot;
}

void RelationshipNetwork::requireId(AgentId id) const {
  if (id >= types_.size()) {
    throw std::invalid_argument("network: agent id " + std::to_string(id) +
                                " out of range (" +
                                std::to_string(types_.size()) + " agents)");
  }
}

void RelationshipNetwork::requirePairing(AgentId a, AgentId b,
                                         EdgeKind kind) const {
  const AgentType ta = types_[a];
  const AgentType tb = types_[b];

  bool ok = false;
  if (kind == EdgeKind::Redemption) {
    ok = tb == AgentType::FundComplex && ta != AgentType::Bank;
  } else {
    // Exactly one endpoint is a bank and the other's bank kind matches.
    if (ta == AgentType::Bank && tb != AgentType::Bank) {
      ok = bankEdgeKindFor(tb) == kind;
    } else if (tb == AgentType::Bank && ta != AgentType::Bank) {
      ok = bankEdgeKindFor(ta) == kind;
    }
  }

  if (!ok) {
    throw std::invalid_argument(
        std::string("network: ") + toString(kind) + " edge cannot link " +
        domain::toString(ta) + " #" + std::to_string(a) + " and " +
        domain::toString(tb) + " #" + std::to_string(b));
  }
}

// -----------------------------------------------------------------------------
// connect: add one edge, both directions indexed
// -----------------------------------------------------------------------------
void RelationshipNetwork::connect(AgentId a, AgentId b, EdgeKind kind) {
  requireId(a);
  requireId(b);
  if (a == b) {
    throw std::invalid_argument("network: self-edge on agent " +
                                std::to_string(a));
  }
  requirePairing(a, b, kind);

  if (connected(a, b, kind)) {
    return;
  }

  if (kind == EdgeKind::Redemption) {
    adjacency_[a][kRedemptionTargetsSlot].push_back(b);
    adjacency_[b][kRedeemersSlot].push_back(a);
  } else {
    const Slot slot = slotFor(kind);
    adjacency_[a][slot].push_back(b);
    adjacency_[b][slot].push_back(a);
  }
  ++edge_counts_[static_cast<std::size_t>(kind)];
}

const std::vector<AgentId>& RelationshipNetwork::neighbors(AgentId id,
                                                           EdgeKind kind) const {
  requireId(id);
  return adjacency_[id][slotFor(kind)];
}

const std::vector<AgentId>& RelationshipNetwork::redeemers(AgentId fund) const {
  requireId(fund);
  return adjacency_[fund][kRedeemersSlot];
}

const std::vector<AgentId>& RelationshipNetwork::connectedBanks(
    AgentId id) const {
  requireId(id);
  const auto kind = bankEdgeKindFor(types_[id]);
  if (!kind) {
    return kNoNeighbors;
  }
  return adjacency_[id][slotFor(*kind)];
}

bool RelationshipNetwork::connected(AgentId a, AgentId b, EdgeKind kind) const {
  requireId(a);
  requireId(b);
  const auto& list = adjacency_[a][slotFor(kind)];
  return std::find(list.begin(), list.end(), b) != list.end();
}

std::size_t RelationshipNetwork::edgeCount(EdgeKind kind) const {
  return edge_counts_[static_cast<std::size_t>(kind)];
}

std::size_t RelationshipNetwork::edgeCount() const {
  std::size_t total = 0;
  for (std::size_t count : edge_counts_) {
    total += count;
  }
  return total;
}

AgentType RelationshipNetwork::typeOf(AgentId id) const {
  requireId(id);
  return types_[id];
}

NetworkSummary RelationshipNetwork::summary() const {
  NetworkSummary s;
  s.total_nodes = types_.size();
  s.total_edges = edgeCount();
  s.prime_brokerage_edges = edgeCount(EdgeKind::PrimeBrokerage);
  s.clearing_edges = edgeCount(EdgeKind::Clearing);
  s.derivatives_repo_edges = edgeCount(EdgeKind::DerivativesRepo);
  s.redemption_edges = edgeCount(EdgeKind::Redemption);
  return s;
}

}  // namespace liqsim
