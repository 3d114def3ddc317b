#pragma once

#include "liqsim/domain/agent_state.hpp"
#include "liqsim/domain/agent_type.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace liqsim {

// -----------------------------------------------------------------------------
// EdgeKind: purpose of a bilateral relationship
// -----------------------------------------------------------------------------
//   PrimeBrokerage   Bank ↔ HedgeFund   (prime brokerage / repo)
//   Clearing         Bank ↔ LdiPension  (clearing member)
//   DerivativesRepo  Bank ↔ Insurer     (derivatives / repo)
//   Redemption       non-bank → FundComplex (directed: redeemer → fund)
// -----------------------------------------------------------------------------
enum class EdgeKind {
  PrimeBrokerage,
  Clearing,
  DerivativesRepo,
  Redemption,
};

inline constexpr std::array<EdgeKind, 4> kAllEdgeKinds{
    EdgeKind::PrimeBrokerage, EdgeKind::Clearing, EdgeKind::DerivativesRepo,
    EdgeKind::Redemption};

const char* toString(EdgeKind kind);

// Edge kind linking a non-bank of `type` to its banks; nullopt for banks and
// fund-complexes, which have no bank relationship.
std::optional<EdgeKind> bankEdgeKindFor(domain::AgentType type);

struct NetworkSummary {
  std::size_t total_nodes{0};
  std::size_t total_edges{0};
  std::size_t prime_brokerage_edges{0};
  std::size_t clearing_edges{0};
  std::size_t derivatives_repo_edges{0};
  std::size_t redemption_edges{0};
};

// -----------------------------------------------------------------------------
// RelationshipNetwork: who may transact with whom
// -----------------------------------------------------------------------------
//
// @brief  Multi-relation graph over agent ids. Restricts repo routing,
//         redemption routing and bilateral feedback to connected pairs.
//
// @details
// Storage is one adjacency list per (agent, slot), where the slots are the
// three bank edge kinds plus two directed redemption slots (targets and
// redeemers). Every query is O(degree); nothing scans the population.
//
// connect() enforces the type pairing of each kind, so every non-bank-to-bank
// edge carries a kind consistent with both endpoints. Duplicate edges are
// ignored.
//
// Lifecycle:
//   Built once before the run (see buildNetwork()) and then only read. The
//   Simulation holds it by value; agents see it through const references.
// -----------------------------------------------------------------------------
class RelationshipNetwork {
 public:
  // Node i has type agent_types[i].
  explicit RelationshipNetwork(std::vector<domain::AgentType> agent_types);

  // Convenience: node types taken from the population, in order.
  static RelationshipNetwork forPopulation(const domain::Population& population);

  // ---------------------------------------------------------------------------
  // connect(a, b, kind)
  // ---------------------------------------------------------------------------
  // @brief  Adds an edge of the given kind.
  //
  // @details
  // Bank kinds are symmetric; argument order does not matter. Redemption is
  // directed: `a` redeems from fund-complex `b`.
  //
  // Throws std::invalid_argument for an out-of-range id, a self-edge, or an
  // endpoint pair that does not fit the kind.
  // ---------------------------------------------------------------------------
  void connect(domain::AgentId a, domain::AgentId b, EdgeKind kind);

  // Counterparties of `id` over `kind`. For Redemption: the funds `id`
  // redeems from.
  const std::vector<domain::AgentId>& neighbors(domain::AgentId id,
                                                EdgeKind kind) const;

  // Agents that redeem from fund-complex `fund`.
  const std::vector<domain::AgentId>& redeemers(domain::AgentId fund) const;

  // Banks a non-bank may route repo requests to; empty for banks and funds.
  const std::vector<domain::AgentId>& connectedBanks(domain::AgentId id) const;

  bool connected(domain::AgentId a, domain::AgentId b, EdgeKind kind) const;

  std::size_t agentCount() const { return types_.size(); }
  std::size_t edgeCount(EdgeKind kind) const;
  std::size_t edgeCount() const;
  domain::AgentType typeOf(domain::AgentId id) const;

  NetworkSummary summary() const;

 private:
  enum Slot : std::size_t {
    kPrimeBrokerageSlot = 0,
    kClearingSlot,
    kDerivativesRepoSlot,
    kRedemptionTargetsSlot,
    kRedeemersSlot,
    kSlotCount,
  };

  using Adjacency = std::array<std::vector<domain::AgentId>, kSlotCount>;

  static Slot slotFor(EdgeKind kind);
  void requireId(domain::AgentId id) const;
  void requirePairing(domain::AgentId a, domain::AgentId b,
                      EdgeKind kind) const;

  std::vector<domain::AgentType> types_;
  std::vector<Adjacency> adjacency_;
  std::array<std::size_t, 4> edge_counts_{};
};

}  // namespace liqsim
