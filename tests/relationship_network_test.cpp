// =============================================================================
// relationship_network_test.cpp
// =============================================================================
// Unit tests for liqsim::RelationshipNetwork and liqsim::buildNetwork().
//
// Validates:
//   - Edge kinds enforce their type pairing
//   - Bank edges are symmetric; redemption edges are directed
//   - Duplicate edges are ignored and counted once
//   - buildNetwork() honours the degree ranges and is deterministic per seed
// =============================================================================

#include "liqsim/network/network_builder.hpp"
#include "liqsim/network/relationship_network.hpp"

#include "test_population.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using liqsim::EdgeKind;
using liqsim::RelationshipNetwork;
using liqsim::buildNetwork;
using liqsim::domain::SimulationConfig;
using namespace liqsim_test;

namespace {

bool contains(const std::vector<AgentId>& ids, AgentId id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

// Four banks, three hedge funds, one LDI, one insurer, three funds.
Population largerPopulation() {
  Population p;
  for (AgentId i = 0; i < 4; ++i) {
    p.push_back(makeBank(i, "Bank_" + std::to_string(i)));
  }
  p.push_back(makeHedgeFund(4, "HF_4"));
  p.push_back(makeHedgeFund(5, "HF_5"));
  p.push_back(makeHedgeFund(6, "HF_6"));
  p.push_back(makeLdi(7, "LDI_7"));
  p.push_back(makeInsurer(8, "Insurer_8"));
  p.push_back(makeFundComplex(9, "Fund_9"));
  p.push_back(makeFundComplex(10, "Fund_10"));
  p.push_back(makeFundComplex(11, "Fund_11"));
  return p;
}

}  // namespace

// =============================================================================
// Test fixture: the mixed population with an empty network over it.
//   0 Bank_A, 1 Bank_B, 2 HF_Macro, 3 HF_Low, 4 LDI_1, 5 Insurer_1, 6 Fund_1
// =============================================================================
class RelationshipNetworkTest : public ::testing::Test {
 protected:
  Population population = mixedPopulation();
  RelationshipNetwork network = RelationshipNetwork::forPopulation(population);
};

// -----------------------------------------------------------------------------
// 1. Bank edges answer from both sides.
// -----------------------------------------------------------------------------
TEST_F(RelationshipNetworkTest, BankEdgesAreSymmetric) {
  network.connect(2, 0, EdgeKind::PrimeBrokerage);
  network.connect(0, 4, EdgeKind::Clearing);  // argument order does not matter

  EXPECT_TRUE(contains(network.connectedBanks(2), 0));
  EXPECT_TRUE(contains(network.neighbors(0, EdgeKind::PrimeBrokerage), 2));
  EXPECT_TRUE(contains(network.connectedBanks(4), 0));
  EXPECT_TRUE(network.connected(0, 2, EdgeKind::PrimeBrokerage));
  EXPECT_FALSE(network.connected(1, 2, EdgeKind::PrimeBrokerage));
  EXPECT_TRUE(network.connectedBanks(3).empty());
}

// -----------------------------------------------------------------------------
// 2. Redemption edges are directed from redeemer to fund.
// -----------------------------------------------------------------------------
TEST_F(RelationshipNetworkTest, RedemptionEdgesAreDirected) {
  network.connect(4, 6, EdgeKind::Redemption);

  EXPECT_TRUE(contains(network.neighbors(4, EdgeKind::Redemption), 6));
  EXPECT_TRUE(contains(network.redeemers(6), 4));
  EXPECT_TRUE(network.redeemers(4).empty());
  EXPECT_FALSE(network.connected(6, 4, EdgeKind::Redemption));
}

// -----------------------------------------------------------------------------
// 3. Pairings that do not fit the edge kind are rejected.
// -----------------------------------------------------------------------------
TEST_F(RelationshipNetworkTest, RejectsMismatchedPairings) {
  EXPECT_THROW(network.connect(0, 1, EdgeKind::PrimeBrokerage),
               std::invalid_argument);  // bank to bank
  EXPECT_THROW(network.connect(4, 0, EdgeKind::PrimeBrokerage),
               std::invalid_argument);  // LDI over a hedge-fund kind
  EXPECT_THROW(network.connect(0, 6, EdgeKind::Redemption),
               std::invalid_argument);  // banks do not redeem
  EXPECT_THROW(network.connect(2, 3, EdgeKind::Redemption),
               std::invalid_argument);  // target is not a fund
  EXPECT_THROW(network.connect(2, 2, EdgeKind::PrimeBrokerage),
               std::invalid_argument);
  EXPECT_THROW(network.connect(2, 99, EdgeKind::PrimeBrokerage),
               std::invalid_argument);
  EXPECT_EQ(network.edgeCount(), 0u);
}

// -----------------------------------------------------------------------------
// 4. Connecting the same pair twice leaves one edge.
// -----------------------------------------------------------------------------
TEST_F(RelationshipNetworkTest, DuplicateEdgesIgnored) {
  network.connect(2, 0, EdgeKind::PrimeBrokerage);
  network.connect(0, 2, EdgeKind::PrimeBrokerage);
  network.connect(5, 1, EdgeKind::DerivativesRepo);

  EXPECT_EQ(network.connectedBanks(2).size(), 1u);
  EXPECT_EQ(network.edgeCount(EdgeKind::PrimeBrokerage), 1u);

  const auto summary = network.summary();
  EXPECT_EQ(summary.total_nodes, 7u);
  EXPECT_EQ(summary.total_edges, 2u);
  EXPECT_EQ(summary.derivatives_repo_edges, 1u);
}

// -----------------------------------------------------------------------------
// 5. Every drawn degree lies inside its configured range.
// -----------------------------------------------------------------------------
TEST(NetworkBuilderTest, HonoursDegreeRanges) {
  const Population population = largerPopulation();
  SimulationConfig::NetworkParams params;
  params.hedge_fund_banks = {2, 3};
  params.ldi_banks = {1, 2};
  params.insurer_banks = {1, 3};
  params.redemption_funds = {1, 2};
  params.fund_cross_holdings = {0, 1};

  for (std::uint64_t seed = 1; seed <= 20; ++seed) {
    const RelationshipNetwork network = buildNetwork(population, params, seed);

    for (AgentId hf : {4u, 5u, 6u}) {
      const auto degree = network.connectedBanks(hf).size();
      EXPECT_GE(degree, 2u);
      EXPECT_LE(degree, 3u);
      const auto funds = network.neighbors(hf, EdgeKind::Redemption).size();
      EXPECT_GE(funds, 1u);
      EXPECT_LE(funds, 2u);
    }
    EXPECT_GE(network.connectedBanks(7).size(), 1u);
    EXPECT_LE(network.connectedBanks(7).size(), 2u);
    EXPECT_GE(network.connectedBanks(8).size(), 1u);
    EXPECT_LE(network.connectedBanks(8).size(), 3u);

    for (AgentId fund : {9u, 10u, 11u}) {
      EXPECT_LE(network.neighbors(fund, EdgeKind::Redemption).size(), 1u);
      EXPECT_FALSE(network.connected(fund, fund, EdgeKind::Redemption));
    }
    for (AgentId bank = 0; bank < 4; ++bank) {
      EXPECT_TRUE(network.redeemers(bank).empty());
      EXPECT_TRUE(network.neighbors(bank, EdgeKind::Redemption).empty());
    }
  }
}

// -----------------------------------------------------------------------------
// 6. The degree is clamped to the number of candidates.
// -----------------------------------------------------------------------------
TEST(NetworkBuilderTest, DegreeClampedToCandidates) {
  Population population;
  population.push_back(makeBank(0, "Only_Bank"));
  population.push_back(makeHedgeFund(1, "HF"));

  SimulationConfig::NetworkParams params;
  params.hedge_fund_banks = {2, 3};
  const RelationshipNetwork network = buildNetwork(population, params, 7);
  EXPECT_EQ(network.connectedBanks(1).size(), 1u);
  EXPECT_TRUE(network.neighbors(1, EdgeKind::Redemption).empty());
}

// -----------------------------------------------------------------------------
// 7. Same population, params and seed give the same edges in the same order.
// -----------------------------------------------------------------------------
TEST(NetworkBuilderTest, DeterministicPerSeed) {
  const Population population = largerPopulation();
  const SimulationConfig::NetworkParams params;

  const RelationshipNetwork a = buildNetwork(population, params, 42);
  const RelationshipNetwork b = buildNetwork(population, params, 42);

  for (AgentId id = 0; id < population.size(); ++id) {
    for (EdgeKind kind : liqsim::kAllEdgeKinds) {
      EXPECT_EQ(a.neighbors(id, kind), b.neighbors(id, kind));
    }
    EXPECT_EQ(a.redeemers(id), b.redeemers(id));
  }
  EXPECT_EQ(a.edgeCount(), b.edgeCount());
}
