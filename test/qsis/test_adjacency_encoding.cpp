/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "ir/QuantumComputation.hpp"
#include "qsis/AdjacencyEncoding.hpp"
#include "qsis/CircuitUtils.hpp"
#include "qsis/Graph.hpp"
#include "qsis/Types.hpp"
#include "qsis/backend/DDSimulatorBackend.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <gmock/gmock-matchers.h>
#include <gmock/gmock-more-matchers.h>
#include <gtest/gtest.h>

namespace qsis {
TEST(AdjacencyEncodingTest, Layout) {
  const Graph graph(5, {{0, 1}, {1, 2}, {2, 3}, {3, 4}, {4, 0}});
  const auto encoding = encode(graph);
  EXPECT_EQ(encoding.getNvertices(), 5);
  EXPECT_EQ(encoding.getWidth(), 3);
  EXPECT_THAT(encoding.getAxisI(), ::testing::ElementsAre(0, 1, 2));
  EXPECT_THAT(encoding.getAxisJ(), ::testing::ElementsAre(3, 4, 5));
  EXPECT_EQ(encoding.getAncilla(), 6);
  EXPECT_EQ(encoding.getCircuit().getNqubits(), 7);
  // one gate per ordered adjacent pair
  EXPECT_EQ(encoding.getCircuit().size(), 10);
  EXPECT_FALSE(encoding.isTrivial());
}
TEST(AdjacencyEncodingTest, Addresses) {
  const Graph graph(3, {{0, 2}});
  const auto encoding = encode(graph);
  EXPECT_EQ(encoding.getWidth(), 2);
  // 0 | (2 << 2) = 8 and 2 | (0 << 2) = 2
  EXPECT_THAT(encoding.getAddresses(), ::testing::ElementsAre(2, 8));
  EXPECT_EQ(encoding.decodeAddress(8), (Edge{0, 2}));
  EXPECT_EQ(encoding.decodeAddress(2), (Edge{2, 0}));
}
TEST(AdjacencyEncodingTest, RecoversGraph) {
  const Graph graph(6, {{0, 5}, {1, 3}, {2, 4}, {3, 4}});
  const auto encoding = encode(graph);
  EXPECT_EQ(encoding.getEdges(), graph.getEdges());
  for (Vertex u = 0; u < 6; ++u) {
    for (Vertex v = 0; v < 6; ++v) {
      EXPECT_EQ(encoding.isAdjacent(u, v), graph.isAdjacent(u, v));
    }
  }
  // padding addresses never hold an edge
  EXPECT_FALSE(encoding.isAdjacent(6, 7));
}
TEST(AdjacencyEncodingTest, Deterministic) {
  const Graph first(4, {{0, 1}, {2, 3}, {1, 2}});
  const Graph second(4, {{2, 3}, {1, 0}, {2, 1}});
  EXPECT_EQ(encode(first).toOpenQASM(), encode(second).toOpenQASM());
  EXPECT_EQ(encode(first).getAddresses(), encode(second).getAddresses());
}
TEST(AdjacencyEncodingTest, DifferentGraphsDiffer) {
  const Graph path(3, {{0, 1}, {1, 2}});
  const Graph triangle(3, {{0, 1}, {1, 2}, {0, 2}});
  EXPECT_NE(encode(path).toOpenQASM(), encode(triangle).toOpenQASM());
}
TEST(AdjacencyEncodingTest, SingleVertexIsTrivial) {
  const Graph graph(1, {});
  const auto encoding = encode(graph);
  EXPECT_EQ(encoding.getWidth(), 0);
  EXPECT_TRUE(encoding.isTrivial());
  EXPECT_THAT(encoding.getAxisI(), ::testing::IsEmpty());
  EXPECT_THAT(encoding.getAxisJ(), ::testing::IsEmpty());
  EXPECT_EQ(encoding.getCircuit().getNqubits(), 1);
  EXPECT_EQ(encoding.getCircuit().size(), 0);
}
TEST(AdjacencyEncodingTest, EdgelessGraphIsTrivial) {
  const Graph graph(4, {});
  const auto encoding = encode(graph);
  EXPECT_TRUE(encoding.isTrivial());
  EXPECT_EQ(encoding.getCircuit().size(), 0);
}
TEST(AdjacencyEncodingTest, FlipsPhaseOfAdjacentPairs) {
  const Graph graph(3, {{0, 1}, {1, 2}});
  const auto encoding = encode(graph);
  const auto& circuit = encoding.getCircuit();
  const auto nQubits = circuit.getNqubits();

  qc::QuantumComputation qc;
  addRegister(qc, nQubits, "q");
  for (std::size_t q = 0; q < nQubits; ++q) {
    qc.h(static_cast<qc::Qubit>(q));
  }
  appendCircuit(qc, circuit);
  const auto state = DDSimulatorBackend::simulate(qc);

  const auto amplitude = 1. / std::sqrt(static_cast<double>(1ULL << nQubits));
  const auto w = encoding.getWidth();
  for (BasisState s = 0; s < (1ULL << nQubits); ++s) {
    const auto i = static_cast<Vertex>(s & ((1ULL << w) - 1));
    const auto j = static_cast<Vertex>((s >> w) & ((1ULL << w) - 1));
    const auto a = (s >> encoding.getAncilla()) & 1U;
    const auto flipped = a == 1U && graph.isAdjacent(i, j);
    EXPECT_NEAR(state[s].real(), flipped ? -amplitude : amplitude, 1e-9);
  }
}
} // namespace qsis
