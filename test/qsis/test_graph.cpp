/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/Exceptions.hpp"
#include "qsis/Graph.hpp"
#include "qsis/Types.hpp"

#include <cstddef>
#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

namespace qsis {
TEST(GraphTest, Construction) {
  const Graph graph(4, {{1, 0}, {1, 2}, {3, 2}});
  EXPECT_EQ(graph.getNvertices(), 4);
  EXPECT_EQ(graph.getNedges(), 3);
  EXPECT_THAT(graph.getEdges(),
              ::testing::ElementsAre(Edge{0, 1}, Edge{1, 2}, Edge{2, 3}));
  EXPECT_FALSE(graph.empty());
}
TEST(GraphTest, Empty) {
  const Graph graph;
  EXPECT_TRUE(graph.empty());
  EXPECT_EQ(graph.getNedges(), 0);
  EXPECT_FALSE(graph.isAdjacent(0, 0));
}
TEST(GraphTest, AdjacencyIsSymmetricAndIrreflexive) {
  const Graph graph(4, {{0, 1}, {1, 2}, {2, 3}, {3, 0}});
  for (Vertex u = 0; u < 4; ++u) {
    EXPECT_FALSE(graph.isAdjacent(u, u));
    for (Vertex v = 0; v < 4; ++v) {
      EXPECT_EQ(graph.isAdjacent(u, v), graph.isAdjacent(v, u));
    }
  }
  EXPECT_TRUE(graph.isAdjacent(3, 0));
  EXPECT_FALSE(graph.isAdjacent(0, 2));
  // out of range lookups are not adjacent
  EXPECT_FALSE(graph.isAdjacent(0, 4));
}
TEST(GraphTest, Neighbours) {
  const Graph graph(4, {{0, 1}, {0, 2}, {0, 3}});
  EXPECT_THAT(graph.getNeighbours(0), ::testing::ElementsAre(1, 2, 3));
  EXPECT_THAT(graph.getNeighbours(2), ::testing::ElementsAre(0));
  EXPECT_EQ(graph.getDegree(0), 3);
  EXPECT_EQ(graph.getDegree(3), 1);
}
TEST(GraphTest, RejectsOutOfRangeVertex) {
  EXPECT_THROW(Graph(3, {{0, 3}}), InvalidGraphError);
}
TEST(GraphTest, RejectsVertexCountBeyondVertexRange) {
  EXPECT_THROW(Graph(std::size_t{1} << 32U, {}), InvalidGraphError);
  EXPECT_THROW(Graph(std::numeric_limits<std::size_t>::max(), {}),
               InvalidGraphError);
}
TEST(GraphTest, RejectsSelfLoop) {
  EXPECT_THROW(Graph(3, {{1, 1}}), InvalidGraphError);
}
TEST(GraphTest, RejectsDuplicateEdge) {
  EXPECT_THROW(Graph(3, {{0, 1}, {1, 0}}), InvalidGraphError);
}
TEST(GraphTest, FromAdjacencyMatrix) {
  const AdjacencyMatrix matrix = {
      {0, 1, 0, 1}, {1, 0, 1, 0}, {0, 1, 0, 1}, {1, 0, 1, 0}};
  const auto graph = Graph::fromAdjacencyMatrix(matrix);
  EXPECT_EQ(graph, Graph(4, {{0, 1}, {1, 2}, {2, 3}, {0, 3}}));
  EXPECT_EQ(graph.getAdjacencyMatrix(), matrix);
}
TEST(GraphTest, FromAdjacencyMatrixRejectsInvalidInput) {
  // not square
  EXPECT_THROW(std::ignore = Graph::fromAdjacencyMatrix({{0, 1}, {1}}),
               InvalidGraphError);
  // not symmetric
  EXPECT_THROW(std::ignore = Graph::fromAdjacencyMatrix({{0, 1}, {0, 0}}),
               InvalidGraphError);
  // self-loop
  EXPECT_THROW(std::ignore = Graph::fromAdjacencyMatrix({{1, 0}, {0, 0}}),
               InvalidGraphError);
}
TEST(GraphTest, FromJSONString) {
  const auto graph =
      Graph::fromJSONString(R"({"vertices": 3, "edges": [[0, 1], [2, 1]]})");
  EXPECT_EQ(graph, Graph(3, {{0, 1}, {1, 2}}));
}
TEST(GraphTest, FromJSONStringWithoutEdges) {
  const auto graph = Graph::fromJSONString(R"({"vertices": 2})");
  EXPECT_EQ(graph.getNvertices(), 2);
  EXPECT_EQ(graph.getNedges(), 0);
}
TEST(GraphTest, FromJSONStream) {
  std::istringstream is(R"({"vertices": 2, "edges": [[0, 1]]})");
  EXPECT_EQ(Graph::fromJSON(is), Graph(2, {{0, 1}}));
}
TEST(GraphTest, FromJSONRejectsInvalidInput) {
  EXPECT_THROW(std::ignore = Graph::fromJSONString("{"), InvalidGraphError);
  EXPECT_THROW(std::ignore = Graph::fromJSONString("[]"), InvalidGraphError);
  EXPECT_THROW(std::ignore = Graph::fromJSONString(R"({"edges": []})"),
               InvalidGraphError);
  EXPECT_THROW(std::ignore = Graph::fromJSONString(R"({"vertices": -1})"),
               InvalidGraphError);
  EXPECT_THROW(std::ignore = Graph::fromJSONString(
                   R"({"vertices": 2, "edges": [[0, 1, 2]]})"),
               InvalidGraphError);
  EXPECT_THROW(std::ignore = Graph::fromJSONString(
                   R"({"vertices": 2, "edges": [[0, 2]]})"),
               InvalidGraphError);
}
TEST(GraphTest, FromJSONRejectsWideVertexIndices) {
  // 2^32 must not wrap around to vertex 0
  EXPECT_THROW(std::ignore = Graph::fromJSONString(
                   R"({"vertices": 3, "edges": [[4294967296, 1]]})"),
               InvalidGraphError);
  EXPECT_THROW(std::ignore = Graph::fromJSONString(
                   R"({"vertices": 3, "edges": [[0, 4294967297]]})"),
               InvalidGraphError);
  EXPECT_THROW(std::ignore =
                   Graph::fromJSONString(R"({"vertices": 4294967296})"),
               InvalidGraphError);
}
TEST(GraphTest, FromJSONFileNotFound) {
  EXPECT_THROW(std::ignore = Graph::fromJSONFile("does_not_exist.json"),
               InvalidGraphError);
}
TEST(GraphTest, JSONRoundTrip) {
  const Graph graph(5, {{0, 1}, {1, 2}, {2, 3}, {3, 4}, {4, 0}});
  EXPECT_EQ(Graph::fromJSON(graph.json()), graph);
  EXPECT_EQ(graph.json()["vertices"], 5);
}
} // namespace qsis
