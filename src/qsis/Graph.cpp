/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/Graph.hpp"

#include "qsis/Exceptions.hpp"
#include "qsis/Types.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qsis {
namespace {
/// @returns the size of the adjacency matrix of a graph with @p nVertices
auto adjacencySize(const std::size_t nVertices) -> std::size_t {
  if (nVertices > std::numeric_limits<Vertex>::max() ||
      (nVertices != 0 &&
       nVertices > std::vector<bool>().max_size() / nVertices)) {
    std::stringstream ss;
    ss << "Graph with " << nVertices << " vertices exceeds the maximum of "
       << std::numeric_limits<Vertex>::max()
       << " vertices or the adjacency matrix capacity";
    throw InvalidGraphError(ss.str());
  }
  return nVertices * nVertices;
}
} // namespace

Graph::Graph(const std::size_t nVertices, const std::vector<Edge>& edges)
    : nVertices_(nVertices), adjacency_(adjacencySize(nVertices), false) {
  edges_.reserve(edges.size());
  for (const auto& [first, second] : edges) {
    if (first >= nVertices_ || second >= nVertices_) {
      std::stringstream ss;
      ss << "Edge (" << first << ", " << second
         << ") references a vertex outside of [0, " << nVertices_ << ")";
      throw InvalidGraphError(ss.str());
    }
    if (first == second) {
      throw InvalidGraphError("Self-loop on vertex " + std::to_string(first) +
                              " is not allowed");
    }
    const auto u = std::min(first, second);
    const auto v = std::max(first, second);
    const auto index = (static_cast<std::size_t>(u) * nVertices_) + v;
    if (adjacency_[index]) {
      std::stringstream ss;
      ss << "Duplicate edge (" << u << ", " << v << ")";
      throw InvalidGraphError(ss.str());
    }
    adjacency_[index] = true;
    adjacency_[(static_cast<std::size_t>(v) * nVertices_) + u] = true;
    edges_.emplace_back(u, v);
  }
  std::sort(edges_.begin(), edges_.end());
}

auto Graph::fromAdjacencyMatrix(const AdjacencyMatrix& matrix) -> Graph {
  const auto n = matrix.size();
  std::vector<Edge> edges;
  for (std::size_t i = 0; i < n; ++i) {
    if (matrix[i].size() != n) {
      throw InvalidGraphError("Adjacency matrix must be square, row " +
                              std::to_string(i) + " has " +
                              std::to_string(matrix[i].size()) + " entries");
    }
  }
  for (std::size_t i = 0; i < n; ++i) {
    if (matrix[i][i] != 0) {
      throw InvalidGraphError("Adjacency matrix has a non-zero diagonal entry "
                              "at " +
                              std::to_string(i));
    }
    for (std::size_t j = i + 1; j < n; ++j) {
      if ((matrix[i][j] != 0) != (matrix[j][i] != 0)) {
        std::stringstream ss;
        ss << "Adjacency matrix is not symmetric at (" << i << ", " << j
           << ")";
        throw InvalidGraphError(ss.str());
      }
      if (matrix[i][j] != 0) {
        edges.emplace_back(static_cast<Vertex>(i), static_cast<Vertex>(j));
      }
    }
  }
  return {n, edges};
}

auto Graph::fromJSON(std::istream& is) -> Graph {
  const auto json = nlohmann::json::parse(is, nullptr, false);
  if (json.is_discarded()) {
    throw InvalidGraphError("Graph description is not valid JSON");
  }
  return fromJSON(json);
}

auto Graph::fromJSONString(const std::string_view json) -> Graph {
  const auto parsed = nlohmann::json::parse(json, nullptr, false);
  if (parsed.is_discarded()) {
    throw InvalidGraphError("Graph description is not valid JSON");
  }
  return fromJSON(parsed);
}

auto Graph::fromJSON(const nlohmann::json& json) -> Graph {
  // JSON Example:
  // {"vertices": 3, "edges": [[0, 1], [1, 2]]}
  if (!json.is_object()) {
    throw InvalidGraphError("Graph description must be a JSON object");
  }
  if (!json.contains("vertices")) {
    throw InvalidGraphError(
        "Number of vertices is missed in graph description");
  }
  if (!json["vertices"].is_number_unsigned()) {
    throw InvalidGraphError(
        "Number of vertices must be a non-negative integer in graph "
        "description");
  }
  const auto nVertices = json["vertices"].get<std::size_t>();
  std::vector<Edge> edges;
  if (json.contains("edges")) {
    if (!json["edges"].is_array()) {
      throw InvalidGraphError("Edges must be an array in graph description");
    }
    for (const auto& edge : json["edges"]) {
      if (!edge.is_array() || edge.size() != 2 ||
          !edge[0].is_number_unsigned() || !edge[1].is_number_unsigned()) {
        throw InvalidGraphError("Every edge must be a pair of non-negative "
                                "integers in graph description");
      }
      const auto u = edge[0].get<std::uint64_t>();
      const auto v = edge[1].get<std::uint64_t>();
      if (u >= nVertices || v >= nVertices ||
          u > std::numeric_limits<Vertex>::max() ||
          v > std::numeric_limits<Vertex>::max()) {
        std::stringstream ss;
        ss << "Edge (" << u << ", " << v
           << ") references a vertex outside of [0, " << nVertices << ")";
        throw InvalidGraphError(ss.str());
      }
      edges.emplace_back(static_cast<Vertex>(u), static_cast<Vertex>(v));
    }
  }
  return {nVertices, edges};
}

auto Graph::json() const -> nlohmann::json {
  nlohmann::json j;
  j["vertices"] = nVertices_;
  auto& edges = j["edges"];
  edges = nlohmann::json::array();
  for (const auto& [u, v] : edges_) {
    edges.push_back({u, v});
  }
  return j;
}

auto Graph::getNeighbours(const Vertex v) const -> std::vector<Vertex> {
  std::vector<Vertex> neighbours;
  for (Vertex u = 0; u < nVertices_; ++u) {
    if (isAdjacent(v, u)) {
      neighbours.emplace_back(u);
    }
  }
  return neighbours;
}

auto Graph::getDegree(const Vertex v) const -> std::size_t {
  std::size_t degree = 0;
  for (Vertex u = 0; u < nVertices_; ++u) {
    if (isAdjacent(v, u)) {
      ++degree;
    }
  }
  return degree;
}

auto Graph::getAdjacencyMatrix() const -> AdjacencyMatrix {
  AdjacencyMatrix matrix(nVertices_, std::vector<std::uint8_t>(nVertices_, 0));
  for (const auto& [u, v] : edges_) {
    matrix[u][v] = 1;
    matrix[v][u] = 1;
  }
  return matrix;
}
} // namespace qsis
