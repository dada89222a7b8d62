/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#pragma once

#include "qsis/Exceptions.hpp"
#include "qsis/Types.hpp"

#include <cstddef>
#include <fstream>
#include <istream>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qsis {
/**
 * @brief Simple undirected graph used as target and pattern of the search.
 * @details The graph is immutable after construction. Adjacency is stored in
 * a dense matrix such that lookups take constant time. The relation is
 * symmetric and irreflexive, i.e., self-loops are rejected on construction.
 */
class Graph {
  std::size_t nVertices_ = 0;
  /// sorted list of edges (u, v) with u < v
  std::vector<Edge> edges_;
  /// row-major n x n adjacency matrix
  std::vector<bool> adjacency_;

public:
  Graph() = default;
  /**
   * Construct a graph from its vertex count and edge list.
   * @param nVertices is the number of vertices, labeled 0..nVertices-1
   * @param edges is the list of undirected edges, the orientation of an edge
   * is irrelevant
   * @throws InvalidGraphError if an edge references a vertex outside of
   * [0, nVertices), is a self-loop, or occurs more than once, or if
   * nVertices does not fit into a Vertex
   */
  Graph(std::size_t nVertices, const std::vector<Edge>& edges);

  /**
   * Construct a graph from a square adjacency matrix. Entries are
   * interpreted as booleans, i.e., every non-zero entry denotes an edge.
   * @throws InvalidGraphError if the matrix is not square, not symmetric, or
   * has a non-zero diagonal entry
   */
  [[nodiscard]] static auto fromAdjacencyMatrix(const AdjacencyMatrix& matrix)
      -> Graph;

  /// Create a graph from a JSON file, see @ref fromJSON for the format.
  [[nodiscard]] static auto fromJSONFile(const std::string& filename)
      -> Graph {
    std::ifstream ifs(filename);
    if (!ifs.good()) {
      throw InvalidGraphError("Graph file could not be opened: " + filename);
    }
    return fromJSON(ifs);
  }
  /// Create a graph from a JSON stream, see @ref fromJSON for the format.
  [[nodiscard]] static auto fromJSON(std::istream& is) -> Graph;
  /// Create a graph from a JSON string, see @ref fromJSON for the format.
  [[nodiscard]] static auto fromJSONString(std::string_view json) -> Graph;
  /**
   * Create a graph from its JSON description.
   * @details The expected format is
   * @code{.json}
   * {"vertices": 4, "edges": [[0, 1], [1, 2], [2, 3], [3, 0]]}
   * @endcode
   * @throws InvalidGraphError if the document does not describe a valid graph
   */
  [[nodiscard]] static auto fromJSON(const nlohmann::json& json) -> Graph;

  [[nodiscard]] auto json() const -> nlohmann::json;

  [[nodiscard]] auto getNvertices() const -> std::size_t { return nVertices_; }
  [[nodiscard]] auto getNedges() const -> std::size_t { return edges_.size(); }
  [[nodiscard]] auto getEdges() const -> const std::vector<Edge>& {
    return edges_;
  }
  [[nodiscard]] auto empty() const -> bool { return nVertices_ == 0; }

  /// @return true iff u and v are distinct vertices joined by an edge
  [[nodiscard]] auto isAdjacent(Vertex u, Vertex v) const -> bool {
    if (u >= nVertices_ || v >= nVertices_) {
      return false;
    }
    return adjacency_[(static_cast<std::size_t>(u) * nVertices_) + v];
  }
  [[nodiscard]] auto getNeighbours(Vertex v) const -> std::vector<Vertex>;
  [[nodiscard]] auto getDegree(Vertex v) const -> std::size_t;
  [[nodiscard]] auto getAdjacencyMatrix() const -> AdjacencyMatrix;

  [[nodiscard]] auto operator==(const Graph& other) const -> bool {
    return nVertices_ == other.nVertices_ && edges_ == other.edges_;
  }
  [[nodiscard]] auto operator!=(const Graph& other) const -> bool {
    return !(*this == other);
  }
};
} // namespace qsis
