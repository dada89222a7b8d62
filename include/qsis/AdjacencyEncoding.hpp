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

#include "ir/Definitions.hpp"
#include "ir/QuantumComputation.hpp"
#include "qsis/Graph.hpp"
#include "qsis/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qsis {
/**
 * @brief Logarithmic-width circuit representation of an adjacency matrix.
 * @details The circuit acts on two vertex-index axes i and j of width
 * w = ceil(log2(n)) each and a single ancilla a. Every ordered pair (u, v) of
 * adjacent vertices is assigned the address u | (v << w) and represented by a
 * multi-controlled Z gate onto a that is controlled by i == u and j == v. The
 * circuit hence implements the diagonal operator that flips the phase of
 * |i, j, a> iff a = 1 and adj(i, j) = 1. Conceptually, this is the flattened
 * adjacency matrix zero-padded to the next power of two.
 *
 * Encodings are created with @ref encode and are a pure function of the graph.
 */
class AdjacencyEncoding {
  std::size_t nVertices_ = 0;
  std::size_t width_ = 0;
  /// sorted addresses of all ordered adjacent pairs
  std::vector<std::uint64_t> addresses_;
  std::vector<qc::Qubit> axisI_;
  std::vector<qc::Qubit> axisJ_;
  qc::Qubit ancilla_ = 0;
  qc::QuantumComputation circuit_;

  friend auto encode(const Graph& graph) -> AdjacencyEncoding;

public:
  AdjacencyEncoding() = default;

  [[nodiscard]] auto getNvertices() const -> std::size_t { return nVertices_; }
  /// @return the number of qubits per vertex-index axis
  [[nodiscard]] auto getWidth() const -> std::size_t { return width_; }
  [[nodiscard]] auto getAddresses() const -> const std::vector<std::uint64_t>& {
    return addresses_;
  }
  [[nodiscard]] auto getAxisI() const -> const std::vector<qc::Qubit>& {
    return axisI_;
  }
  [[nodiscard]] auto getAxisJ() const -> const std::vector<qc::Qubit>& {
    return axisJ_;
  }
  [[nodiscard]] auto getAncilla() const -> qc::Qubit { return ancilla_; }
  [[nodiscard]] auto getCircuit() const -> const qc::QuantumComputation& {
    return circuit_;
  }
  /// @return true for the constant-zero encoding of a graph without edges
  [[nodiscard]] auto isTrivial() const -> bool { return addresses_.empty(); }

  /// @return the address of the vertex pair (u, v)
  [[nodiscard]] auto address(Vertex u, Vertex v) const -> std::uint64_t {
    return static_cast<std::uint64_t>(u) |
           (static_cast<std::uint64_t>(v) << width_);
  }
  /// @return the vertex pair (u, v) stored at the given address
  [[nodiscard]] auto decodeAddress(std::uint64_t address) const -> Edge;
  /// @return the adjacency bit stored at the address of (u, v)
  [[nodiscard]] auto isAdjacent(Vertex u, Vertex v) const -> bool;
  /// @return the undirected edges (u < v) represented by the encoding
  [[nodiscard]] auto getEdges() const -> std::vector<Edge>;
  /// @return the OpenQASM 3 description of the encoding circuit
  [[nodiscard]] auto toOpenQASM() const -> std::string;
};

/**
 * Encode the adjacency matrix of a graph.
 * @details The encoding is deterministic, i.e., encoding identical graphs
 * yields identical circuits. Graphs with a single vertex yield the trivial
 * constant-zero encoding without any gates.
 * @param graph is the graph to encode, it is only read
 * @return the adjacency encoding of the graph
 */
[[nodiscard]] auto encode(const Graph& graph) -> AdjacencyEncoding;
} // namespace qsis
