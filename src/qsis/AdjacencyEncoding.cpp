/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/AdjacencyEncoding.hpp"

#include "ir/QuantumComputation.hpp"
#include "ir/operations/Control.hpp"
#include "qsis/CircuitUtils.hpp"
#include "qsis/Graph.hpp"
#include "qsis/Types.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace qsis {
auto AdjacencyEncoding::decodeAddress(const std::uint64_t address) const
    -> Edge {
  const auto mask = (std::uint64_t{1} << width_) - 1U;
  return {static_cast<Vertex>(address & mask),
          static_cast<Vertex>(address >> width_)};
}

auto AdjacencyEncoding::isAdjacent(const Vertex u, const Vertex v) const
    -> bool {
  if (u >= nVertices_ || v >= nVertices_) {
    return false;
  }
  return std::binary_search(addresses_.cbegin(), addresses_.cend(),
                            address(u, v));
}

auto AdjacencyEncoding::getEdges() const -> std::vector<Edge> {
  std::vector<Edge> edges;
  for (const auto addr : addresses_) {
    const auto [u, v] = decodeAddress(addr);
    if (u < v) {
      edges.emplace_back(u, v);
    }
  }
  std::sort(edges.begin(), edges.end());
  return edges;
}

auto AdjacencyEncoding::toOpenQASM() const -> std::string {
  return qsis::toOpenQASM(circuit_);
}

auto encode(const Graph& graph) -> AdjacencyEncoding {
  AdjacencyEncoding encoding;
  encoding.nVertices_ = graph.getNvertices();
  encoding.width_ = ceilLog2(graph.getNvertices());
  encoding.axisI_ = addRegister(encoding.circuit_, encoding.width_, "i");
  encoding.axisJ_ = addRegister(encoding.circuit_, encoding.width_, "j");
  encoding.ancilla_ = addRegister(encoding.circuit_, 1, "a").front();

  for (const auto& [u, v] : graph.getEdges()) {
    encoding.addresses_.emplace_back(encoding.address(u, v));
    encoding.addresses_.emplace_back(encoding.address(v, u));
  }
  std::sort(encoding.addresses_.begin(), encoding.addresses_.end());

  // one phase flip per address, the address order makes the circuit unique
  for (const auto addr : encoding.addresses_) {
    const auto [u, v] = encoding.decodeAddress(addr);
    auto controls = controlsForValue(encoding.axisI_, u);
    controls.merge(controlsForValue(encoding.axisJ_, v));
    encoding.circuit_.mcz(controls, encoding.ancilla_);
  }
  SPDLOG_DEBUG("Encoded graph with {} vertices and {} edges using {} qubits "
               "and {} gates",
               graph.getNvertices(), graph.getNedges(),
               encoding.circuit_.getNqubits(), encoding.circuit_.size());
  return encoding;
}
} // namespace qsis
