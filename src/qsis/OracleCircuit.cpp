/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/OracleCircuit.hpp"

#include "ir/Definitions.hpp"
#include "ir/QuantumComputation.hpp"
#include "ir/operations/Control.hpp"
#include "ir/operations/OpType.hpp"
#include "qsis/AdjacencyEncoding.hpp"
#include "qsis/CircuitUtils.hpp"
#include "qsis/Exceptions.hpp"
#include "qsis/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qsis {
auto OracleLayout::getMappingQubits() const -> std::vector<qc::Qubit> {
  std::vector<qc::Qubit> qubits;
  qubits.reserve(getMappingWidth());
  for (const auto& block : blocks) {
    qubits.insert(qubits.end(), block.cbegin(), block.cend());
  }
  return qubits;
}

auto OracleLayout::json() const -> nlohmann::json {
  nlohmann::json j;
  j["pattern_vertices"] = nPatternVertices;
  j["block_width"] = blockWidth;
  j["mapping_qubits"] = getMappingWidth();
  j["edge_flags"] = edgeFlags.size();
  j["distinct_flags"] = distinctFlags.size();
  j["range_flags"] = rangeFlags.size();
  j["marking_qubit"] = markingQubit;
  j["qubits"] = nQubits;
  return j;
}

auto OracleCircuit::addEdgeFlag(const Edge& edge, const qc::Qubit flag)
    -> void {
  // instantiate the target encoding with axis i on the block of the first
  // endpoint, axis j on the block of the second endpoint, and the ancilla on
  // the flag; every controlled Z becomes a controlled X
  const auto& encoding = target_.getCircuit();
  std::vector<qc::Qubit> qubitMap(encoding.getNqubits());
  for (std::size_t b = 0; b < layout_.blockWidth; ++b) {
    qubitMap[target_.getAxisI()[b]] = layout_.blocks[edge.first][b];
    qubitMap[target_.getAxisJ()[b]] = layout_.blocks[edge.second][b];
  }
  qubitMap[target_.getAncilla()] = flag;
  for (const auto& op : encoding) {
    if (op->getType() != qc::Z || op->getTargets().size() != 1) {
      throw std::invalid_argument("Adjacency encoding may only contain "
                                  "controlled Z gates");
    }
    qc::Controls controls;
    for (const auto& control : op->getControls()) {
      controls.emplace(qc::Control{qubitMap[control.qubit], control.type});
    }
    circuit_.mcx(controls, qubitMap[op->getTargets().front()]);
  }
}

auto OracleCircuit::addDistinctFlag(const Edge& pair, const qc::Qubit flag)
    -> void {
  const auto& first = layout_.blocks[pair.first];
  const auto& second = layout_.blocks[pair.second];
  // second ^= first, then second == 0 iff both blocks hold the same value
  for (std::size_t b = 0; b < layout_.blockWidth; ++b) {
    circuit_.cx(qc::Control{first[b]}, second[b]);
  }
  circuit_.mcx(controlsForValue(second, 0U), flag);
  circuit_.x(flag);
  for (std::size_t b = 0; b < layout_.blockWidth; ++b) {
    circuit_.cx(qc::Control{first[b]}, second[b]);
  }
}

auto OracleCircuit::addRangeFlag(const Vertex vertex, const qc::Qubit flag)
    -> void {
  const auto& block = layout_.blocks[vertex];
  circuit_.x(flag);
  const auto nValues = std::uint64_t{1} << layout_.blockWidth;
  for (auto value = static_cast<std::uint64_t>(target_.getNvertices());
       value < nValues; ++value) {
    circuit_.mcx(controlsForValue(block, value), flag);
  }
}

auto OracleCircuit::addFlagComputation() -> void {
  for (const auto& [edge, flag] : layout_.edgeFlags) {
    addEdgeFlag(edge, flag);
  }
  for (const auto& [pair, flag] : layout_.distinctFlags) {
    addDistinctFlag(pair, flag);
  }
  for (const auto& [vertex, flag] : layout_.rangeFlags) {
    addRangeFlag(vertex, flag);
  }
}

auto OracleCircuit::evaluate(const std::uint64_t registerValue) const -> bool {
  if (layout_.getMappingWidth() < 64 &&
      registerValue >= (std::uint64_t{1} << layout_.getMappingWidth())) {
    throw std::invalid_argument("Register value " +
                                std::to_string(registerValue) +
                                " exceeds the mapping register");
  }
  const auto result = evaluateClassically(circuit_, registerValue);
  return ((result >> layout_.markingQubit) & 1U) == 1U;
}

auto OracleCircuit::toRegisterValue(const CandidateMapping& mapping) const
    -> std::uint64_t {
  if (mapping.size() != layout_.nPatternVertices) {
    std::stringstream ss;
    ss << "Mapping has " << mapping.size() << " entries, but the pattern has "
       << layout_.nPatternVertices << " vertices";
    throw std::invalid_argument(ss.str());
  }
  std::uint64_t value = 0;
  for (std::size_t p = 0; p < mapping.size(); ++p) {
    if ((static_cast<std::uint64_t>(mapping[p]) >> layout_.blockWidth) != 0U) {
      throw std::invalid_argument("Target vertex " +
                                  std::to_string(mapping[p]) +
                                  " does not fit into the mapping register");
    }
    value |= static_cast<std::uint64_t>(mapping[p]) << (p * layout_.blockWidth);
  }
  return value;
}

auto OracleCircuit::toOpenQASM() const -> std::string {
  return qsis::toOpenQASM(circuit_);
}

auto buildOracle(AdjacencyEncoding target, AdjacencyEncoding pattern,
                 const std::size_t maxPatternVertices) -> OracleCircuit {
  const auto nTarget = target.getNvertices();
  const auto nPattern = pattern.getNvertices();
  if (nPattern > nTarget) {
    std::stringstream ss;
    ss << "Pattern graph has " << nPattern
       << " vertices, but the target graph only has " << nTarget;
    throw IncompatibleSizeError(ss.str());
  }
  if (nPattern > maxPatternVertices) {
    std::stringstream ss;
    ss << "Pattern graph has " << nPattern
       << " vertices, but the oracle is limited to " << maxPatternVertices
       << " pattern vertices";
    throw IncompatibleSizeError(ss.str());
  }

  OracleCircuit oracle;
  auto& layout = oracle.layout_;
  layout.nPatternVertices = nPattern;
  layout.blockWidth = target.getWidth();

  // determine the flags before allocating any qubit
  const auto patternEdges = pattern.getEdges();
  std::vector<Edge> distinctPairs;
  std::vector<Vertex> isolated;
  for (Vertex i = 0; i < nPattern; ++i) {
    bool hasEdge = false;
    for (Vertex j = 0; j < nPattern; ++j) {
      if (i == j) {
        continue;
      }
      if (pattern.isAdjacent(i, j)) {
        hasEdge = true;
      } else if (i < j) {
        distinctPairs.emplace_back(i, j);
      }
    }
    if (!hasEdge) {
      isolated.emplace_back(i);
    }
  }
  const bool needsRangeCheck =
      (std::size_t{1} << layout.blockWidth) != nTarget;
  const auto nRangeFlags = needsRangeCheck ? isolated.size() : 0U;
  const auto nQubits = layout.getMappingWidth() + patternEdges.size() +
                       distinctPairs.size() + nRangeFlags + 1;
  if (nQubits > MAX_ORACLE_QUBITS) {
    std::stringstream ss;
    ss << "Oracle would require " << nQubits << " qubits, at most "
       << MAX_ORACLE_QUBITS << " are supported";
    throw IncompatibleSizeError(ss.str());
  }

  auto& qc = oracle.circuit_;
  for (std::size_t p = 0; p < nPattern; ++p) {
    layout.blocks.emplace_back(
        addRegister(qc, layout.blockWidth, "v" + std::to_string(p)));
  }
  const auto edgeQubits = addRegister(qc, patternEdges.size(), "e");
  for (std::size_t k = 0; k < patternEdges.size(); ++k) {
    layout.edgeFlags.emplace_back(patternEdges[k], edgeQubits[k]);
  }
  const auto distinctQubits = addRegister(qc, distinctPairs.size(), "d");
  for (std::size_t k = 0; k < distinctPairs.size(); ++k) {
    layout.distinctFlags.emplace_back(distinctPairs[k], distinctQubits[k]);
  }
  const auto rangeQubits = addRegister(qc, nRangeFlags, "r");
  for (std::size_t k = 0; k < nRangeFlags; ++k) {
    layout.rangeFlags.emplace_back(isolated[k], rangeQubits[k]);
  }
  layout.markingQubit = addRegister(qc, 1, "mark").front();
  layout.nQubits = qc.getNqubits();

  oracle.target_ = std::move(target);
  oracle.pattern_ = std::move(pattern);

  oracle.addFlagComputation();
  const auto nComputeOps = qc.size();

  qc::Controls flags;
  for (const auto& [edge, flag] : layout.edgeFlags) {
    flags.emplace(qc::Control{flag});
  }
  for (const auto& [pair, flag] : layout.distinctFlags) {
    flags.emplace(qc::Control{flag});
  }
  for (const auto& [vertex, flag] : layout.rangeFlags) {
    flags.emplace(qc::Control{flag});
  }
  qc.mcx(flags, layout.markingQubit);

  // all flag computations are self-inverse, uncompute in reverse order
  for (std::size_t k = nComputeOps; k > 0; --k) {
    qc.emplace_back(qc.at(k - 1)->clone());
  }

  SPDLOG_DEBUG("Built oracle with {} qubits and {} operations",
               layout.nQubits, qc.size());
  return oracle;
}
} // namespace qsis
