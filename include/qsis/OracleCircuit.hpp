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
#include "qsis/AdjacencyEncoding.hpp"
#include "qsis/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace qsis {
/// Default bound on the number of pattern vertices accepted by the oracle
constexpr std::size_t DEFAULT_MAX_PATTERN_VERTICES = 6;
/// Basis states are stored in 64-bit integers
constexpr std::size_t MAX_ORACLE_QUBITS = 64;

/**
 * Assignment of the oracle's registers to qubits. All qubits of the oracle
 * except the marking qubit are ancillae that start and end in |0>.
 */
struct OracleLayout {
  /// number of pattern vertices, i.e., number of blocks in the mapping register
  std::size_t nPatternVertices = 0;
  /// number of qubits per block (= width of the target encoding)
  std::size_t blockWidth = 0;
  /// qubits holding the target vertex of each pattern vertex (little endian)
  std::vector<std::vector<qc::Qubit>> blocks;
  /// one flag per pattern edge, set iff the edge is mapped onto a target edge
  std::vector<std::pair<Edge, qc::Qubit>> edgeFlags;
  /// one flag per non-adjacent pattern pair, set iff both are mapped apart
  std::vector<std::pair<Edge, qc::Qubit>> distinctFlags;
  /// one flag per isolated pattern vertex, set iff it is mapped in range
  std::vector<std::pair<Vertex, qc::Qubit>> rangeFlags;
  qc::Qubit markingQubit = 0;
  std::size_t nQubits = 0;

  /// @return the number of qubits in the mapping register
  [[nodiscard]] auto getMappingWidth() const -> std::size_t {
    return nPatternVertices * blockWidth;
  }
  /// @return all qubits of the mapping register in ascending order
  [[nodiscard]] auto getMappingQubits() const -> std::vector<qc::Qubit>;
  [[nodiscard]] auto json() const -> nlohmann::json;
};

class OracleCircuit;

/**
 * Build the oracle for embedding the pattern into the target.
 * @param target is the encoding of the target graph
 * @param pattern is the encoding of the pattern graph
 * @param maxPatternVertices bounds the number of pattern vertices
 * @throws IncompatibleSizeError if the pattern has more vertices than the
 * target or than maxPatternVertices, or if the oracle would exceed
 * MAX_ORACLE_QUBITS qubits
 */
[[nodiscard]] auto
buildOracle(AdjacencyEncoding target, AdjacencyEncoding pattern,
            std::size_t maxPatternVertices = DEFAULT_MAX_PATTERN_VERTICES)
    -> OracleCircuit;

/**
 * @brief Reversible circuit that marks valid embeddings.
 * @details The circuit acts on the mapping register and a set of flag
 * ancillae. It computes one flag per pattern edge (the target vertices of its
 * endpoints are adjacent in the target graph), one flag per non-adjacent
 * pattern pair (the target vertices differ), and one flag per isolated pattern
 * vertex if the target vertex count is not a power of two (the register value
 * is a vertex of the target). Adjacent pattern pairs need no separate
 * distinctness check because the target adjacency is irreflexive. The marking
 * qubit is flipped iff all flags are set, afterwards all flags are
 * uncomputed. Hence, the marking qubit is 1 iff the mapping is a valid
 * embedding and 0 otherwise, and the circuit is its own inverse.
 *
 * Oracles are created with @ref buildOracle. They own their encodings and
 * are never modified after construction.
 */
class OracleCircuit {
  AdjacencyEncoding target_;
  AdjacencyEncoding pattern_;
  OracleLayout layout_;
  qc::QuantumComputation circuit_;

  friend auto buildOracle(AdjacencyEncoding target, AdjacencyEncoding pattern,
                          std::size_t maxPatternVertices) -> OracleCircuit;

  auto addEdgeFlag(const Edge& edge, qc::Qubit flag) -> void;
  auto addDistinctFlag(const Edge& pair, qc::Qubit flag) -> void;
  auto addRangeFlag(Vertex vertex, qc::Qubit flag) -> void;
  auto addFlagComputation() -> void;

public:
  [[nodiscard]] auto getTargetEncoding() const -> const AdjacencyEncoding& {
    return target_;
  }
  [[nodiscard]] auto getPatternEncoding() const -> const AdjacencyEncoding& {
    return pattern_;
  }
  [[nodiscard]] auto getLayout() const -> const OracleLayout& {
    return layout_;
  }
  [[nodiscard]] auto getCircuit() const -> const qc::QuantumComputation& {
    return circuit_;
  }
  /// @return the number of values the mapping register can hold
  [[nodiscard]] auto getSearchSpaceSize() const -> std::uint64_t {
    return std::uint64_t{1} << layout_.getMappingWidth();
  }

  /**
   * Run the oracle on the basis state in which the mapping register holds
   * registerValue and all ancillae are |0>.
   * @return the resulting value of the marking qubit
   */
  [[nodiscard]] auto evaluate(std::uint64_t registerValue) const -> bool;
  /// @return the register value that represents the given mapping
  [[nodiscard]] auto toRegisterValue(const CandidateMapping& mapping) const
      -> std::uint64_t;
  [[nodiscard]] auto toOpenQASM() const -> std::string;
};

} // namespace qsis
