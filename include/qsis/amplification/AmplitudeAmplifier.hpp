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

#include "ir/QuantumComputation.hpp"
#include "qsis/OracleCircuit.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace qsis {
/**
 * Circuit that prepares the uniform superposition over the mapping register,
 * applies a number of Grover iterates, and measures the mapping register into
 * a classical register of the same width.
 */
struct AmplifiedState {
  std::size_t iterations = 0;
  qc::QuantumComputation circuit;
};

/**
 * @brief Builds Grover iterates from an oracle.
 * @details One iterate consists of the phase reflection about the marked
 * states (oracle, Z on the marking qubit, oracle) followed by the diffusion,
 * i.e., the reflection about the uniform superposition over all values of the
 * mapping register.
 */
class AmplitudeAmplifier {
  std::reference_wrapper<const OracleCircuit> oracle_;
  /// the circuit of a single Grover iterate
  qc::QuantumComputation iterate_;

  auto addPhaseReflection(qc::QuantumComputation& qc) const -> void;
  auto addDiffusion(qc::QuantumComputation& qc) const -> void;
  auto createEmptyCircuit() const -> qc::QuantumComputation;

public:
  explicit AmplitudeAmplifier(const OracleCircuit& oracle);

  [[nodiscard]] auto getOracle() const -> const OracleCircuit& {
    return oracle_.get();
  }
  [[nodiscard]] auto getIterate() const -> const qc::QuantumComputation& {
    return iterate_;
  }
  /// @return the number of values the mapping register can hold
  [[nodiscard]] auto getSearchSpaceSize() const -> std::uint64_t {
    return oracle_.get().getSearchSpaceSize();
  }
  /**
   * @return the iteration count that maximizes the success probability if
   * exactly one element is marked, i.e., ceil(pi/4 * sqrt(N))
   */
  [[nodiscard]] auto getSingleSolutionIterations() const -> std::size_t;

  /**
   * Build the amplified state for the given number of iterations.
   * @param iterations is the number of Grover iterates to apply
   */
  [[nodiscard]] auto amplify(std::size_t iterations) const -> AmplifiedState;
};
} // namespace qsis
