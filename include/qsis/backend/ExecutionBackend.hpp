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

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qsis {
/**
 * @brief Abstract interface to anything that can run circuits and return
 * measurement samples.
 * @details Implementations must be safe to call concurrently from several
 * threads. Transient failures are reported by throwing a
 * BackendExecutionError, which callers may retry.
 */
class ExecutionBackend {
public:
  virtual ~ExecutionBackend() = default;

  /**
   * @brief Execute the circuit and sample its classical bits.
   * @param qc is the circuit to execute
   * @param shots is the number of samples to draw
   * @param seed seeds the sampling of this request
   * @returns one bit-string per shot, where character len-1-b holds the value
   * of classical bit b
   */
  [[nodiscard]] virtual auto execute(const qc::QuantumComputation& qc,
                                     std::size_t shots, std::uint64_t seed)
      -> std::vector<std::string> = 0;
};
} // namespace qsis
