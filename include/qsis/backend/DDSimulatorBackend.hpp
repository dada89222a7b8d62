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

#include "dd/DDDefinitions.hpp"
#include "ir/QuantumComputation.hpp"
#include "qsis/backend/ExecutionBackend.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qsis {
/**
 * @brief Backend that simulates circuits with the decision diagram package of
 * MQT Core.
 * @details Every request creates its own DD package, simulates the circuit
 * once, and samples the measured bits with a generator seeded by the
 * request's seed (0 draws a random seed). Hence, the backend holds no state
 * and can serve concurrent requests.
 */
class DDSimulatorBackend final : public ExecutionBackend {
public:
  [[nodiscard]] auto execute(const qc::QuantumComputation& qc,
                             std::size_t shots, std::uint64_t seed)
      -> std::vector<std::string> override;

  /**
   * @returns the final state vector of the circuit, where index i holds the
   * amplitude of the basis state with qubit q set iff bit q of i is set
   * @note measurements and barriers are skipped
   */
  [[nodiscard]] static auto simulate(const qc::QuantumComputation& qc)
      -> dd::CVec;
};
} // namespace qsis
