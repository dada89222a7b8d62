/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/backend/DDSimulatorBackend.hpp"

#include "dd/DDDefinitions.hpp"
#include "dd/Package.hpp"
#include "dd/Simulation.hpp"
#include "dd/StateGeneration.hpp"
#include "ir/QuantumComputation.hpp"
#include "ir/operations/OpType.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace qsis {
auto DDSimulatorBackend::execute(const qc::QuantumComputation& qc,
                                 const std::size_t shots,
                                 const std::uint64_t seed)
    -> std::vector<std::string> {
  if (qc.getNcbits() == 0) {
    return std::vector<std::string>(shots);
  }
  const auto counts = dd::sample(qc, shots, seed);
  SPDLOG_DEBUG("Sampled {} shots of a {}-qubit circuit, {} distinct outcomes",
               shots, qc.getNqubits(), counts.size());
  std::vector<std::string> samples;
  samples.reserve(shots);
  for (const auto& [bitstring, count] : counts) {
    samples.insert(samples.end(), count, bitstring);
  }
  // the counts are ordered by outcome, restore a random shot order
  std::mt19937_64 rng(seed);
  std::shuffle(samples.begin(), samples.end(), rng);
  return samples;
}

auto DDSimulatorBackend::simulate(const qc::QuantumComputation& qc)
    -> dd::CVec {
  qc::QuantumComputation unitary(qc.getNqubits());
  for (const auto& op : qc) {
    if (op->isUnitary() && op->getType() != qc::Barrier) {
      unitary.emplace_back(op->clone());
    }
  }
  const auto nqubits = unitary.getNqubits();
  const auto dd = std::make_unique<dd::Package>(nqubits);
  const auto in = dd::makeZeroState(nqubits, *dd);
  const auto out = dd::simulate(unitary, in, *dd);
  return out.getVector();
}
} // namespace qsis
