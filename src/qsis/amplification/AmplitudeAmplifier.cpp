/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/amplification/AmplitudeAmplifier.hpp"

#include "ir/Definitions.hpp"
#include "ir/QuantumComputation.hpp"
#include "ir/operations/Control.hpp"
#include "qsis/CircuitUtils.hpp"
#include "qsis/OracleCircuit.hpp"

#include <cmath>
#include <cstddef>
#include <spdlog/spdlog.h>
#include <string>

namespace qsis {
AmplitudeAmplifier::AmplitudeAmplifier(const OracleCircuit& oracle)
    : oracle_(oracle), iterate_(createEmptyCircuit()) {
  addPhaseReflection(iterate_);
  addDiffusion(iterate_);
  SPDLOG_DEBUG("Grover iterate consists of {} operations", iterate_.size());
}

auto AmplitudeAmplifier::createEmptyCircuit() const
    -> qc::QuantumComputation {
  const auto& layout = oracle_.get().getLayout();
  qc::QuantumComputation qc;
  // mirror the register structure of the oracle
  for (std::size_t p = 0; p < layout.nPatternVertices; ++p) {
    addRegister(qc, layout.blockWidth, "v" + std::to_string(p));
  }
  addRegister(qc, layout.edgeFlags.size(), "e");
  addRegister(qc, layout.distinctFlags.size(), "d");
  addRegister(qc, layout.rangeFlags.size(), "r");
  addRegister(qc, 1, "mark");
  return qc;
}

auto AmplitudeAmplifier::addPhaseReflection(qc::QuantumComputation& qc) const
    -> void {
  const auto& oracle = oracle_.get();
  appendCircuit(qc, oracle.getCircuit());
  qc.z(oracle.getLayout().markingQubit);
  appendCircuit(qc, oracle.getCircuit());
}

auto AmplitudeAmplifier::addDiffusion(qc::QuantumComputation& qc) const
    -> void {
  const auto mapping = oracle_.get().getLayout().getMappingQubits();
  if (mapping.empty()) {
    // the reflection about a single state is the identity
    return;
  }
  for (const auto q : mapping) {
    qc.h(q);
  }
  for (const auto q : mapping) {
    qc.x(q);
  }
  qc::Controls controls;
  for (std::size_t k = 0; k + 1 < mapping.size(); ++k) {
    controls.emplace(qc::Control{mapping[k]});
  }
  qc.mcz(controls, mapping.back());
  for (const auto q : mapping) {
    qc.x(q);
  }
  for (const auto q : mapping) {
    qc.h(q);
  }
}

auto AmplitudeAmplifier::getSingleSolutionIterations() const -> std::size_t {
  const auto n = static_cast<double>(getSearchSpaceSize());
  return static_cast<std::size_t>(std::ceil(qc::PI_4 * std::sqrt(n)));
}

auto AmplitudeAmplifier::amplify(const std::size_t iterations) const
    -> AmplifiedState {
  AmplifiedState state{iterations, createEmptyCircuit()};
  auto& qc = state.circuit;
  const auto mapping = oracle_.get().getLayout().getMappingQubits();
  for (const auto q : mapping) {
    qc.h(q);
  }
  for (std::size_t k = 0; k < iterations; ++k) {
    appendCircuit(qc, iterate_);
  }
  if (mapping.empty()) {
    return state;
  }
  qc.addClassicalRegister(mapping.size(), "c");
  for (std::size_t b = 0; b < mapping.size(); ++b) {
    qc.measure(mapping[b], b);
  }
  return state;
}
} // namespace qsis
