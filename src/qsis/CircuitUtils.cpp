/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/CircuitUtils.hpp"

#include "ir/Definitions.hpp"
#include "ir/QuantumComputation.hpp"
#include "ir/operations/CompoundOperation.hpp"
#include "ir/operations/Control.hpp"
#include "ir/operations/OpType.hpp"
#include "ir/operations/Operation.hpp"
#include "qsis/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace qsis {
auto ceilLog2(const std::size_t n) -> std::size_t {
  std::size_t bits = 0;
  while ((std::size_t{1} << bits) < n) {
    ++bits;
  }
  return bits;
}

auto addRegister(qc::QuantumComputation& qc, const std::size_t size,
                 const std::string& name) -> std::vector<qc::Qubit> {
  std::vector<qc::Qubit> qubits;
  if (size == 0) {
    return qubits;
  }
  const auto start = static_cast<qc::Qubit>(qc.getNqubits());
  qc.addQubitRegister(size, name);
  qubits.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    qubits.emplace_back(start + static_cast<qc::Qubit>(i));
  }
  return qubits;
}

auto controlsForValue(const std::vector<qc::Qubit>& qubits,
                      const std::uint64_t value) -> qc::Controls {
  qc::Controls controls;
  for (std::size_t b = 0; b < qubits.size(); ++b) {
    if (((value >> b) & 1U) == 1U) {
      controls.emplace(qc::Control{qubits[b]});
    } else {
      controls.emplace(qc::Control{qubits[b], qc::Control::Type::Neg});
    }
  }
  return controls;
}

auto controlsSatisfied(const qc::Operation& op, const BasisState state)
    -> bool {
  for (const auto& control : op.getControls()) {
    const bool set = ((state >> control.qubit) & 1U) == 1U;
    if (set != (control.type == qc::Control::Type::Pos)) {
      return false;
    }
  }
  return true;
}

auto isClassicalOperation(const qc::Operation& op) -> bool {
  if (!op.isStandardOperation()) {
    return false;
  }
  switch (op.getType()) {
  case qc::I:
    return true;
  case qc::X:
    return op.getTargets().size() == 1;
  case qc::SWAP:
    return op.getTargets().size() == 2;
  default:
    return false;
  }
}

auto applyToBasisState(const qc::Operation& op, const BasisState state)
    -> BasisState {
  if (!isClassicalOperation(op)) {
    std::stringstream ss;
    ss << "Operation " << op.getType() << " is not a classical operation";
    throw std::invalid_argument(ss.str());
  }
  if (op.getType() == qc::I || !controlsSatisfied(op, state)) {
    return state;
  }
  const auto& targets = op.getTargets();
  if (op.getType() == qc::X) {
    return state ^ (BasisState{1} << targets.front());
  }
  // SWAP
  const auto b0 = (state >> targets[0]) & 1U;
  const auto b1 = (state >> targets[1]) & 1U;
  if (b0 == b1) {
    return state;
  }
  return state ^ ((BasisState{1} << targets[0]) |
                  (BasisState{1} << targets[1]));
}

auto evaluateClassically(const qc::QuantumComputation& qc,
                         const BasisState state) -> BasisState {
  if (qc.getNqubits() > 64) {
    throw std::invalid_argument(
        "Classical evaluation supports at most 64 qubits");
  }
  auto current = state;
  for (const auto& op : qc) {
    if (op->isCompoundOperation()) {
      for (const auto& subOp :
           dynamic_cast<const qc::CompoundOperation&>(*op)) {
        current = applyToBasisState(*subOp, current);
      }
    } else {
      current = applyToBasisState(*op, current);
    }
  }
  return current;
}

auto appendCircuit(qc::QuantumComputation& target,
                   const qc::QuantumComputation& source) -> void {
  for (const auto& op : source) {
    target.emplace_back(op->clone());
  }
}

auto toOpenQASM(const qc::QuantumComputation& qc) -> std::string {
  std::stringstream ss;
  qc.dumpOpenQASM(ss);
  return ss.str();
}
} // namespace qsis
