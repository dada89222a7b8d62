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
#include "ir/operations/Control.hpp"
#include "ir/operations/Operation.hpp"
#include "qsis/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qsis {
/// @return the number of bits required to index n values, 0 for n <= 1
[[nodiscard]] auto ceilLog2(std::size_t n) -> std::size_t;

/**
 * Add a named qubit register to the circuit.
 * @details Registers of size zero are not added to the circuit since they
 * would not contain any qubit.
 * @return the qubits of the new register in ascending order
 */
auto addRegister(qc::QuantumComputation& qc, std::size_t size,
                 const std::string& name) -> std::vector<qc::Qubit>;

/**
 * Build the controls that are satisfied iff the given qubits hold value in
 * little-endian order, i.e., qubits[b] holds bit b of value.
 */
[[nodiscard]] auto controlsForValue(const std::vector<qc::Qubit>& qubits,
                                    std::uint64_t value) -> qc::Controls;

/// @return true if all controls of the operation are satisfied by the state
[[nodiscard]] auto controlsSatisfied(const qc::Operation& op,
                                     BasisState state) -> bool;

/**
 * @return true if the operation maps basis states to basis states without any
 * phase, i.e., it is a (multi-)controlled X gate or an identity.
 */
[[nodiscard]] auto isClassicalOperation(const qc::Operation& op) -> bool;

/**
 * Apply a classical operation to a basis state.
 * @throws std::invalid_argument if the operation is not classical
 */
[[nodiscard]] auto applyToBasisState(const qc::Operation& op, BasisState state)
    -> BasisState;

/**
 * Run a circuit consisting only of classical operations on a basis state.
 * @throws std::invalid_argument if the circuit contains a non-classical
 * operation or has more than 64 qubits
 */
[[nodiscard]] auto evaluateClassically(const qc::QuantumComputation& qc,
                                       BasisState state) -> BasisState;

/// Append copies of all operations of source to target.
auto appendCircuit(qc::QuantumComputation& target,
                   const qc::QuantumComputation& source) -> void;

/// @return the OpenQASM 3 description of the circuit
[[nodiscard]] auto toOpenQASM(const qc::QuantumComputation& qc) -> std::string;
} // namespace qsis
