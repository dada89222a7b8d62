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

#include <cstdint>
#include <utility>
#include <vector>

namespace qsis {
/// Index of a graph vertex, vertices of a graph are labeled 0..n-1
using Vertex = std::uint32_t;
/// An undirected edge, stored with the smaller vertex first
using Edge = std::pair<Vertex, Vertex>;
/// Dense 0/1 adjacency matrix
using AdjacencyMatrix = std::vector<std::vector<std::uint8_t>>;
/// Assignment of one target vertex to every pattern vertex (by index)
using CandidateMapping = std::vector<Vertex>;
/// Basis state of a circuit, bit q holds the value of qubit q
using BasisState = std::uint64_t;
} // namespace qsis
