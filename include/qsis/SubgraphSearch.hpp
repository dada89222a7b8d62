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

#include "qsis/Configuration.hpp"
#include "qsis/Graph.hpp"
#include "qsis/Results.hpp"
#include "qsis/backend/ExecutionBackend.hpp"

namespace qsis {
/**
 * @brief Search for an embedding of the pattern into the target on the
 * bundled decision diagram simulator.
 * @details The simulator samples with seeds derived from @p options.seed, so
 * a fixed non-zero seed makes the search reproducible.
 * @returns Found with a verified mapping, or NotFound with the achieved
 * confidence
 * @throws IncompatibleSizeError if the pattern does not fit
 * @throws std::invalid_argument if the options are inconsistent
 */
[[nodiscard]] auto findSubgraphEmbedding(const Graph& target,
                                         const Graph& pattern,
                                         const Configuration& options = {})
    -> SearchOutcome;

/**
 * @brief Search for an embedding of the pattern into the target using the
 * given backend.
 * @throws SearchAbortedError if the backend keeps failing
 */
[[nodiscard]] auto findSubgraphEmbedding(const Graph& target,
                                         const Graph& pattern,
                                         ExecutionBackend& backend,
                                         const Configuration& options = {})
    -> SearchOutcome;
} // namespace qsis
