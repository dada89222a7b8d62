/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/SubgraphSearch.hpp"

#include "qsis/Configuration.hpp"
#include "qsis/Graph.hpp"
#include "qsis/Results.hpp"
#include "qsis/SearchController.hpp"
#include "qsis/backend/ExecutionBackend.hpp"
#include "qsis/backend/DDSimulatorBackend.hpp"

namespace qsis {
auto findSubgraphEmbedding(const Graph& target, const Graph& pattern,
                           const Configuration& options) -> SearchOutcome {
  DDSimulatorBackend backend;
  return findSubgraphEmbedding(target, pattern, backend, options);
}

auto findSubgraphEmbedding(const Graph& target, const Graph& pattern,
                           ExecutionBackend& backend,
                           const Configuration& options) -> SearchOutcome {
  SearchController controller(target, pattern, backend, options);
  return controller.search();
}
} // namespace qsis
