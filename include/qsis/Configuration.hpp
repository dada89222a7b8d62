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

#include "qsis/OracleCircuit.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/common.h>

namespace qsis {
/// Options of the subgraph embedding search
struct Configuration {
  /// number of shots per round
  std::size_t shotsPerIteration = 64;
  /// stage bound of the first round
  std::size_t initialIterationCount = 1;
  /// maximal number of Grover iterations per round, 0 derives it from the
  /// size of the search space
  std::size_t escalationCeiling = 0;
  /// number of failed rounds at the ceiling before the search gives up
  std::size_t ceilingRounds = 4;
  /// maximal number of rounds
  std::size_t maxRounds = 64;
  /// confidence required to stop early at the ceiling
  double confidenceTarget = 0.99;
  /// largest pattern the oracle is built for
  std::size_t maxPatternVertices = DEFAULT_MAX_PATTERN_VERTICES;
  /// number of concurrent backend requests per round
  std::size_t parallelBatches = 1;
  /// number of retries of a failed backend request
  std::size_t backendRetries = 3;
  /// base backoff in milliseconds, doubled with every retry
  std::size_t backendBackoff = 10;
  /// wall-clock limit in milliseconds, 0 for none
  std::size_t timeout = 0;
  /// maximal number of shots in total, 0 for none
  std::size_t shotBudget = 0;
  /// seed of the search, 0 draws a seed from std::random_device
  std::uint64_t seed = 0;
  spdlog::level::level_enum logLevel = spdlog::level::info;
  NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
      Configuration, shotsPerIteration, initialIterationCount,
      escalationCeiling, ceilingRounds, maxRounds, confidenceTarget,
      maxPatternVertices, parallelBatches, backendRetries, backendBackoff,
      timeout, shotBudget, seed, logLevel);

  /**
   * @brief Checks the options for consistency.
   * @throws std::invalid_argument if an option is out of range
   */
  auto validate() const -> void;

  [[nodiscard]] auto json() const -> nlohmann::json;

  friend auto operator<<(std::ostream& os, const Configuration& config)
      -> std::ostream& {
    return os << config.json().dump(2);
  }
};
} // namespace qsis
