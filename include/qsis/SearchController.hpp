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
#include "qsis/Configuration.hpp"
#include "qsis/Graph.hpp"
#include "qsis/Results.hpp"
#include "qsis/backend/ExecutionBackend.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace qsis {
/// Upper bound on the delay before a backend request is retried, in ms
constexpr std::size_t MAX_BACKEND_BACKOFF = 60'000;

/**
 * @returns the delay in ms before retry number @p attempt (counted from 0),
 * i.e., base * 2^attempt saturated at MAX_BACKEND_BACKOFF
 */
[[nodiscard]] auto backoffDelay(std::size_t base, std::size_t attempt)
    -> std::size_t;

/**
 * @brief Drives the hybrid search for an embedding of a pattern graph into a
 * target graph.
 * @details The controller builds the oracle and the amplifier once. Then it
 * executes rounds as dictated by the AmplificationSchedule: each round
 * amplifies with the scheduled number of iterations, samples the mapping
 * register through the backend, and verifies every sample classically. The
 * search stops with the first verified embedding, or with NotFound once the
 * schedule is exhausted or a resource limit is hit.
 */
class SearchController {
  /// Samples of one backend request together with the retries it needed
  struct BatchResult {
    std::vector<std::string> samples;
    std::size_t retries = 0;
  };

  std::reference_wrapper<const Graph> target_;
  std::reference_wrapper<const Graph> pattern_;
  std::reference_wrapper<ExecutionBackend> backend_;
  Configuration config_;
  std::mt19937_64 rng_;

  /**
   * Execute one batch and retry transient failures with exponential backoff.
   * @throws SearchAbortedError if the batch still fails after all retries
   */
  [[nodiscard]] auto executeBatch(const qc::QuantumComputation& qc,
                                  std::size_t shots, std::uint64_t seed) const
      -> BatchResult;

  /**
   * Split the shots into batches, execute them concurrently and wait for all
   * of them.
   */
  [[nodiscard]] auto sample(const qc::QuantumComputation& qc,
                            std::size_t shots, Statistics& statistics)
      -> std::vector<std::string>;

public:
  /**
   * @throws std::invalid_argument if the configuration is inconsistent
   */
  SearchController(const Graph& target, const Graph& pattern,
                   ExecutionBackend& backend, const Configuration& config);

  /**
   * @brief Search for an embedding of the pattern into the target.
   * @throws IncompatibleSizeError if the pattern does not fit into the target
   * or the oracle bounds
   * @throws SearchAbortedError if the backend keeps failing
   */
  [[nodiscard]] auto search() -> SearchOutcome;

  [[nodiscard]] auto getConfig() const -> const Configuration& {
    return config_;
  }
};
} // namespace qsis
