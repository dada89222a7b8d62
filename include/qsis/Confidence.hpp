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

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qsis {
/// maximal number of solution counts the confidence is evaluated for
constexpr std::size_t MAX_CONFIDENCE_GRID_SIZE = 4096;
/// maximal number of iteration counts averaged over per round
constexpr std::size_t MAX_ITERATION_SAMPLES = 256;

/**
 * @brief Probability of measuring a marked element after k Grover iterations.
 * @param iterations is the number of Grover iterations k
 * @param marked is the number of marked elements M
 * @param searchSpace is the size of the search space N
 * @returns sin^2((2k+1) asin(sqrt(M/N)))
 */
[[nodiscard]] auto successProbability(std::size_t iterations,
                                      std::uint64_t marked,
                                      std::uint64_t searchSpace) -> double;

/**
 * @brief Number of injective maps from a set of size @p nPattern into a set of
 * size @p nTarget, i.e., nTarget! / (nTarget - nPattern)!, saturated at
 * @p cap.
 */
[[nodiscard]] auto injectiveMappingCount(std::size_t nTarget,
                                         std::size_t nPattern,
                                         std::uint64_t cap) -> std::uint64_t;

/**
 * @brief Tracks the confidence that a solution would have been found by now
 * if one existed.
 * @details For every admissible number of marked elements M, the tracker
 * accumulates the probability that all rounds so far missed. A round with k
 * drawn uniformly from [kMin, kMax] and s shots misses with probability
 * E_k[(1 - p(k, M, N))^s]. The confidence is one minus the largest
 * accumulated miss probability, i.e., it holds for the worst-case M.
 */
class ConfidenceTracker {
  std::uint64_t searchSpace_;
  std::vector<std::uint64_t> solutionCounts_;
  std::vector<double> logMiss_;
  std::size_t rounds_ = 0;

public:
  /**
   * @param searchSpace is the size N of the search space
   * @param maxSolutions is the largest admissible number of marked elements
   * @throws std::invalid_argument if any of the two is zero
   */
  ConfidenceTracker(std::uint64_t searchSpace, std::uint64_t maxSolutions);

  auto recordRound(std::size_t minIterations, std::size_t maxIterations,
                   std::size_t shots) -> void;

  /// @returns the confidence achieved so far, in [0, 1]
  [[nodiscard]] auto getConfidence() const -> double;
  /// @returns the solution count that is currently the hardest to detect
  [[nodiscard]] auto getWorstCaseSolutions() const -> std::uint64_t;
  [[nodiscard]] auto getSolutionCounts() const
      -> const std::vector<std::uint64_t>& {
    return solutionCounts_;
  }
  [[nodiscard]] auto getRounds() const -> std::size_t { return rounds_; }
};
} // namespace qsis
