/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/Confidence.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <vector>

namespace qsis {
auto successProbability(const std::size_t iterations,
                        const std::uint64_t marked,
                        const std::uint64_t searchSpace) -> double {
  if (searchSpace == 0 || marked == 0) {
    return 0.;
  }
  if (marked >= searchSpace) {
    return 1.;
  }
  const auto theta = std::asin(std::sqrt(static_cast<double>(marked) /
                                         static_cast<double>(searchSpace)));
  const auto s =
      std::sin((2. * static_cast<double>(iterations) + 1.) * theta);
  return s * s;
}

auto injectiveMappingCount(const std::size_t nTarget,
                           const std::size_t nPattern, const std::uint64_t cap)
    -> std::uint64_t {
  if (nPattern > nTarget) {
    return 0;
  }
  std::uint64_t count = 1;
  for (std::size_t i = 0; i < nPattern; ++i) {
    const auto factor = static_cast<std::uint64_t>(nTarget - i);
    if (count > cap / factor) {
      return cap;
    }
    count *= factor;
  }
  return std::min(count, cap);
}

ConfidenceTracker::ConfidenceTracker(const std::uint64_t searchSpace,
                                     const std::uint64_t maxSolutions)
    : searchSpace_(searchSpace) {
  if (searchSpace == 0) {
    throw std::invalid_argument("Search space must not be empty");
  }
  if (maxSolutions == 0) {
    throw std::invalid_argument("At least one solution must be admissible");
  }
  const auto mMax = std::min(maxSolutions, searchSpace);
  if (mMax <= MAX_CONFIDENCE_GRID_SIZE) {
    solutionCounts_.reserve(mMax);
    for (std::uint64_t m = 1; m <= mMax; ++m) {
      solutionCounts_.emplace_back(m);
    }
  } else {
    // geometric grid from 1 to mMax
    const auto ratio = std::pow(static_cast<double>(mMax),
                                1. / static_cast<double>(
                                         MAX_CONFIDENCE_GRID_SIZE - 1));
    auto value = 1.;
    for (std::size_t i = 0; i < MAX_CONFIDENCE_GRID_SIZE; ++i) {
      const auto m = std::min(
          mMax, static_cast<std::uint64_t>(std::llround(value)));
      if (solutionCounts_.empty() || solutionCounts_.back() < m) {
        solutionCounts_.emplace_back(m);
      }
      value *= ratio;
    }
    if (solutionCounts_.back() != mMax) {
      solutionCounts_.emplace_back(mMax);
    }
  }
  logMiss_.assign(solutionCounts_.size(), 0.);
}

auto ConfidenceTracker::recordRound(const std::size_t minIterations,
                                    const std::size_t maxIterations,
                                    const std::size_t shots) -> void {
  if (minIterations > maxIterations) {
    throw std::invalid_argument("Invalid iteration range");
  }
  ++rounds_;
  if (shots == 0) {
    return;
  }
  // iteration counts to average over
  std::vector<std::size_t> iterations;
  const auto span = maxIterations - minIterations + 1;
  if (span <= MAX_ITERATION_SAMPLES) {
    for (auto k = minIterations; k <= maxIterations; ++k) {
      iterations.emplace_back(k);
    }
  } else {
    for (std::size_t i = 0; i < MAX_ITERATION_SAMPLES; ++i) {
      iterations.emplace_back(minIterations +
                              (i * (span - 1)) / (MAX_ITERATION_SAMPLES - 1));
    }
  }
  const auto s = static_cast<double>(shots);
  for (std::size_t i = 0; i < solutionCounts_.size(); ++i) {
    auto miss = 0.;
    for (const auto k : iterations) {
      const auto p = successProbability(k, solutionCounts_[i], searchSpace_);
      miss += std::pow(1. - p, s);
    }
    miss /= static_cast<double>(iterations.size());
    if (miss <= 0.) {
      logMiss_[i] = -std::numeric_limits<double>::infinity();
    } else {
      logMiss_[i] += std::log(miss);
    }
  }
}

auto ConfidenceTracker::getConfidence() const -> double {
  if (rounds_ == 0) {
    return 0.;
  }
  const auto worst = *std::max_element(logMiss_.cbegin(), logMiss_.cend());
  return std::clamp(1. - std::exp(worst), 0., 1.);
}

auto ConfidenceTracker::getWorstCaseSolutions() const -> std::uint64_t {
  const auto it = std::max_element(logMiss_.cbegin(), logMiss_.cend());
  return solutionCounts_[static_cast<std::size_t>(
      std::distance(logMiss_.cbegin(), it))];
}
} // namespace qsis
