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
#include <gtest/gtest.h>
#include <stdexcept>

namespace qsis {
TEST(ConfidenceTest, SuccessProbability) {
  // without amplification the probability is M/N
  EXPECT_NEAR(successProbability(0, 1, 4), 0.25, 1e-12);
  EXPECT_NEAR(successProbability(0, 3, 64), 3. / 64., 1e-12);
  // a single iteration finds one of four elements with certainty
  EXPECT_NEAR(successProbability(1, 1, 4), 1., 1e-12);
  // half of the elements marked is invariant under iterations
  EXPECT_NEAR(successProbability(5, 8, 16), 0.5, 1e-12);
  EXPECT_DOUBLE_EQ(successProbability(3, 0, 16), 0.);
  EXPECT_DOUBLE_EQ(successProbability(3, 16, 16), 1.);
}
TEST(ConfidenceTest, InjectiveMappingCount) {
  EXPECT_EQ(injectiveMappingCount(4, 3, 64), 24);
  EXPECT_EQ(injectiveMappingCount(5, 5, 1ULL << 15U), 120);
  EXPECT_EQ(injectiveMappingCount(5, 0, 10), 1);
  EXPECT_EQ(injectiveMappingCount(3, 4, 100), 0);
  // saturates at the cap
  EXPECT_EQ(injectiveMappingCount(100, 6, 1000), 1000);
  EXPECT_EQ(injectiveMappingCount(200, 6, 1ULL << 48U), 1ULL << 48U);
}
TEST(ConfidenceTest, NoRoundsNoConfidence) {
  const ConfidenceTracker tracker(64, 24);
  EXPECT_DOUBLE_EQ(tracker.getConfidence(), 0.);
  EXPECT_EQ(tracker.getRounds(), 0);
  EXPECT_EQ(tracker.getSolutionCounts().size(), 24);
}
TEST(ConfidenceTest, SingleRoundWithoutAmplification) {
  ConfidenceTracker tracker(64, 24);
  tracker.recordRound(0, 0, 10);
  // the hardest case is a single solution
  EXPECT_EQ(tracker.getWorstCaseSolutions(), 1);
  EXPECT_NEAR(tracker.getConfidence(), 1. - std::pow(63. / 64., 10), 1e-12);
}
TEST(ConfidenceTest, Monotone) {
  ConfidenceTracker tracker(1024, 5040);
  double previous = tracker.getConfidence();
  std::size_t bound = 1;
  for (std::size_t round = 0; round < 10; ++round) {
    tracker.recordRound(bound, 2 * bound, 16);
    const auto current = tracker.getConfidence();
    EXPECT_GE(current, previous);
    EXPECT_LE(current, 1.);
    previous = current;
    bound = std::min<std::size_t>(2 * bound, 26);
  }
  EXPECT_GT(previous, 0.9);
}
TEST(ConfidenceTest, EmptyRoundAddsNothing) {
  ConfidenceTracker tracker(64, 24);
  tracker.recordRound(1, 2, 64);
  const auto before = tracker.getConfidence();
  tracker.recordRound(1, 2, 0);
  EXPECT_DOUBLE_EQ(tracker.getConfidence(), before);
  EXPECT_EQ(tracker.getRounds(), 2);
}
TEST(ConfidenceTest, TriangleInTwoEdgesSchedule) {
  // the rounds of the default schedule for N = 64 and C = 7
  ConfidenceTracker tracker(64, 24);
  tracker.recordRound(1, 2, 64);
  tracker.recordRound(2, 4, 64);
  tracker.recordRound(4, 7, 64);
  EXPECT_LT(tracker.getConfidence(), 0.99);
  tracker.recordRound(0, 7, 64);
  EXPECT_GE(tracker.getConfidence(), 0.99);
}
TEST(ConfidenceTest, GeometricGrid) {
  const ConfidenceTracker tracker(1ULL << 30U, 1ULL << 29U);
  const auto& counts = tracker.getSolutionCounts();
  EXPECT_LE(counts.size(), MAX_CONFIDENCE_GRID_SIZE + 1);
  EXPECT_EQ(counts.front(), 1);
  EXPECT_EQ(counts.back(), 1ULL << 29U);
  for (std::size_t i = 1; i < counts.size(); ++i) {
    EXPECT_LT(counts[i - 1], counts[i]);
  }
}
TEST(ConfidenceTest, CapsSolutionsAtSearchSpace) {
  const ConfidenceTracker tracker(16, 1000);
  EXPECT_EQ(tracker.getSolutionCounts().size(), 16);
}
TEST(ConfidenceTest, InvalidArguments) {
  EXPECT_THROW(ConfidenceTracker(0, 1), std::invalid_argument);
  EXPECT_THROW(ConfidenceTracker(16, 0), std::invalid_argument);
  ConfidenceTracker tracker(16, 4);
  EXPECT_THROW(tracker.recordRound(3, 2, 1), std::invalid_argument);
}
} // namespace qsis
