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
#include <nlohmann/json.hpp>
#include <random>
#include <string>

namespace qsis {
/**
 * States of the adaptive amplification schedule.
 * @details The schedule starts in Initializing and moves to Amplifying once
 * started. A round is executed while AwaitingMeasurement. On success the
 * schedule ends in Found. On failure it passes through Escalating and either
 * continues with the next round or ends in Exhausted.
 */
enum class ScheduleState : std::uint8_t {
  Initializing,
  Amplifying,
  AwaitingMeasurement,
  Escalating,
  Exhausted,
  Found
};

[[nodiscard]] auto toString(ScheduleState state) -> std::string;

/**
 * @brief Iteration-count schedule for amplitude amplification with an unknown
 * number of marked elements.
 * @details Every round draws its iteration count k uniformly at random from
 * the range [m, min(2m, C)], where m is the current stage bound and C the
 * ceiling. After each failed round, the stage bound is doubled. Once it
 * reaches the ceiling, the schedule enters the ceiling stage, in which k is
 * drawn uniformly from [0, C]. In this regime, the average success
 * probability per shot is at least 1/4 whenever C >= 1/sin(2 theta). The
 * schedule is exhausted after a fixed number of failed ceiling rounds, after
 * a failed ceiling round that already achieved the confidence target, or
 * once the total round limit is reached.
 */
class AmplificationSchedule {
public:
  struct Config {
    /// stage bound of the first round
    std::size_t initialIterations = 1;
    /// maximal number of iterations per round, must be positive
    std::size_t ceiling = 1;
    /// number of failed rounds in the ceiling stage before giving up
    std::size_t ceilingRounds = 4;
    /// maximal number of rounds in total
    std::size_t maxRounds = 64;
    /// a failed ceiling round with at least this confidence ends the schedule
    double confidenceTarget = 0.99;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Config, initialIterations,
                                                ceiling, ceilingRounds,
                                                maxRounds, confidenceTarget);
  };

private:
  Config config_;
  std::mt19937_64 rng_;
  ScheduleState state_ = ScheduleState::Initializing;
  std::size_t stageBound_ = 0;
  bool atCeiling_ = false;
  std::size_t minIterations_ = 0;
  std::size_t maxIterations_ = 0;
  std::size_t iterations_ = 0;
  std::size_t rounds_ = 0;
  std::size_t ceilingRoundsDone_ = 0;
  bool roundLimitReached_ = false;

  auto transition(ScheduleState from, ScheduleState to) -> void;
  auto enterRound() -> void;

public:
  /**
   * @throws std::invalid_argument if the ceiling, the number of ceiling
   * rounds, or the round limit is zero
   */
  AmplificationSchedule(const Config& config, std::uint64_t seed);

  /// Initializing -> Amplifying
  auto start() -> void;
  /// Amplifying -> AwaitingMeasurement
  auto awaitMeasurement() -> void;
  /// AwaitingMeasurement -> Found
  auto reportSuccess() -> void;
  /**
   * AwaitingMeasurement -> Escalating -> Amplifying | Exhausted
   * @param confidence is the confidence achieved after this round
   */
  auto reportFailure(double confidence) -> void;

  [[nodiscard]] auto getState() const -> ScheduleState { return state_; }
  [[nodiscard]] auto isTerminal() const -> bool {
    return state_ == ScheduleState::Found ||
           state_ == ScheduleState::Exhausted;
  }
  /// @return the iteration count of the current round
  [[nodiscard]] auto getIterations() const -> std::size_t {
    return iterations_;
  }
  /// @return the smallest iteration count the current round could draw
  [[nodiscard]] auto getMinIterations() const -> std::size_t {
    return minIterations_;
  }
  /// @return the largest iteration count the current round could draw
  [[nodiscard]] auto getMaxIterations() const -> std::size_t {
    return maxIterations_;
  }
  [[nodiscard]] auto getStageBound() const -> std::size_t {
    return stageBound_;
  }
  [[nodiscard]] auto isAtCeiling() const -> bool { return atCeiling_; }
  /// @return the number of completed rounds
  [[nodiscard]] auto getRounds() const -> std::size_t { return rounds_; }
  [[nodiscard]] auto getCeilingRounds() const -> std::size_t {
    return ceilingRoundsDone_;
  }
  /// @return true if the schedule was exhausted by the total round limit
  [[nodiscard]] auto isRoundLimitReached() const -> bool {
    return roundLimitReached_;
  }
  [[nodiscard]] auto getConfig() const -> const Config& { return config_; }
};
} // namespace qsis
