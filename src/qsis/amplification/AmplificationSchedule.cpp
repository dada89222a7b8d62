/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/amplification/AmplificationSchedule.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace qsis {
auto toString(const ScheduleState state) -> std::string {
  switch (state) {
  case ScheduleState::Initializing:
    return "initializing";
  case ScheduleState::Amplifying:
    return "amplifying";
  case ScheduleState::AwaitingMeasurement:
    return "awaiting_measurement";
  case ScheduleState::Escalating:
    return "escalating";
  case ScheduleState::Exhausted:
    return "exhausted";
  case ScheduleState::Found:
    return "found";
  }
  return "Error";
}

AmplificationSchedule::AmplificationSchedule(const Config& config,
                                             const std::uint64_t seed)
    : config_(config), rng_(seed) {
  if (config_.ceiling == 0) {
    throw std::invalid_argument("Iteration ceiling must be positive");
  }
  if (config_.ceilingRounds == 0) {
    throw std::invalid_argument(
        "Number of rounds at the ceiling must be positive");
  }
  if (config_.maxRounds == 0) {
    throw std::invalid_argument("Round limit must be positive");
  }
}

auto AmplificationSchedule::transition(const ScheduleState from,
                                       const ScheduleState to) -> void {
  if (state_ != from) {
    throw std::logic_error("Invalid schedule transition from " +
                           toString(state_) + " to " + toString(to));
  }
  state_ = to;
}

auto AmplificationSchedule::enterRound() -> void {
  if (atCeiling_) {
    minIterations_ = 0;
    maxIterations_ = config_.ceiling;
  } else {
    minIterations_ = stageBound_;
    maxIterations_ = std::min(2 * stageBound_, config_.ceiling);
  }
  std::uniform_int_distribution<std::size_t> dist(minIterations_,
                                                   maxIterations_);
  iterations_ = dist(rng_);
  SPDLOG_DEBUG("Round {} draws {} iterations from [{}, {}]", rounds_,
               iterations_, minIterations_, maxIterations_);
}

auto AmplificationSchedule::start() -> void {
  transition(ScheduleState::Initializing, ScheduleState::Amplifying);
  stageBound_ = std::min(config_.initialIterations, config_.ceiling);
  atCeiling_ = stageBound_ >= config_.ceiling;
  enterRound();
}

auto AmplificationSchedule::awaitMeasurement() -> void {
  transition(ScheduleState::Amplifying, ScheduleState::AwaitingMeasurement);
}

auto AmplificationSchedule::reportSuccess() -> void {
  transition(ScheduleState::AwaitingMeasurement, ScheduleState::Found);
  ++rounds_;
}

auto AmplificationSchedule::reportFailure(const double confidence) -> void {
  transition(ScheduleState::AwaitingMeasurement, ScheduleState::Escalating);
  ++rounds_;
  if (atCeiling_) {
    ++ceilingRoundsDone_;
  }
  if (rounds_ >= config_.maxRounds) {
    roundLimitReached_ = true;
    transition(ScheduleState::Escalating, ScheduleState::Exhausted);
    return;
  }
  if (atCeiling_ && (ceilingRoundsDone_ >= config_.ceilingRounds ||
                     confidence >= config_.confidenceTarget)) {
    transition(ScheduleState::Escalating, ScheduleState::Exhausted);
    return;
  }
  if (!atCeiling_) {
    stageBound_ = std::max<std::size_t>(1, 2 * stageBound_);
    if (stageBound_ >= config_.ceiling) {
      stageBound_ = config_.ceiling;
      atCeiling_ = true;
      SPDLOG_DEBUG("Reached the iteration ceiling of {}", config_.ceiling);
    }
  }
  enterRound();
  transition(ScheduleState::Escalating, ScheduleState::Amplifying);
}
} // namespace qsis
