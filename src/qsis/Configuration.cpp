/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/Configuration.hpp"

#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace qsis {
auto Configuration::validate() const -> void {
  if (shotsPerIteration == 0) {
    throw std::invalid_argument("At least one shot per round is required");
  }
  if (maxRounds == 0) {
    throw std::invalid_argument("At least one round is required");
  }
  if (ceilingRounds == 0) {
    throw std::invalid_argument(
        "At least one round at the iteration ceiling is required");
  }
  if (!(confidenceTarget > 0. && confidenceTarget < 1.)) {
    std::stringstream ss;
    ss << "Confidence target must lie in (0, 1), but is " << confidenceTarget;
    throw std::invalid_argument(ss.str());
  }
  if (maxPatternVertices == 0) {
    throw std::invalid_argument("Maximal pattern size must be positive");
  }
  if (parallelBatches == 0 || parallelBatches > shotsPerIteration) {
    std::stringstream ss;
    ss << "Number of parallel batches must lie in [1, " << shotsPerIteration
       << "], but is " << parallelBatches;
    throw std::invalid_argument(ss.str());
  }
  if (escalationCeiling != 0 && initialIterationCount > escalationCeiling) {
    std::stringstream ss;
    ss << "Initial iteration count " << initialIterationCount
       << " exceeds the escalation ceiling " << escalationCeiling;
    throw std::invalid_argument(ss.str());
  }
}

auto Configuration::json() const -> nlohmann::json {
  nlohmann::json j = *this;
  return j;
}
} // namespace qsis
