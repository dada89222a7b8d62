/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/Results.hpp"

#include "qsis/Types.hpp"

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <ostream>
#include <sstream>
#include <string>

namespace qsis {
auto toString(const SearchStatus status) -> std::string {
  switch (status) {
  case SearchStatus::Found:
    return "found";
  case SearchStatus::NotFound:
    return "not_found";
  }
  return "Error";
}

auto toString(const TerminationReason reason) -> std::string {
  switch (reason) {
  case TerminationReason::EmbeddingFound:
    return "embedding_found";
  case TerminationReason::ScheduleExhausted:
    return "schedule_exhausted";
  case TerminationReason::RoundLimit:
    return "round_limit";
  case TerminationReason::Deadline:
    return "deadline";
  case TerminationReason::ShotBudget:
    return "shot_budget";
  }
  return "Error";
}

auto SearchOutcome::json() const -> nlohmann::json {
  nlohmann::json j;
  j["status"] = toString(status_);
  j["termination_reason"] = toString(reason_);
  if (found()) {
    j["mapping"] = mapping_;
  }
  j["confidence"] = confidence_;
  j["confidence_target_reached"] = confidenceTargetReached_;
  j["statistics"] = statistics_;
  j["rounds"] = rounds_;
  return j;
}

auto operator<<(std::ostream& os, const SearchOutcome& outcome)
    -> std::ostream& {
  return os << outcome.json().dump(2);
}

auto toTwoLine(const CandidateMapping& mapping) -> std::string {
  std::stringstream top;
  std::stringstream bottom;
  for (std::size_t i = 0; i < mapping.size(); ++i) {
    const auto width = std::max(std::to_string(i).size(),
                                std::to_string(mapping[i]).size());
    if (i > 0) {
      top << ' ';
      bottom << ' ';
    }
    top << std::setw(static_cast<int>(width)) << i;
    bottom << std::setw(static_cast<int>(width)) << mapping[i];
  }
  return top.str() + "\n" + bottom.str();
}
} // namespace qsis
