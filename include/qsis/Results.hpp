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

#include "qsis/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace qsis {
enum class SearchStatus : std::uint8_t { Found, NotFound };

/// Reason why the search stopped
enum class TerminationReason : std::uint8_t {
  EmbeddingFound,
  ScheduleExhausted,
  RoundLimit,
  Deadline,
  ShotBudget
};

[[nodiscard]] auto toString(SearchStatus status) -> std::string;
[[nodiscard]] auto toString(TerminationReason reason) -> std::string;

/// Summary of one round of sampling
struct RoundRecord {
  std::size_t round = 0;
  std::size_t iterations = 0;    ///< Grover iterations of this round
  std::size_t minIterations = 0; ///< lower end of the drawn range
  std::size_t maxIterations = 0; ///< upper end of the drawn range
  std::size_t shots = 0;
  std::size_t outOfRange = 0;     ///< samples mapping outside the target
  std::size_t notInjective = 0;   ///< samples mapping two vertices together
  std::size_t edgeViolations = 0; ///< samples that lose a pattern edge
  double confidence = 0.;         ///< confidence after this round
  NLOHMANN_DEFINE_TYPE_INTRUSIVE_ONLY_SERIALIZE(RoundRecord, round,
                                                iterations, minIterations,
                                                maxIterations, shots,
                                                outOfRange, notInjective,
                                                edgeViolations, confidence);
};

/// Statistics collected during the search
struct Statistics {
  std::size_t oracleQubits = 0;     ///< qubits of the oracle circuit
  std::size_t oracleGates = 0;      ///< operations of the oracle circuit
  std::uint64_t searchSpace = 0;    ///< number of register values
  std::uint64_t maxSolutions = 0;   ///< admissible number of embeddings
  std::size_t iterationCeiling = 0; ///< largest number of iterations
  std::size_t rounds = 0;
  std::size_t shots = 0;
  std::size_t groverIterations = 0; ///< sum of the iterations of all rounds
  std::size_t backendRequests = 0;
  std::size_t backendRetries = 0;
  int64_t setupTime = 0; ///< Time taken to build the circuits in us
  int64_t searchTime = 0; ///< Time taken by the rounds in us
  int64_t totalTime = 0;  ///< Total time taken in us
  NLOHMANN_DEFINE_TYPE_INTRUSIVE_ONLY_SERIALIZE(
      Statistics, oracleQubits, oracleGates, searchSpace, maxSolutions,
      iterationCeiling, rounds, shots, groverIterations, backendRequests,
      backendRetries, setupTime, searchTime, totalTime);
};

/**
 * @brief Outcome of a subgraph embedding search.
 * @details A found embedding is always verified classically. If no embedding
 * was found, the outcome carries the confidence that an existing embedding
 * would have been detected. It never states that no embedding exists.
 */
class SearchOutcome {
public:
  SearchOutcome() = default;

  [[nodiscard]] auto getStatus() const -> SearchStatus { return status_; }
  [[nodiscard]] auto found() const -> bool {
    return status_ == SearchStatus::Found;
  }
  [[nodiscard]] auto getMapping() const -> const CandidateMapping& {
    return mapping_;
  }
  [[nodiscard]] auto getConfidence() const -> double { return confidence_; }
  /// @returns whether the confidence reached the configured target
  [[nodiscard]] auto isConfidenceTargetReached() const -> bool {
    return confidenceTargetReached_;
  }
  [[nodiscard]] auto getTerminationReason() const -> TerminationReason {
    return reason_;
  }
  [[nodiscard]] auto getStatistics() const -> const Statistics& {
    return statistics_;
  }
  [[nodiscard]] auto getRounds() const -> const std::vector<RoundRecord>& {
    return rounds_;
  }

  auto setFound(CandidateMapping mapping) -> void {
    status_ = SearchStatus::Found;
    mapping_ = std::move(mapping);
    reason_ = TerminationReason::EmbeddingFound;
  }
  auto setNotFound(const TerminationReason reason) -> void {
    status_ = SearchStatus::NotFound;
    mapping_.clear();
    reason_ = reason;
  }
  auto setConfidence(const double c) -> void { confidence_ = c; }
  auto setConfidenceTargetReached(const bool reached) -> void {
    confidenceTargetReached_ = reached;
  }
  auto setStatistics(const Statistics& s) -> void { statistics_ = s; }
  auto addRound(const RoundRecord& r) -> void { rounds_.emplace_back(r); }

  [[nodiscard]] auto json() const -> nlohmann::json;

  friend auto operator<<(std::ostream& os, const SearchOutcome& outcome)
      -> std::ostream&;

private:
  SearchStatus status_ = SearchStatus::NotFound;
  CandidateMapping mapping_;
  double confidence_ = 0.;
  bool confidenceTargetReached_ = false;
  TerminationReason reason_ = TerminationReason::ScheduleExhausted;
  Statistics statistics_;
  std::vector<RoundRecord> rounds_;
};

/**
 * @brief Renders a mapping in two-line notation.
 * @details The first line lists the pattern vertices, the second line the
 * target vertex each of them is mapped to, e.g.
 * @code
 * 0 1 2
 * 3 0 1
 * @endcode
 */
[[nodiscard]] auto toTwoLine(const CandidateMapping& mapping) -> std::string;
} // namespace qsis
