/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/SearchController.hpp"

#include "ir/QuantumComputation.hpp"
#include "qsis/AdjacencyEncoding.hpp"
#include "qsis/Confidence.hpp"
#include "qsis/Configuration.hpp"
#include "qsis/Exceptions.hpp"
#include "qsis/Graph.hpp"
#include "qsis/OracleCircuit.hpp"
#include "qsis/Results.hpp"
#include "qsis/Types.hpp"
#include "qsis/Verification.hpp"
#include "qsis/amplification/AmplificationSchedule.hpp"
#include "qsis/amplification/AmplitudeAmplifier.hpp"
#include "qsis/backend/ExecutionBackend.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <iterator>
#include <optional>
#include <random>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace qsis {
auto backoffDelay(const std::size_t base, const std::size_t attempt)
    -> std::size_t {
  auto delay = std::min(base, MAX_BACKEND_BACKOFF);
  for (std::size_t i = 0;
       i < attempt && delay != 0 && delay < MAX_BACKEND_BACKOFF; ++i) {
    delay = std::min(2 * delay, MAX_BACKEND_BACKOFF);
  }
  return delay;
}

SearchController::SearchController(const Graph& target, const Graph& pattern,
                                   ExecutionBackend& backend,
                                   const Configuration& config)
    : target_(target), pattern_(pattern), backend_(backend), config_(config) {
  config_.validate();
  if (config_.seed == 0) {
    std::random_device rd;
    rng_.seed(rd());
  } else {
    rng_.seed(config_.seed);
  }
}

auto SearchController::executeBatch(const qc::QuantumComputation& qc,
                                    const std::size_t shots,
                                    const std::uint64_t seed) const
    -> BatchResult {
  BatchResult result;
  for (std::size_t attempt = 0;; ++attempt) {
    try {
      result.samples = backend_.get().execute(qc, shots, seed);
      return result;
    } catch (const BackendExecutionError& e) {
      if (attempt >= config_.backendRetries) {
        std::stringstream ss;
        ss << "Backend failed " << attempt + 1
           << " times in a row, last error: " << e.what();
        throw SearchAbortedError(ss.str());
      }
      const auto backoff = std::chrono::milliseconds(
          backoffDelay(config_.backendBackoff, attempt));
      SPDLOG_WARN("Backend request failed ({}), retrying in {} ms", e.what(),
                  backoff.count());
      std::this_thread::sleep_for(backoff);
      ++result.retries;
    }
  }
}

auto SearchController::sample(const qc::QuantumComputation& qc,
                              const std::size_t shots, Statistics& statistics)
    -> std::vector<std::string> {
  const auto nBatches = std::min(config_.parallelBatches, shots);
  std::vector<std::future<BatchResult>> batches;
  batches.reserve(nBatches);
  for (std::size_t b = 0; b < nBatches; ++b) {
    const auto batchShots = (shots / nBatches) + (b < shots % nBatches ? 1 : 0);
    const auto seed = rng_();
    batches.emplace_back(std::async(
        std::launch::async, [this, &qc, batchShots, seed]() {
          return executeBatch(qc, batchShots, seed);
        }));
  }
  // no batch may outlive the round, even if another one failed
  for (const auto& batch : batches) {
    batch.wait();
  }
  statistics.backendRequests += nBatches;
  std::vector<std::string> samples;
  samples.reserve(shots);
  for (auto& batch : batches) {
    auto result = batch.get();
    statistics.backendRetries += result.retries;
    std::move(result.samples.begin(), result.samples.end(),
              std::back_inserter(samples));
  }
  return samples;
}

auto SearchController::search() -> SearchOutcome {
  spdlog::set_level(config_.logLevel);
  SPDLOG_DEBUG("Configuration: {}", config_.json().dump());
  const auto startTime = std::chrono::steady_clock::now();
  const auto deadline = startTime + std::chrono::milliseconds(config_.timeout);
  const auto& target = target_.get();
  const auto& pattern = pattern_.get();

  SearchOutcome outcome;
  Statistics statistics;
  if (pattern.empty()) {
    SPDLOG_INFO("Pattern is empty and embeds trivially");
    outcome.setFound({});
    outcome.setConfidence(1.);
    outcome.setConfidenceTargetReached(true);
    statistics.totalTime = std::chrono::duration_cast<std::chrono::microseconds>(
                               std::chrono::steady_clock::now() - startTime)
                               .count();
    outcome.setStatistics(statistics);
    return outcome;
  }

  const auto oracle =
      buildOracle(encode(target), encode(pattern), config_.maxPatternVertices);
  const AmplitudeAmplifier amplifier(oracle);
  const auto& layout = oracle.getLayout();
  const auto searchSpace = oracle.getSearchSpaceSize();
  const auto ceiling = config_.escalationCeiling == 0
                           ? amplifier.getSingleSolutionIterations()
                           : config_.escalationCeiling;
  const auto maxSolutions = injectiveMappingCount(
      target.getNvertices(), pattern.getNvertices(), searchSpace);
  ConfidenceTracker tracker(searchSpace, maxSolutions);
  AmplificationSchedule schedule(
      {config_.initialIterationCount, ceiling, config_.ceilingRounds,
       config_.maxRounds, config_.confidenceTarget},
      rng_());

  statistics.oracleQubits = layout.nQubits;
  statistics.oracleGates = oracle.getCircuit().size();
  statistics.searchSpace = searchSpace;
  statistics.maxSolutions = maxSolutions;
  statistics.iterationCeiling = ceiling;
  const auto setupDone = std::chrono::steady_clock::now();
  statistics.setupTime = std::chrono::duration_cast<std::chrono::microseconds>(
                             setupDone - startTime)
                             .count();
  SPDLOG_DEBUG("Oracle layout: {}", layout.json().dump());
  SPDLOG_DEBUG("Oracle uses {} qubits and {} operations, one iterate {} "
               "operations",
               layout.nQubits, statistics.oracleGates,
               amplifier.getIterate().size());
  SPDLOG_INFO("Searching {} register values with at most {} iterations per "
              "round",
              searchSpace, ceiling);

  std::optional<TerminationReason> stopReason;
  schedule.start();
  while (!schedule.isTerminal()) {
    if (config_.timeout != 0 && std::chrono::steady_clock::now() >= deadline) {
      SPDLOG_INFO("Deadline of {} ms reached", config_.timeout);
      stopReason = TerminationReason::Deadline;
      break;
    }
    if (config_.shotBudget != 0 && statistics.shots >= config_.shotBudget) {
      SPDLOG_INFO("Shot budget of {} exhausted", config_.shotBudget);
      stopReason = TerminationReason::ShotBudget;
      break;
    }
    auto shots = config_.shotsPerIteration;
    if (config_.shotBudget != 0) {
      shots = std::min(shots, config_.shotBudget - statistics.shots);
    }

    const auto amplified = amplifier.amplify(schedule.getIterations());
    schedule.awaitMeasurement();
    const auto samples = sample(amplified.circuit, shots, statistics);

    RoundRecord record;
    record.round = statistics.rounds;
    record.iterations = amplified.iterations;
    record.minIterations = schedule.getMinIterations();
    record.maxIterations = schedule.getMaxIterations();
    record.shots = samples.size();
    std::optional<CandidateMapping> embedding;
    for (const auto& bitstring : samples) {
      const auto result = verifyMapping(
          target, pattern,
          decodeMapping(bitstring, layout.nPatternVertices,
                        layout.blockWidth));
      switch (result.reason) {
      case RejectionReason::None:
        if (!embedding.has_value()) {
          embedding = result.mapping;
        }
        break;
      case RejectionReason::OutOfRange:
        ++record.outOfRange;
        break;
      case RejectionReason::NotInjective:
        ++record.notInjective;
        break;
      case RejectionReason::EdgeViolation:
        ++record.edgeViolations;
        break;
      }
    }
    ++statistics.rounds;
    statistics.shots += samples.size();
    statistics.groverIterations += amplified.iterations;
    tracker.recordRound(record.minIterations, record.maxIterations,
                        record.shots);
    record.confidence = tracker.getConfidence();
    outcome.addRound(record);
    SPDLOG_INFO("Round {}: {} iterations in [{}, {}], {} shots, {} out of "
                "range, {} not injective, {} edge violations, confidence {}",
                record.round, record.iterations, record.minIterations,
                record.maxIterations, record.shots, record.outOfRange,
                record.notInjective, record.edgeViolations, record.confidence);

    if (embedding.has_value()) {
      schedule.reportSuccess();
      outcome.setFound(*embedding);
      outcome.setConfidence(1.);
      outcome.setConfidenceTargetReached(true);
      SPDLOG_INFO("Found embedding after {} rounds", statistics.rounds);
    } else {
      schedule.reportFailure(record.confidence);
    }
  }

  if (!outcome.found()) {
    if (!stopReason.has_value()) {
      stopReason = schedule.isRoundLimitReached()
                       ? TerminationReason::RoundLimit
                       : TerminationReason::ScheduleExhausted;
    }
    outcome.setNotFound(*stopReason);
    outcome.setConfidence(tracker.getConfidence());
    outcome.setConfidenceTargetReached(tracker.getConfidence() >=
                                       config_.confidenceTarget);
    SPDLOG_INFO("No embedding found ({}), confidence {}",
                toString(*stopReason), tracker.getConfidence());
  }

  const auto endTime = std::chrono::steady_clock::now();
  statistics.searchTime =
      std::chrono::duration_cast<std::chrono::microseconds>(endTime - setupDone)
          .count();
  statistics.totalTime =
      std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime)
          .count();
  outcome.setStatistics(statistics);
  return outcome;
}
} // namespace qsis
