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

#include "qsis/Graph.hpp"
#include "qsis/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace qsis {
/// Reason for rejecting a decoded candidate mapping
enum class RejectionReason : std::uint8_t {
  None,
  OutOfRange,
  NotInjective,
  EdgeViolation
};

[[nodiscard]] auto toString(RejectionReason reason) -> std::string;

struct VerificationResult {
  CandidateMapping mapping;
  RejectionReason reason = RejectionReason::None;
  /// the pattern edge that is not preserved, if any
  std::optional<Edge> violatedEdge;

  [[nodiscard]] auto isValid() const -> bool {
    return reason == RejectionReason::None;
  }
};

/**
 * @brief Decodes a measured bit-string into a candidate mapping.
 * @details Character len-1-b of the bit-string holds classical bit b. Pattern
 * vertex p is read little-endian from bits [p * width, (p + 1) * width).
 * @throws std::invalid_argument if the bit-string has the wrong length or
 * contains characters other than '0' and '1'
 */
[[nodiscard]] auto decodeMapping(const std::string& bitstring,
                                 std::size_t nPatternVertices,
                                 std::size_t width) -> CandidateMapping;

/**
 * @brief Checks whether a candidate mapping embeds the pattern into the
 * target.
 * @details The checks run in the order range, injectivity, edges, and the
 * first failing one determines the reason.
 */
[[nodiscard]] auto verifyMapping(const Graph& target, const Graph& pattern,
                                 const CandidateMapping& mapping)
    -> VerificationResult;
} // namespace qsis
