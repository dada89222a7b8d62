/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "qsis/Verification.hpp"

#include "qsis/Graph.hpp"
#include "qsis/Types.hpp"

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace qsis {
auto toString(const RejectionReason reason) -> std::string {
  switch (reason) {
  case RejectionReason::None:
    return "none";
  case RejectionReason::OutOfRange:
    return "out_of_range";
  case RejectionReason::NotInjective:
    return "not_injective";
  case RejectionReason::EdgeViolation:
    return "edge_violation";
  }
  return "Error";
}

auto decodeMapping(const std::string& bitstring,
                   const std::size_t nPatternVertices, const std::size_t width)
    -> CandidateMapping {
  const auto len = bitstring.size();
  if (len != nPatternVertices * width) {
    std::stringstream ss;
    ss << "Bit-string of length " << len << " does not match "
       << nPatternVertices << " blocks of width " << width;
    throw std::invalid_argument(ss.str());
  }
  CandidateMapping mapping(nPatternVertices, 0);
  for (std::size_t b = 0; b < len; ++b) {
    const auto c = bitstring[len - 1 - b];
    if (c != '0' && c != '1') {
      std::stringstream ss;
      ss << "Invalid character '" << c << "' in bit-string " << bitstring;
      throw std::invalid_argument(ss.str());
    }
    if (c == '1') {
      mapping[b / width] |= static_cast<Vertex>(1U << (b % width));
    }
  }
  return mapping;
}

auto verifyMapping(const Graph& target, const Graph& pattern,
                   const CandidateMapping& mapping) -> VerificationResult {
  VerificationResult result{mapping, RejectionReason::None, std::nullopt};
  if (mapping.size() != pattern.getNvertices()) {
    std::stringstream ss;
    ss << "Mapping of size " << mapping.size() << " for a pattern with "
       << pattern.getNvertices() << " vertices";
    throw std::invalid_argument(ss.str());
  }
  for (const auto v : mapping) {
    if (v >= target.getNvertices()) {
      result.reason = RejectionReason::OutOfRange;
      return result;
    }
  }
  std::vector<bool> used(target.getNvertices(), false);
  for (const auto v : mapping) {
    if (used[v]) {
      result.reason = RejectionReason::NotInjective;
      return result;
    }
    used[v] = true;
  }
  for (const auto& [i, j] : pattern.getEdges()) {
    if (!target.isAdjacent(mapping[i], mapping[j])) {
      result.reason = RejectionReason::EdgeViolation;
      result.violatedEdge = Edge{i, j};
      return result;
    }
  }
  return result;
}
} // namespace qsis
