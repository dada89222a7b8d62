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

#include <stdexcept>
#include <string>
#include <utility>

namespace qsis {
/// Base class of all errors raised by the subgraph search
class QSISException : public std::runtime_error {
  std::string msg;

public:
  explicit QSISException(std::string m)
      : std::runtime_error("QSIS Exception"), msg(std::move(m)) {}

  [[nodiscard]] const char* what() const noexcept override {
    return msg.c_str();
  }
};

/// Malformed input graph (out-of-range vertex, self-loop, duplicate edge)
class InvalidGraphError : public QSISException {
public:
  explicit InvalidGraphError(std::string m) : QSISException(std::move(m)) {}
};

/// Pattern graph does not fit into the target graph or the oracle bounds
class IncompatibleSizeError : public QSISException {
public:
  explicit IncompatibleSizeError(std::string m)
      : QSISException(std::move(m)) {}
};

/**
 * Raised by an execution backend when a circuit could not be executed. The
 * failure is considered transient, i.e., the request may be retried.
 */
class BackendExecutionError : public QSISException {
public:
  explicit BackendExecutionError(std::string m)
      : QSISException(std::move(m)) {}
};

/// The search was aborted because the backend kept failing
class SearchAbortedError : public QSISException {
public:
  explicit SearchAbortedError(std::string m) : QSISException(std::move(m)) {}
};
} // namespace qsis
