/*
 * Copyright (c) 2023 - 2025 Chair for Design Automation, TUM
 * Copyright (c) 2025 Munich Quantum Software Company GmbH
 * All rights reserved.
 *
 * SPDX-License-Identifier: MIT
 *
 * Licensed under the MIT License
 */

#include "ir/Definitions.hpp"
#include "ir/QuantumComputation.hpp"
#include "ir/operations/Control.hpp"
#include "qsis/backend/DDSimulatorBackend.hpp"

#include <cmath>
#include <complex>
#include <cstddef>
#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <set>
#include <string>

namespace qsis {
TEST(DDSimulatorTest, ClassicalGates) {
  qc::QuantumComputation qc(4);
  qc.x(0);
  qc.cx(qc::Control{0}, 1);
  // negative control on qubit 2, which is |0>
  qc.mcx({qc::Control{1}, qc::Control{2, qc::Control::Type::Neg}}, 3);
  qc.swap(0, 2);
  const auto state = DDSimulatorBackend::simulate(qc);
  ASSERT_EQ(state.size(), 16);
  // qubits 1, 2, 3 are set
  EXPECT_NEAR(std::abs(state[0b1110]), 1., 1e-12);
}
TEST(DDSimulatorTest, HadamardLayer) {
  qc::QuantumComputation qc(3);
  qc.h(0);
  qc.h(2);
  const auto state = DDSimulatorBackend::simulate(qc);
  for (std::size_t s = 0; s < state.size(); ++s) {
    const auto expected =
        (s == 0b000 || s == 0b001 || s == 0b100 || s == 0b101) ? 0.5 : 0.;
    EXPECT_NEAR(state[s].real(), expected, 1e-12) << "basis state " << s;
  }
}
TEST(DDSimulatorTest, PhaseKickback) {
  // H Z H = X
  qc::QuantumComputation qc(1);
  qc.h(0);
  qc.z(0);
  qc.h(0);
  const auto state = DDSimulatorBackend::simulate(qc);
  EXPECT_NEAR(std::abs(state[0]), 0., 1e-12);
  EXPECT_NEAR(state[1].real(), 1., 1e-12);
}
TEST(DDSimulatorTest, ControlledPhases) {
  qc::QuantumComputation qc(2);
  qc.h(0);
  qc.h(1);
  qc.cz(qc::Control{0}, 1);
  qc.s(0);
  qc.t(1);
  const auto state = DDSimulatorBackend::simulate(qc);
  const auto t = std::polar(1., qc::PI_4);
  const std::complex<double> i(0., 1.);
  EXPECT_NEAR(std::abs(state[0b00] - 0.5), 0., 1e-12);
  EXPECT_NEAR(std::abs(state[0b01] - (0.5 * i)), 0., 1e-12);
  EXPECT_NEAR(std::abs(state[0b10] - (0.5 * t)), 0., 1e-12);
  // CZ, S and T all apply to |11>
  EXPECT_NEAR(std::abs(state[0b11] - (-0.5 * i * t)), 0., 1e-12);
}
TEST(DDSimulatorTest, SimulationSkipsMeasurements) {
  qc::QuantumComputation qc(2, 2);
  qc.h(0);
  qc.cx(qc::Control{0}, 1);
  qc.measure(0, 0);
  qc.measure(1, 1);
  const auto state = DDSimulatorBackend::simulate(qc);
  EXPECT_NEAR(state[0b00].real(), 1. / std::sqrt(2.), 1e-12);
  EXPECT_NEAR(state[0b11].real(), 1. / std::sqrt(2.), 1e-12);
}
TEST(DDSimulatorTest, SamplesBitstrings) {
  qc::QuantumComputation qc(2, 2);
  qc.x(1);
  qc.measure(0, 0);
  qc.measure(1, 1);
  DDSimulatorBackend backend;
  const auto samples = backend.execute(qc, 5, 1);
  // classical bit 1 is the leftmost character
  EXPECT_THAT(samples, ::testing::Each(::testing::Eq("10")));
  EXPECT_EQ(samples.size(), 5);
}
TEST(DDSimulatorTest, SamplesMeasuredQubitsOnly) {
  qc::QuantumComputation qc(3, 2);
  qc.h(0);
  qc.cx(qc::Control{0}, 2);
  qc.measure(2, 0);
  qc.measure(1, 1);
  DDSimulatorBackend backend;
  const auto samples = backend.execute(qc, 200, 5);
  ASSERT_EQ(samples.size(), 200);
  const std::set<std::string> outcomes(samples.cbegin(), samples.cend());
  EXPECT_THAT(outcomes, ::testing::ElementsAre("00", "01"));
}
TEST(DDSimulatorTest, SamplingFollowsDistribution) {
  qc::QuantumComputation qc(1, 1);
  qc.h(0);
  qc.measure(0, 0);
  DDSimulatorBackend backend;
  const auto samples = backend.execute(qc, 2000, 7);
  std::size_t ones = 0;
  for (const auto& s : samples) {
    if (s == "1") {
      ++ones;
    }
  }
  EXPECT_GT(ones, 850);
  EXPECT_LT(ones, 1150);
}
TEST(DDSimulatorTest, SeededSampling) {
  qc::QuantumComputation qc(3, 3);
  qc.h(0);
  qc.h(1);
  qc.h(2);
  qc.measure(0, 0);
  qc.measure(1, 1);
  qc.measure(2, 2);
  DDSimulatorBackend backend;
  EXPECT_EQ(backend.execute(qc, 50, 11), backend.execute(qc, 50, 11));
  EXPECT_NE(backend.execute(qc, 50, 11), backend.execute(qc, 50, 12));
}
TEST(DDSimulatorTest, NoMeasurements) {
  qc::QuantumComputation qc(1);
  qc.h(0);
  DDSimulatorBackend backend;
  const auto samples = backend.execute(qc, 3, 1);
  EXPECT_EQ(samples.size(), 3);
  EXPECT_THAT(samples, ::testing::Each(::testing::Eq("")));
}
TEST(DDSimulatorTest, RepeatedHadamardsCancel) {
  qc::QuantumComputation qc(1, 1);
  qc.h(0);
  qc.h(0);
  qc.measure(0, 0);
  DDSimulatorBackend backend;
  EXPECT_THAT(backend.execute(qc, 10, 3), ::testing::Each(::testing::Eq("0")));
}
} // namespace qsis
