/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <complex>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace qlab {
namespace quantum {

using Complex = std::complex<double>;
using Amplitudes = std::vector<Complex>;

// Tolerance applied to the squared norm after every evolution.
constexpr double kNormTolerance = 1e-9;

// Probabilities below this are treated as exactly zero before sampling.
constexpr double kProbabilityEpsilon = 1e-10;

// Largest register the simulator accepts.
constexpr int kMaxQubits = 30;

/**
 * Raised when the simulated state drifts away from unit norm.
 * Indicates a defect in gate application, never a user error.
 */
class NumericalError : public std::runtime_error {
public:
    explicit NumericalError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace quantum
} // namespace qlab
