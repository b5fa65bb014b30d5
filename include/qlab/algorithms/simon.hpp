/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "qlab/quantum/circuit.hpp"

namespace qlab {
namespace algorithms {
namespace simon {

/**
 * Simon circuit for secret s: inputs 0..n-1, outputs n..2n-1.
 *
 * The oracle copies each input onto its output and then XORs in the secret
 * with a second CX per 1 bit of s. This literal construction computes
 * f(x) = x AND NOT s, which is two-to-one with period s when s has a single
 * 1 bit; every measured y satisfies y.s = 0 for any s.
 */
quantum::QuantumCircuit build(const std::string& secret);

// y.s = 0 (mod 2); both strings must have the same length.
bool is_orthogonal(const std::string& y, const std::string& s);

/**
 * Recovers s from measured y vectors by Gaussian elimination over GF(2).
 *
 * Returns 0^n when the equations have full rank n, the unique non-zero
 * solution when the rank is n-1, and nullopt when more than one non-zero
 * secret remains consistent with the data.
 */
std::optional<std::string> solve_secret(const std::vector<std::string>& measurements, int num_bits);

} // namespace simon
} // namespace algorithms
} // namespace qlab
