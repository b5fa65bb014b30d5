/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <optional>
#include <string>
#include "qlab/quantum/circuit.hpp"
#include "qlab/quantum/histogram.hpp"

namespace qlab {
namespace algorithms {
namespace bernstein_vazirani {

// Oracle f(x) = s.x mod 2; one query reveals s on the input register.
quantum::QuantumCircuit build(const std::string& secret);

// Most frequent outcome, nullopt for an empty histogram.
std::optional<std::string> recover_secret(const quantum::Histogram& histogram);

} // namespace bernstein_vazirani
} // namespace algorithms
} // namespace qlab
