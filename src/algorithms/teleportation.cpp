/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/algorithms/teleportation.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace qlab {
namespace algorithms {
namespace teleportation {

using quantum::QuantumCircuit;

NamedState parse_state(const std::string& name) {
    if (name == "zero") return NamedState::Zero;
    if (name == "one") return NamedState::One;
    if (name == "plus") return NamedState::Plus;
    if (name == "minus") return NamedState::Minus;
    throw std::invalid_argument(fmt::format(
        "Unsupported state '{}'. Use zero, one, plus, or minus.", name));
}

bool is_known_state(const std::string& name) {
    return name == "zero" || name == "one" || name == "plus" || name == "minus";
}

const char* state_name(NamedState state) {
    switch (state) {
        case NamedState::Zero: return "zero";
        case NamedState::One: return "one";
        case NamedState::Plus: return "plus";
        case NamedState::Minus: return "minus";
    }
    return "unknown";
}

static void append_protocol(QuantumCircuit& qc) {
    qc.h(1);
    qc.cx(1, 2);

    qc.cx(0, 1);
    qc.h(0);

    qc.measure(0, 0);
    qc.measure(1, 1);
    qc.measure(2, 2);
}

QuantumCircuit build(NamedState state) {
    QuantumCircuit qc(3, 3);
    switch (state) {
        case NamedState::Zero:
            break;
        case NamedState::One:
            qc.x(0);
            break;
        case NamedState::Plus:
            qc.h(0);
            break;
        case NamedState::Minus:
            qc.x(0);
            qc.h(0);
            break;
    }
    append_protocol(qc);
    return qc;
}

QuantumCircuit build_arbitrary(double theta, double phi) {
    QuantumCircuit qc(3, 3);
    qc.add_rotation(0, theta, quantum::RotationAxis::Y);
    qc.phase(0, phi);
    append_protocol(qc);
    return qc;
}

quantum::Histogram corrected_target_counts(const quantum::Histogram& histogram, CorrectionBit rule) {
    quantum::Histogram target{{"0", 0}, {"1", 0}};
    // Key layout: [0] = c2 (teleported qubit), [1] = c1, [2] = c0.
    const std::size_t control_pos = rule == CorrectionBit::Qubit1 ? 1 : 2;
    for (const auto& [bits, count] : histogram) {
        if (bits.size() != 3) {
            throw std::invalid_argument(fmt::format("Expected 3-bit outcome, got \"{}\"", bits));
        }
        bool value = bits[0] == '1';
        if (bits[control_pos] == '1') {
            value = !value;
        }
        target[value ? "1" : "0"] += count;
    }
    return target;
}

} // namespace teleportation
} // namespace algorithms
} // namespace qlab
