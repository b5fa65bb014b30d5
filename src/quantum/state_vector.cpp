/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/quantum/state_vector.hpp"
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace qlab {
namespace quantum {

StateVector::StateVector(int num_qubits)
    : num_qubits_(num_qubits) {
    if (num_qubits <= 0 || num_qubits > kMaxQubits) {
        throw std::invalid_argument(fmt::format(
            "Invalid number of qubits: {} (expected 1..{})", num_qubits, kMaxQubits));
    }
    amplitudes_.assign(std::size_t(1) << num_qubits, Complex(0.0, 0.0));
    amplitudes_[0] = Complex(1.0, 0.0);
}

StateVector::StateVector(int num_qubits, Amplitudes amplitudes)
    : num_qubits_(num_qubits)
    , amplitudes_(std::move(amplitudes)) {}

StateVector StateVector::basis_state(int num_qubits, std::size_t index) {
    StateVector sv(num_qubits);
    if (index >= sv.size()) {
        throw std::out_of_range(fmt::format(
            "Basis index {} out of range for {} qubits", index, num_qubits));
    }
    sv.amplitudes_[0] = Complex(0.0, 0.0);
    sv.amplitudes_[index] = Complex(1.0, 0.0);
    return sv;
}

StateVector StateVector::from_amplitudes(Amplitudes amplitudes) {
    const std::size_t dim = amplitudes.size();
    if (dim < 2 || (dim & (dim - 1)) != 0) {
        throw std::invalid_argument(fmt::format(
            "Amplitude count {} is not a power of two >= 2", dim));
    }
    int n = 0;
    while ((std::size_t(1) << n) < dim) {
        ++n;
    }
    if (n > kMaxQubits) {
        throw std::invalid_argument("Too many amplitudes");
    }
    StateVector sv(n, std::move(amplitudes));
    sv.check_normalized();
    return sv;
}

void StateVector::check_qubit(int qubit) const {
    if (qubit < 0 || qubit >= num_qubits_) {
        throw std::out_of_range(fmt::format(
            "Qubit index {} out of range for {}-qubit register", qubit, num_qubits_));
    }
}

std::size_t StateVector::control_mask(const std::vector<int>& controls, int target) const {
    check_qubit(target);
    std::size_t mask = 0;
    for (int c : controls) {
        check_qubit(c);
        if (c == target) {
            throw std::invalid_argument(fmt::format("Qubit {} is both control and target", c));
        }
        const std::size_t bit = std::size_t(1) << c;
        if (mask & bit) {
            throw std::invalid_argument(fmt::format("Duplicate control qubit {}", c));
        }
        mask |= bit;
    }
    return mask;
}

void StateVector::apply_matrix(int target, const gates::Matrix2& m) {
    apply_controlled_matrix({}, target, m);
}

void StateVector::apply_controlled_matrix(const std::vector<int>& controls, int target,
                                          const gates::Matrix2& m) {
    const std::size_t cmask = control_mask(controls, target);
    const std::size_t tmask = std::size_t(1) << target;
    const std::size_t dim = amplitudes_.size();

    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & tmask) == 0 && (i & cmask) == cmask) {
            const std::size_t j = i | tmask;
            Complex a0 = amplitudes_[i];
            Complex a1 = amplitudes_[j];
            amplitudes_[i] = m.m00 * a0 + m.m01 * a1;
            amplitudes_[j] = m.m10 * a0 + m.m11 * a1;
        }
    }
}

void StateVector::apply_x(int target) {
    apply_mcx({}, target);
}

void StateVector::apply_z(int target) {
    apply_mcz({}, target);
}

void StateVector::apply_phase(int target, double theta) {
    check_qubit(target);
    const std::size_t tmask = std::size_t(1) << target;
    const Complex factor = std::polar(1.0, theta);
    for (std::size_t i = 0; i < amplitudes_.size(); ++i) {
        if (i & tmask) {
            amplitudes_[i] *= factor;
        }
    }
}

void StateVector::apply_controlled_phase(int control, int target, double theta) {
    // Symmetric in control/target: only |11> picks up the phase.
    const std::size_t mask = control_mask({control}, target) | (std::size_t(1) << target);
    const Complex factor = std::polar(1.0, theta);
    for (std::size_t i = 0; i < amplitudes_.size(); ++i) {
        if ((i & mask) == mask) {
            amplitudes_[i] *= factor;
        }
    }
}

void StateVector::apply_swap(int a, int b) {
    check_qubit(a);
    check_qubit(b);
    if (a == b) {
        throw std::invalid_argument(fmt::format("SWAP requires distinct qubits, got {} twice", a));
    }
    const std::size_t amask = std::size_t(1) << a;
    const std::size_t bmask = std::size_t(1) << b;
    for (std::size_t i = 0; i < amplitudes_.size(); ++i) {
        // Visit each (a=1, b=0) index once and exchange with its (a=0, b=1) partner.
        if ((i & amask) && !(i & bmask)) {
            const std::size_t j = (i ^ amask) | bmask;
            std::swap(amplitudes_[i], amplitudes_[j]);
        }
    }
}

void StateVector::apply_mcx(const std::vector<int>& controls, int target) {
    const std::size_t cmask = control_mask(controls, target);
    const std::size_t tmask = std::size_t(1) << target;
    for (std::size_t i = 0; i < amplitudes_.size(); ++i) {
        if ((i & tmask) == 0 && (i & cmask) == cmask) {
            std::swap(amplitudes_[i], amplitudes_[i | tmask]);
        }
    }
}

void StateVector::apply_mcz(const std::vector<int>& controls, int target) {
    const std::size_t mask = control_mask(controls, target) | (std::size_t(1) << target);
    for (std::size_t i = 0; i < amplitudes_.size(); ++i) {
        if ((i & mask) == mask) {
            amplitudes_[i] = -amplitudes_[i];
        }
    }
}

std::vector<double> StateVector::probabilities() const {
    std::vector<double> probs(amplitudes_.size());
    for (std::size_t i = 0; i < amplitudes_.size(); ++i) {
        probs[i] = std::norm(amplitudes_[i]);
    }
    return probs;
}

double StateVector::norm_squared() const {
    // Kahan summation keeps the check meaningful for large registers.
    double sum = 0.0;
    double c = 0.0;
    for (const auto& a : amplitudes_) {
        double y = std::norm(a) - c;
        double t = sum + y;
        c = (t - sum) - y;
        sum = t;
    }
    return sum;
}

void StateVector::check_normalized(double tolerance) const {
    const double norm2 = norm_squared();
    if (!std::isfinite(norm2) || std::abs(norm2 - 1.0) > tolerance) {
        throw NumericalError(fmt::format(
            "State vector norm drifted: |psi|^2 = {:.17g} (tolerance {:g})", norm2, tolerance));
    }
}

} // namespace quantum
} // namespace qlab
