/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <vector>
#include "qlab/quantum/gates.hpp"
#include "qlab/quantum/types.hpp"

namespace qlab {
namespace quantum {

/**
 * Exact n-qubit register: 2^n complex amplitudes.
 *
 * Basis index encodes qubit q at bit weight 2^q (qubit 0 is the least
 * significant bit). All kernels validate qubit indices and throw
 * std::out_of_range / std::invalid_argument instead of clamping.
 */
class StateVector {
public:
    // Initializes |0...0>.
    explicit StateVector(int num_qubits);

    // Computational basis state |index>.
    static StateVector basis_state(int num_qubits, std::size_t index);

    // Takes ownership of amplitudes; size must be a power of two and the
    // vector must be normalized within kNormTolerance.
    static StateVector from_amplitudes(Amplitudes amplitudes);

    int num_qubits() const { return num_qubits_; }
    std::size_t size() const { return amplitudes_.size(); }
    const Amplitudes& amplitudes() const { return amplitudes_; }
    Complex amplitude(std::size_t index) const { return amplitudes_.at(index); }

    // Generic 2x2 unitary on target.
    void apply_matrix(int target, const gates::Matrix2& m);

    // 2x2 unitary on target, applied only where every control bit is 1.
    void apply_controlled_matrix(const std::vector<int>& controls, int target, const gates::Matrix2& m);

    // Closed-form kernels
    void apply_x(int target);
    void apply_z(int target);
    void apply_phase(int target, double theta);
    void apply_controlled_phase(int control, int target, double theta);
    void apply_swap(int a, int b);
    void apply_mcx(const std::vector<int>& controls, int target);
    void apply_mcz(const std::vector<int>& controls, int target);

    std::vector<double> probabilities() const;
    double norm_squared() const;

    // Throws NumericalError when the squared norm deviates from 1 by more
    // than tolerance.
    void check_normalized(double tolerance = kNormTolerance) const;

private:
    StateVector(int num_qubits, Amplitudes amplitudes);

    void check_qubit(int qubit) const;
    std::size_t control_mask(const std::vector<int>& controls, int target) const;

    int num_qubits_;
    Amplitudes amplitudes_;
};

} // namespace quantum
} // namespace qlab
