/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qlab/quantum/types.hpp"

namespace qlab {
namespace quantum {
namespace gates {

/**
 * Row-major 2x2 complex matrix acting on one qubit:
 *   |0> -> m00|0> + m10|1>
 *   |1> -> m01|0> + m11|1>
 */
struct Matrix2 {
    Complex m00;
    Complex m01;
    Complex m10;
    Complex m11;
};

Matrix2 identity();
Matrix2 hadamard();
Matrix2 pauli_x();
Matrix2 pauli_y();
Matrix2 pauli_z();
Matrix2 s_gate();
Matrix2 t_gate();

// diag(1, e^{i theta})
Matrix2 phase(double theta);

Matrix2 rx(double theta);
Matrix2 ry(double theta);
Matrix2 rz(double theta);

Matrix2 adjoint(const Matrix2& m);
Matrix2 multiply(const Matrix2& a, const Matrix2& b);

// True when m^dagger * m equals the identity within tolerance.
bool is_unitary(const Matrix2& m, double tolerance = 1e-12);

} // namespace gates
} // namespace quantum
} // namespace qlab
