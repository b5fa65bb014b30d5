/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/algorithms/simon.hpp"
#include "qlab/algorithms/bitstring.hpp"
#include <fmt/format.h>
#include <bit>
#include <cstdint>
#include <stdexcept>

namespace qlab {
namespace algorithms {
namespace simon {

using quantum::QuantumCircuit;

QuantumCircuit build(const std::string& secret) {
    bitstring::require_valid(secret, "Secret");
    const int n = static_cast<int>(secret.size());
    QuantumCircuit qc(2 * n, n);

    for (int q = 0; q < n; ++q) {
        qc.h(q);
    }
    for (int q = 0; q < n; ++q) {
        qc.cx(q, n + q);
    }
    for (int q = 0; q < n; ++q) {
        if (bitstring::bit_for_qubit(secret, q)) {
            qc.cx(q, n + q);
        }
    }
    for (int q = 0; q < n; ++q) {
        qc.h(q);
    }
    for (int q = 0; q < n; ++q) {
        qc.measure(q, q);
    }
    return qc;
}

bool is_orthogonal(const std::string& y, const std::string& s) {
    bitstring::require_valid(s, "Secret");
    bitstring::require_valid(y, "Measurement", static_cast<int>(s.size()));
    int dot = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        dot ^= (y[i] == '1' && s[i] == '1') ? 1 : 0;
    }
    return dot == 0;
}

std::optional<std::string> solve_secret(const std::vector<std::string>& measurements, int num_bits) {
    if (num_bits <= 0 || num_bits > 64) {
        throw std::invalid_argument(fmt::format("Secret width must be 1..64, got {}", num_bits));
    }

    // Row-reduce; rows[k] has its pivot at pivot_bit[k] and no other row has that bit set.
    std::vector<std::uint64_t> rows;
    std::vector<int> pivot_bit;
    for (const auto& m : measurements) {
        bitstring::require_valid(m, "Measurement", num_bits);
        std::uint64_t v = bitstring::from_bitstring(m);
        for (std::size_t k = 0; k < rows.size(); ++k) {
            if ((v >> pivot_bit[k]) & 1ULL) {
                v ^= rows[k];
            }
        }
        if (v == 0) {
            continue;
        }
        const int p = std::countr_zero(v);
        for (auto& r : rows) {
            if ((r >> p) & 1ULL) {
                r ^= v;
            }
        }
        rows.push_back(v);
        pivot_bit.push_back(p);
    }

    const int rank = static_cast<int>(rows.size());
    if (rank == num_bits) {
        return std::string(num_bits, '0');
    }
    if (rank < num_bits - 1) {
        return std::nullopt;
    }

    // Exactly one free column: set it to 1 and back-substitute the pivots.
    std::uint64_t pivots = 0;
    for (int p : pivot_bit) {
        pivots |= 1ULL << p;
    }
    int free_bit = 0;
    while ((pivots >> free_bit) & 1ULL) {
        ++free_bit;
    }
    std::uint64_t s = 1ULL << free_bit;
    for (std::size_t k = 0; k < rows.size(); ++k) {
        if ((rows[k] >> free_bit) & 1ULL) {
            s |= 1ULL << pivot_bit[k];
        }
    }
    return bitstring::to_bitstring(s, num_bits);
}

} // namespace simon
} // namespace algorithms
} // namespace qlab
