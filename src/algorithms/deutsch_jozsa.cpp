/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qlab/algorithms/deutsch_jozsa.hpp"
#include "qlab/algorithms/bitstring.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace qlab {
namespace algorithms {
namespace deutsch_jozsa {

using quantum::QuantumCircuit;

namespace {

void check_inputs(int num_inputs) {
    if (num_inputs <= 0) {
        throw std::invalid_argument(fmt::format("Number of input qubits must be >= 1, got {}", num_inputs));
    }
}

// Exhaustive over the variant alternatives.
struct OracleWriter {
    QuantumCircuit& qc;
    int n;

    void operator()(const ConstantOracle& oracle) const {
        if (oracle.value) {
            qc.x(n);
        }
    }

    void operator()(const BalancedOracle& oracle) const {
        bitstring::require_valid(oracle.mask, "Balanced oracle mask", n);
        if (oracle.mask.find('1') == std::string::npos) {
            throw std::invalid_argument("Balanced oracle mask must select at least one input");
        }
        for (int i = 0; i < n; ++i) {
            if (bitstring::bit_for_qubit(oracle.mask, i)) {
                qc.cx(i, n);
            }
        }
    }
};

} // namespace

Oracle constant_zero() { return ConstantOracle{false}; }
Oracle constant_one() { return ConstantOracle{true}; }

Oracle balanced_first(int num_inputs) {
    check_inputs(num_inputs);
    std::string mask(num_inputs, '0');
    mask.back() = '1';
    return BalancedOracle{mask};
}

Oracle balanced_parity(int num_inputs) {
    check_inputs(num_inputs);
    return BalancedOracle{std::string(num_inputs, '1')};
}

bool is_known_oracle_name(const std::string& name) {
    return name == "constant_zero" || name == "constant_one" ||
           name == "balanced_first" || name == "balanced_parity";
}

Oracle oracle_from_name(const std::string& name, int num_inputs) {
    if (name == "constant_zero") return constant_zero();
    if (name == "constant_one") return constant_one();
    if (name == "balanced_first") return balanced_first(num_inputs);
    if (name == "balanced_parity") return balanced_parity(num_inputs);
    throw std::invalid_argument(fmt::format("Unsupported Deutsch-Jozsa oracle '{}'", name));
}

QuantumCircuit build(int num_inputs, const Oracle& oracle) {
    check_inputs(num_inputs);
    const int n = num_inputs;
    QuantumCircuit qc(n + 1, n);

    qc.x(n);
    for (int q = 0; q <= n; ++q) {
        qc.h(q);
    }
    std::visit(OracleWriter{qc, n}, oracle);
    for (int q = 0; q < n; ++q) {
        qc.h(q);
    }
    for (int q = 0; q < n; ++q) {
        qc.measure(q, q);
    }
    return qc;
}

Verdict classify(const quantum::Histogram& histogram, int num_inputs) {
    const std::uint64_t total = quantum::total_counts(histogram);
    if (total == 0) {
        return Verdict::Unknown;
    }
    auto it = histogram.find(std::string(num_inputs, '0'));
    const double zeros = it == histogram.end() ? 0.0 : static_cast<double>(it->second);
    return zeros > 0.8 * static_cast<double>(total) ? Verdict::Constant : Verdict::Balanced;
}

const char* verdict_name(Verdict verdict) {
    switch (verdict) {
        case Verdict::Constant: return "constant";
        case Verdict::Balanced: return "balanced";
        case Verdict::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace deutsch_jozsa
} // namespace algorithms
} // namespace qlab
