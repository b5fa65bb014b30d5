/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qlab::config {

struct RunConfig {
    std::string algo{"bell"};
    int shots{1024};
    std::optional<std::uint64_t> seed; // random_device when absent
    bool show_probabilities{false};    // also log exact pre-measurement probabilities

    int qubits{3};                         // coin, deutsch_jozsa inputs, uniform qft width
    std::string target{"11"};              // grover
    int iterations{0};                     // grover, 0 = floor(pi/4 sqrt(2^n))
    std::string oracle{"balanced_parity"}; // deutsch_jozsa
    std::string secret{"1011"};            // bernstein_vazirani, simon
    std::string initial_state{"101"};      // qft round trip, empty = uniform transform
    int counting{3};                       // phase_estimation
    double phase{0.25};
    long long a{3};                        // adder
    long long b{5};
    int bits{4};
    std::string state{"plus"};             // teleport
};

// Explicit command line options, in the order given; applied last.
using Overrides = std::vector<std::pair<std::string, std::string>>;

struct ParseResult {
    bool ok{false};            // false on argument errors
    Overrides overrides;
    std::string config_path{"qlab.conf"};
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};     // true if --debug was passed on CLI
};

} // namespace qlab::config
