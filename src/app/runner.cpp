/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qlab/app/runner.hpp>

#include <stdexcept>
#include <utility>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <qlab/algorithms/adder.hpp>
#include <qlab/algorithms/basics.hpp>
#include <qlab/algorithms/bernstein_vazirani.hpp>
#include <qlab/algorithms/bitstring.hpp>
#include <qlab/algorithms/deutsch_jozsa.hpp>
#include <qlab/algorithms/grover.hpp>
#include <qlab/algorithms/phase_estimation.hpp>
#include <qlab/algorithms/qft.hpp>
#include <qlab/algorithms/simon.hpp>
#include <qlab/algorithms/teleportation.hpp>
#include <qlab/config/loader.hpp>
#include <qlab/log.hpp>
#include <qlab/quantum/cpu_simulator.hpp>

namespace qlab::app {

namespace alg = qlab::algorithms;
using quantum::Histogram;
using quantum::QuantumCircuit;

std::optional<config::RunConfig> resolve_config(const config::ParseResult& pr, logging::Logger& log) {
    config::RunConfig cfg;
    std::vector<std::string> errs = config::load_from_file(cfg, pr.config_path);
    for (auto& e : config::apply_env_overrides(cfg)) errs.push_back(std::move(e));
    for (auto& e : config::apply_overrides(cfg, pr.overrides)) errs.push_back(std::move(e));
    if (errs.empty()) {
        errs = config::validate_final(cfg);
    }
    if (!errs.empty()) {
        for (const auto& e : errs) log.error(e);
        return std::nullopt;
    }
    return cfg;
}

QuantumCircuit build_circuit(const config::RunConfig& cfg) {
    const std::string& algo = cfg.algo;
    if (algo == "hello") return alg::basics::build_hello();
    if (algo == "coin") return alg::basics::build_coin(cfg.qubits);
    if (algo == "bell") return alg::basics::build_bell_pair();
    if (algo == "product") return alg::basics::build_product_superposition();
    if (algo == "grover") {
        std::optional<int> iterations;
        if (cfg.iterations > 0) iterations = cfg.iterations;
        return alg::grover::build(cfg.target, iterations);
    }
    if (algo == "deutsch_jozsa") {
        return alg::deutsch_jozsa::build(cfg.qubits, alg::deutsch_jozsa::oracle_from_name(cfg.oracle, cfg.qubits));
    }
    if (algo == "bernstein_vazirani") return alg::bernstein_vazirani::build(cfg.secret);
    if (algo == "simon") return alg::simon::build(cfg.secret);
    if (algo == "qft") {
        if (cfg.initial_state.empty()) return alg::qft::build_uniform_transform(cfg.qubits);
        return alg::qft::build_round_trip(cfg.initial_state);
    }
    if (algo == "phase_estimation") return alg::phase_estimation::build(cfg.counting, cfg.phase);
    if (algo == "adder") {
        return alg::adder::build(static_cast<std::uint64_t>(cfg.a), static_cast<std::uint64_t>(cfg.b), cfg.bits);
    }
    if (algo == "teleport") return alg::teleportation::build(alg::teleportation::parse_state(cfg.state));
    throw std::invalid_argument(fmt::format("unknown algo '{}'", algo));
}

static void print_histogram(const Histogram& histogram) {
    const double total = static_cast<double>(quantum::total_counts(histogram));
    for (const auto& [bits, count] : histogram) {
        qlab::log::line("  {}  {:>8}  {:.4f}", bits, count, static_cast<double>(count) / total);
    }
}

static void interpret(const config::RunConfig& cfg, const Histogram& histogram, logging::Logger& log) {
    const std::string& algo = cfg.algo;
    const auto top = quantum::most_frequent(histogram).value_or("");

    if (algo == "grover") {
        log.info(fmt::format("P({}) = {:.4f}", cfg.target, quantum::probability_of(histogram, cfg.target)));
    } else if (algo == "deutsch_jozsa") {
        auto verdict = alg::deutsch_jozsa::classify(histogram, cfg.qubits);
        log.info(fmt::format("oracle {} classified as {}", cfg.oracle, alg::deutsch_jozsa::verdict_name(verdict)));
    } else if (algo == "bernstein_vazirani") {
        auto secret = alg::bernstein_vazirani::recover_secret(histogram).value_or("");
        log.info(fmt::format("recovered secret {} ({})", secret, secret == cfg.secret ? "correct" : "incorrect"));
    } else if (algo == "simon") {
        std::vector<std::string> ys;
        int orthogonal = 0;
        for (const auto& [y, count] : histogram) {
            ys.push_back(y);
            if (alg::simon::is_orthogonal(y, cfg.secret)) ++orthogonal;
        }
        log.info(fmt::format("{}/{} distinct outcomes satisfy y.s = 0", orthogonal, ys.size()));
        auto solved = alg::simon::solve_secret(ys, static_cast<int>(cfg.secret.size()));
        if (solved) {
            log.info(fmt::format("GF(2) solution s = {}", *solved));
        } else {
            log.warn("measurements leave the secret ambiguous");
        }
    } else if (algo == "qft" && !cfg.initial_state.empty()) {
        log.info(fmt::format("round trip P({}) = {:.4f}", cfg.initial_state,
                             quantum::probability_of(histogram, cfg.initial_state)));
    } else if (algo == "phase_estimation") {
        log.info(fmt::format("estimated phase {:.6f} (true {:.6f}) from {}",
                             alg::phase_estimation::decode_phase(top), cfg.phase, top));
    } else if (algo == "adder") {
        log.info(fmt::format("{} + {} = {} (measured {})", cfg.a, cfg.b, alg::adder::decode_sum(top), top));
    } else if (algo == "teleport") {
        auto target = alg::teleportation::corrected_target_counts(
            histogram, alg::teleportation::CorrectionBit::Qubit0);
        const double total = static_cast<double>(quantum::total_counts(target));
        log.info(fmt::format("teleported qubit: 0 -> {:.4f}, 1 -> {:.4f}",
                             static_cast<double>(target["0"]) / total,
                             static_cast<double>(target["1"]) / total));
    } else {
        log.info(fmt::format("most frequent outcome {}", top));
    }
}

int run(const config::RunConfig& cfg, logging::Logger& log) {
    quantum::CPUSimulator simulator(cfg.seed, &log);
    const QuantumCircuit circuit = build_circuit(cfg);
    log.info(fmt::format("{}: {} qubits, {} operations, {} shots on {}", cfg.algo, circuit.num_qubits(),
                         circuit.size(), cfg.shots, simulator.backend_name()));

    if (cfg.show_probabilities) {
        const auto probs = simulator.probabilities(circuit);
        for (std::size_t i = 0; i < probs.size(); ++i) {
            if (probs[i] >= quantum::kProbabilityEpsilon) {
                qlab::log::line("  |{}>  {:.6f}", alg::bitstring::to_bitstring(i, circuit.num_qubits()), probs[i]);
            }
        }
    }

    const Histogram histogram = simulator.sample(circuit, cfg.shots);
    print_histogram(histogram);
    interpret(cfg, histogram, log);
    return 0;
}

} // namespace qlab::app
