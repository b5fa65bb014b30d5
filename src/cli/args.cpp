/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qlab/cli/args.hpp>

#include <string>

#include <cxxopts.hpp>
#include <fmt/core.h>

#ifndef QLAB_VERSION
#define QLAB_VERSION "0.0.0"
#endif

namespace qlab::cli {

namespace {

// Options forwarded verbatim to config::set_value when given explicitly.
const char* const kValueOptions[] = {
    "algo", "shots", "seed", "qubits", "target", "iterations", "oracle", "secret",
    "initial_state", "counting", "phase", "a", "b", "bits", "state"};

} // namespace

qlab::config::ParseResult parse(int argc, char** argv, qlab::logging::Logger& log) {
    qlab::config::ParseResult pr;
    cxxopts::Options options("qlab", "Statevector quantum algorithm lab");
    // clang-format off
    options.add_options()
        ("algo",   "Algorithm: hello, coin, bell, product, grover, deutsch_jozsa, bernstein_vazirani, "
                   "simon, qft, phase_estimation, adder, teleport", cxxopts::value<std::string>())
        ("shots",  "Number of shots (>=1)", cxxopts::value<std::string>())
        ("seed",   "Sampler seed (random when omitted)", cxxopts::value<std::string>())
        ("p,probabilities", "Also print exact basis-state probabilities")
        ("config", "Path to config file (qlab.conf)", cxxopts::value<std::string>()->default_value("qlab.conf"))
        ("d,debug","Enable debug logging")
        ("v,version", "Show version and exit")
        ("h,help",    "Show help and exit");
    options.add_options("algorithm")
        ("qubits",        "Qubits for coin, deutsch_jozsa and uniform qft", cxxopts::value<std::string>())
        ("target",        "Grover target bitstring", cxxopts::value<std::string>())
        ("iterations",    "Grover iterations (0 = optimal)", cxxopts::value<std::string>())
        ("oracle",        "constant_zero, constant_one, balanced_first, balanced_parity", cxxopts::value<std::string>())
        ("secret",        "Secret bitstring for bernstein_vazirani and simon", cxxopts::value<std::string>())
        ("initial_state", "QFT round-trip input (empty = uniform transform)", cxxopts::value<std::string>())
        ("counting",      "Phase estimation counting qubits", cxxopts::value<std::string>())
        ("phase",         "Phase in [0, 1]", cxxopts::value<std::string>())
        ("a",             "First adder operand", cxxopts::value<std::string>())
        ("b",             "Second adder operand", cxxopts::value<std::string>())
        ("bits",          "Adder operand width", cxxopts::value<std::string>())
        ("state",         "Teleported state: zero, one, plus, minus", cxxopts::value<std::string>());
    // clang-format on
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help({"", "algorithm"}));
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("qlab v{}", QLAB_VERSION));
            pr.show_only = true;
            return pr;
        }
        for (const char* name : kValueOptions) {
            if (result.count(name)) {
                pr.overrides.emplace_back(name, result[name].as<std::string>());
            }
        }
        if (result.count("probabilities")) {
            pr.overrides.emplace_back("probabilities", "true");
        }
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.ok = true;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help({"", "algorithm"})));
        return pr;
    }
    return pr;
}

} // namespace qlab::cli
