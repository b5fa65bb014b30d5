/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qlab/config/loader.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <qlab/algorithms/deutsch_jozsa.hpp>
#include <qlab/algorithms/teleportation.hpp>
#include <qlab/config/validator.hpp>

namespace qlab::config {

namespace {

// std::stoX accepts trailing garbage; reject it.
template <typename T, typename Fn>
T parse_number(const std::string& text, Fn fn) {
    std::size_t used = 0;
    T v = fn(text, &used);
    if (used != text.size()) throw std::invalid_argument("trailing characters");
    return v;
}

bool parse_bool(const std::string& text, bool& out) {
    if (text == "true" || text == "1" || text == "yes") { out = true; return true; }
    if (text == "false" || text == "0" || text == "no") { out = false; return true; }
    return false;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

} // namespace

std::optional<std::string> set_value(RunConfig& cfg, const std::string& key, const std::string& value) {
    RunConfig next = cfg;
    try {
        auto to_int = [&](const std::string& t) {
            return parse_number<int>(t, [](const std::string& s, std::size_t* p) { return std::stoi(s, p); });
        };
        auto to_ll = [&](const std::string& t) {
            return parse_number<long long>(t, [](const std::string& s, std::size_t* p) { return std::stoll(s, p); });
        };
        if (key == "algo") next.algo = value;
        else if (key == "shots") next.shots = to_int(value);
        else if (key == "seed") {
            if (value.empty() || value[0] == '-') throw std::invalid_argument("negative");
            next.seed = parse_number<unsigned long long>(value, [](const std::string& s, std::size_t* p) {
                return std::stoull(s, p);
            });
        }
        else if (key == "probabilities") {
            if (!parse_bool(value, next.show_probabilities)) throw std::invalid_argument("not a boolean");
        }
        else if (key == "qubits") next.qubits = to_int(value);
        else if (key == "target") next.target = value;
        else if (key == "iterations") next.iterations = to_int(value);
        else if (key == "oracle") next.oracle = value;
        else if (key == "secret") next.secret = value;
        else if (key == "initial_state") next.initial_state = value;
        else if (key == "counting") next.counting = to_int(value);
        else if (key == "phase") {
            next.phase = parse_number<double>(value, [](const std::string& s, std::size_t* p) { return std::stod(s, p); });
        }
        else if (key == "a") next.a = to_ll(value);
        else if (key == "b") next.b = to_ll(value);
        else if (key == "bits") next.bits = to_int(value);
        else if (key == "state") next.state = value;
        else return fmt::format("unknown option '{}'", key);
    } catch (const std::exception&) {
        return fmt::format("invalid value '{}' for '{}'", value, key);
    }
    cfg = next;
    return std::nullopt;
}

static std::vector<std::string> load_key_value(RunConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    RunConfig next = cfg;
    std::istringstream iss(text);
    std::string line;
    int lineno = 0;
    while (std::getline(iss, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            errs.push_back(fmt::format("line {}: expected key=value", lineno));
            continue;
        }
        if (auto e = set_value(next, trim(line.substr(0, eq)), trim(line.substr(eq + 1)))) {
            errs.push_back(fmt::format("line {}: {}", lineno, *e));
        }
    }
    if (errs.empty()) cfg = next;
    return errs;
}

static std::vector<std::string> load_json(RunConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            errs.push_back("configuration root must be an object");
            return errs;
        }
        RunConfig next = cfg;
        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string& key = it.key();
            const auto& v = it.value();
            std::string text_value;
            if (key == "algo" || key == "target" || key == "oracle" || key == "secret" ||
                key == "initial_state" || key == "state") {
                if (!v.is_string()) { errs.push_back(fmt::format("'{}' must be a string", key)); continue; }
                text_value = v.get<std::string>();
            } else if (key == "phase") {
                if (!v.is_number()) { errs.push_back("'phase' must be a number"); continue; }
                next.phase = v.get<double>();
                continue;
            } else if (key == "probabilities") {
                if (!v.is_boolean()) { errs.push_back("'probabilities' must be a boolean"); continue; }
                next.show_probabilities = v.get<bool>();
                continue;
            } else if (key == "shots" || key == "seed" || key == "qubits" || key == "iterations" ||
                       key == "counting" || key == "a" || key == "b" || key == "bits") {
                if (!v.is_number_integer()) { errs.push_back(fmt::format("'{}' must be an integer", key)); continue; }
                text_value = v.dump();
            } else {
                errs.push_back(fmt::format("unknown option '{}'", key));
                continue;
            }
            if (auto e = set_value(next, key, text_value)) errs.push_back(*e);
        }
        if (errs.empty()) cfg = next;
    } catch (const nlohmann::json::exception& ex) {
        errs.push_back(fmt::format("failed to parse configuration: {}", ex.what()));
    }
    return errs;
}

std::vector<std::string> load_from_file(RunConfig& cfg, const std::string& path) {
    std::vector<std::string> errs;
    std::ifstream in(path);
    if (!in.good()) return errs; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    std::string text = buffer.str();
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    if (text[first_non_space] == '{') {
        errs = load_json(cfg, text);
    } else {
        errs = load_key_value(cfg, text);
    }
    for (auto& e : errs) e = fmt::format("{}: {}", path, e);
    return errs;
}

std::vector<std::string> apply_env_overrides(RunConfig& cfg) {
    std::vector<std::string> errs;
    auto apply = [&](const char* var, const char* key) {
        if (const char* v = std::getenv(var)) {
            if (auto e = set_value(cfg, key, v)) errs.push_back(fmt::format("{}: {}", var, *e));
        }
    };
    apply("QLAB_ALGO", "algo");
    apply("QLAB_SHOTS", "shots");
    apply("QLAB_SEED", "seed");
    return errs;
}

std::vector<std::string> apply_overrides(RunConfig& cfg, const Overrides& overrides) {
    std::vector<std::string> errs;
    for (const auto& [key, value] : overrides) {
        if (auto e = set_value(cfg, key, value)) errs.push_back(fmt::format("--{}: {}", key, *e));
    }
    return errs;
}

// Qubits the selected algorithm allocates; fixed-size circuits report 0.
static long long register_width(const RunConfig& cfg) {
    const std::string& algo = cfg.algo;
    const auto len = [](const std::string& s) { return static_cast<long long>(s.size()); };
    if (algo == "coin") return cfg.qubits;
    if (algo == "deutsch_jozsa") return cfg.qubits + 1LL;
    if (algo == "grover") return len(cfg.target);
    if (algo == "bernstein_vazirani") return len(cfg.secret) + 1;
    if (algo == "simon") return 2 * len(cfg.secret);
    if (algo == "qft") return cfg.initial_state.empty() ? cfg.qubits : len(cfg.initial_state);
    if (algo == "phase_estimation") return cfg.counting + 1LL;
    if (algo == "adder") return 2LL * cfg.bits + 2;
    return 0;
}

std::vector<std::string> validate_final(const RunConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (!is_known_algorithm(cfg.algo, e)) { errs.push_back(e); return errs; }
    if (!validate_positive(cfg.shots, "shots", e)) errs.push_back(e);

    const std::string& algo = cfg.algo;
    if (algo == "coin" || algo == "deutsch_jozsa" || (algo == "qft" && cfg.initial_state.empty())) {
        if (!validate_positive(cfg.qubits, "qubits", e)) errs.push_back(e);
    }
    if (algo == "grover") {
        if (!validate_bitstring(cfg.target, "target", e)) errs.push_back(e);
        if (cfg.iterations < 0) errs.push_back(fmt::format("iterations must be >= 0, got {}", cfg.iterations));
    }
    if (algo == "deutsch_jozsa" && !algorithms::deutsch_jozsa::is_known_oracle_name(cfg.oracle)) {
        errs.push_back(fmt::format("unknown oracle '{}'", cfg.oracle));
    }
    if ((algo == "bernstein_vazirani" || algo == "simon") && !validate_bitstring(cfg.secret, "secret", e)) {
        errs.push_back(e);
    }
    if (algo == "qft" && !cfg.initial_state.empty() && !validate_bitstring(cfg.initial_state, "initial_state", e)) {
        errs.push_back(e);
    }
    if (algo == "phase_estimation") {
        if (!validate_positive(cfg.counting, "counting", e)) errs.push_back(e);
        if (!validate_phase(cfg.phase, e)) errs.push_back(e);
    }
    if (algo == "adder") {
        if (!validate_operand(cfg.a, cfg.bits, "a", e)) errs.push_back(e);
        else if (!validate_operand(cfg.b, cfg.bits, "b", e)) errs.push_back(e);
    }
    if (algo == "teleport" && !algorithms::teleportation::is_known_state(cfg.state)) {
        errs.push_back(fmt::format("unknown state '{}' (expected zero, one, plus or minus)", cfg.state));
    }
    if (errs.empty() && !validate_register_width(register_width(cfg), algo, e)) errs.push_back(e);
    return errs;
}

} // namespace qlab::config
