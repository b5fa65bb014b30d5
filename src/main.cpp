/*
 * qlab driver
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <exception>

#include <fmt/core.h>

#include <qlab/app/runner.hpp>
#include <qlab/cli/args.hpp>
#include <qlab/logging/fmt_logger.hpp>

int main(int argc, char** argv) {
    qlab::logging::FmtLogger log;
    auto parsed = qlab::cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return 0;
    }
    if (!parsed.ok) {
        return 1;
    }
    log.set_debug(parsed.debug);

    auto cfg = qlab::app::resolve_config(parsed, log);
    if (!cfg) {
        return 1;
    }
    try {
        return qlab::app::run(*cfg, log);
    } catch (const std::exception& e) {
        log.error(fmt::format("{} failed: {}", cfg->algo, e.what()));
        return 1;
    }
}
