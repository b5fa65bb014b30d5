/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <qlab/logging/logger.hpp>

#include <atomic>

namespace qlab::logging {

class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false) : enable_debug_(enable_debug) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    bool debug_enabled() const override { return enable_debug_.load(); }
    void set_debug(bool v) { enable_debug_.store(v); }

private:
    std::atomic<bool> enable_debug_{false};
};

} // namespace qlab::logging
