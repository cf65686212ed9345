// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief spdlog setup for the simulator
 *
 * Builds the default logger from a console sink plus one optional system
 * sink (syslog or a rotating file), and resolves the effective level from
 * CLI verbosity, the config file, and the run mode.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace slither {

class Config;

namespace logging {

/// Where log output goes in addition to the console
enum class LogTarget {
    Auto,   ///< Syslog on Linux, console only elsewhere
    Syslog, ///< syslog(3)
    File,   ///< Rotating file
    Console ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Console;
    bool enable_console = true;
    std::string file_path; ///< Only used for LogTarget::File; empty = default location
};

/**
 * @brief Install the default "slither" logger
 *
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void init(const LogConfig& config);

/**
 * @brief Combine command-line logging options with the config document
 *
 * Reads "/log_level", "/log_dest" and "/log_file". A non-empty cli_dest or
 * cli_file replaces the config value; the level follows resolve_log_level().
 */
LogConfig make_log_config(const Config& config, int cli_verbosity, const std::string& cli_dest,
                          const std::string& cli_file, bool test_mode);

/// $XDG_DATA_HOME/slither/slither.log (~/.local/share, then /tmp); creates the directory
std::string default_log_file_path();

/// "auto", "syslog", "file", "console"; anything else is Auto (case sensitive)
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Parse a level name ("trace" ... "off", "warning" as alias)
 * @return Parsed level, or default_level for empty/unknown input
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// 0 = warn, 1 = info, 2 = debug, 3+ = trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Resolve the effective level
 *
 * Precedence: CLI verbosity > config file level > test_mode default (debug)
 * > production default (warn).
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level,
                                            bool test_mode);

} // namespace logging
} // namespace slither
