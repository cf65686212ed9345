// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include "config.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace slither {
namespace logging {

namespace {

constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_ROTATIONS = 3;
constexpr size_t BACKTRACE_MESSAGES = 32;

std::string data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp";
}

LogTarget detect_best_target() {
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
    case LogTarget::Syslog:
#ifdef __linux__
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>("slither", LOG_PID, LOG_USER, false));
#endif
        break;
    case LogTarget::File: {
        std::string path = file_path.empty() ? default_log_file_path() : file_path;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, LOG_FILE_MAX_BYTES, LOG_FILE_ROTATIONS));
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    // Throws before the default logger is touched
    add_system_sink(sinks, effective_target, config.file_path);

    auto logger = std::make_shared<spdlog::logger>("slither", sinks.begin(), sinks.end());
    logger->set_level(config.level);

    spdlog::set_default_logger(logger);

    // Recent messages are dumped on a fatal simulation error
    spdlog::enable_backtrace(BACKTRACE_MESSAGES);

    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

LogConfig make_log_config(const Config& config, int cli_verbosity, const std::string& cli_dest,
                          const std::string& cli_file, bool test_mode) {
    LogConfig log_config;
    log_config.level = resolve_log_level(
        cli_verbosity, config.get<std::string>("/log_level", std::string()), test_mode);

    std::string dest =
        cli_dest.empty() ? config.get<std::string>("/log_dest", std::string("console")) : cli_dest;
    log_config.target = parse_log_target(dest);

    log_config.file_path =
        cli_file.empty() ? config.get<std::string>("/log_file", std::string()) : cli_file;
    return log_config;
}

std::string default_log_file_path() {
    std::filesystem::path dir = std::filesystem::path(data_home()) / "slither";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return (dir / "slither.log").string();
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str.empty()) {
        return default_level;
    }
    // spdlog maps unknown names to off; only accept a name it round-trips
    spdlog::level::level_enum level = spdlog::level::from_str(str);
    if (level == spdlog::level::off && str != "off") {
        return default_level;
    }
    return level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity >= 3)
        return spdlog::level::trace;
    if (verbosity == 2)
        return spdlog::level::debug;
    if (verbosity == 1)
        return spdlog::level::info;
    return spdlog::level::warn;
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level,
                                            bool test_mode) {
    spdlog::level::level_enum mode_default = test_mode ? spdlog::level::debug : spdlog::level::warn;
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    return parse_level(config_level, mode_default);
}

} // namespace logging
} // namespace slither
