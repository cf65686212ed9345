// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the headless simulator
 */

#include "grid_space.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace slither {

/// A direction request applied just before the given tick
struct ScriptedMove {
    uint64_t tick = 0;
    Direction direction = Direction::DOWN;
};

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path = "slither.json";

    // Simulation
    uint64_t max_ticks = 6000;
    double dt = 1.0 / 60.0;
    std::optional<uint32_t> seed; // --seed overrides the config file
    std::vector<ScriptedMove> moves;
    bool test_mode = false; // --test: seed 1 unless given, debug logging by default

    // Logging
    int verbosity = 0;
    std::string log_dest; // empty = use config file
    std::string log_file;

    bool help_requested = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was shown or error occurred
 *         (args.help_requested distinguishes the two)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Parse a move script like "120:left,300:up"
 *
 * Moves are returned sorted by tick; several moves may share a tick and keep
 * their relative order.
 *
 * @return Parsed moves, or std::nullopt on a malformed entry
 */
std::optional<std::vector<ScriptedMove>> parse_moves(const std::string& script);

} // namespace slither
