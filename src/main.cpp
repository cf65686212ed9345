// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief Headless Slither driver
 *
 * Plays one round at a fixed tick rate without a display: scripted moves
 * stand in for keyboard input, and every fruit spawned or eaten is logged.
 * Ends at game over or after --ticks ticks and prints a one-line summary.
 */

#include "cli_args.h"
#include "config.h"
#include "game_config.h"
#include "logging_init.h"
#include "round_controller.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <stdexcept>

using namespace slither;

namespace {

int run_round(const CliArgs& args, const GameConfig& game_config) {
    RoundController round(game_config);

    round.spawner().set_starvation_callback([&round](int attempts) {
        spdlog::warn("[Sim] Tick {}: spawn skipped after {} attempts (snake length {})",
                     round.ticks(), attempts, round.snake_length());
    });

    round.start();

    size_t next_move = 0;
    for (uint64_t tick = 0; tick < args.max_ticks; ++tick) {
        while (next_move < args.moves.size() && args.moves[next_move].tick <= tick) {
            Direction dir = args.moves[next_move].direction;
            DirectionChange change = round.change_direction(dir);
            spdlog::debug("[Sim] Tick {}: input {} -> {}", tick, direction_name(dir),
                          change == DirectionChange::IGNORED   ? "ignored"
                          : change == DirectionChange::BOOSTED ? "boost"
                                                               : "turn");
            ++next_move;
        }

        TickResult result = round.advance(args.dt);

        if (result.spawned) {
            spdlog::info("[Sim] Tick {}: fruit spawned at ({}, {})", tick,
                         result.spawned->cell.col, result.spawned->cell.row);
        }
        for (const Fruit& fruit : result.consumed) {
            spdlog::info("[Sim] Tick {}: ate fruit at ({}, {}), length now {} (+{} pending)", tick,
                         fruit.cell.col, fruit.cell.row, round.snake_length(),
                         round.snake().pending_growth());
        }
        if (result.state == RoundState::GAME_OVER) {
            break;
        }
    }

    const Cell& head = round.head();
    printf("state=%s reason=%s ticks=%llu time=%.2fs length=%d fruit_eaten=%d head=(%d,%d)\n",
           round_state_name(round.state()), game_over_reason_name(round.game_over_reason()),
           static_cast<unsigned long long>(round.ticks()), round.elapsed(), round.snake_length(),
           round.fruit_eaten(), head.col, head.row);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_requested ? 0 : 1;
    }

    // Quiet until the config file has been read
    spdlog::set_level(logging::verbosity_to_level(args.verbosity));

    try {
        Config* config = Config::get_instance();
        config->init(args.config_path);
        logging::init(logging::make_log_config(*config, args.verbosity, args.log_dest,
                                               args.log_file, args.test_mode));

        GameConfig game_config = GameConfig::from_config(*config);
        if (args.seed) {
            game_config.seed = *args.seed;
        }

        return run_round(args, game_config);
    } catch (const ConfigError& e) {
        spdlog::error("[Sim] Invalid configuration: {}", e.what());
        return 1;
    } catch (const json::exception& e) {
        spdlog::error("[Sim] Malformed configuration in {}: {}", args.config_path, e.what());
        return 1;
    } catch (const spdlog::spdlog_ex& e) {
        // The previous logger is still installed
        spdlog::error("[Sim] Cannot set up logging: {}", e.what());
        return 1;
    } catch (const std::logic_error& e) {
        spdlog::critical("[Sim] Simulation invariant violated: {}", e.what());
        spdlog::dump_backtrace();
        return 2;
    }
}
