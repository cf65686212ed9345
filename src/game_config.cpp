// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "game_config.h"

#include "config.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <random>

namespace slither {

namespace {

// Whole-number field: 20.5 or "20" is a config error, never truncated
int64_t read_whole(const nlohmann::json& game, const char* key, int64_t fallback, int64_t min,
                   int64_t max) {
    auto it = game.find(key);
    if (it == game.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(fmt::format("{} must be a whole number (got {})", key, it->dump()));
    }
    if (it->is_number_unsigned() && it->get<uint64_t>() > static_cast<uint64_t>(max)) {
        throw ConfigError(fmt::format("{} is out of range (got {})", key, it->dump()));
    }
    int64_t value = it->get<int64_t>();
    if (value < min || value > max) {
        throw ConfigError(fmt::format("{} is out of range (got {})", key, it->dump()));
    }
    return value;
}

int read_int(const nlohmann::json& game, const char* key, int fallback) {
    return static_cast<int>(read_whole(game, key, fallback, std::numeric_limits<int>::min(),
                                       std::numeric_limits<int>::max()));
}

} // namespace

void GameConfig::validate() const {
    // Each component checks its own invariants on construction
    GridSpace g = grid();
    SnakeBody snake(g, initial_length, speed);
    FruitSpawner spawner(g, spawn_interval, spawn_max_attempts);
    (void)snake;
    (void)spawner;
}

GridSpace GameConfig::grid() const {
    return GridSpace(play_width, play_height, cell_size);
}

uint32_t GameConfig::resolved_seed() const {
    if (seed != 0) {
        return seed;
    }
    std::random_device rd;
    return rd();
}

nlohmann::json GameConfig::to_json() const {
    return {{"play_width", play_width},
            {"play_height", play_height},
            {"cell_size", cell_size},
            {"initial_length", initial_length},
            {"speed", speed},
            {"spawn_interval", spawn_interval},
            {"spawn_max_attempts", spawn_max_attempts},
            {"seed", seed}};
}

GameConfig GameConfig::from_json(const nlohmann::json& game) {
    GameConfig cfg;
    if (!game.is_object()) {
        if (!game.is_null()) {
            throw ConfigError("\"game\" config section must be an object");
        }
        return cfg;
    }

    cfg.play_width = read_int(game, "play_width", cfg.play_width);
    cfg.play_height = read_int(game, "play_height", cfg.play_height);
    cfg.cell_size = read_int(game, "cell_size", cfg.cell_size);
    cfg.initial_length = read_int(game, "initial_length", cfg.initial_length);
    cfg.speed = game.value("speed", cfg.speed);
    cfg.spawn_interval = game.value("spawn_interval", cfg.spawn_interval);
    cfg.spawn_max_attempts = read_int(game, "spawn_max_attempts", cfg.spawn_max_attempts);
    cfg.seed = static_cast<uint32_t>(
        read_whole(game, "seed", cfg.seed, 0, std::numeric_limits<uint32_t>::max()));

    cfg.validate();

    spdlog::debug("[GameConfig] field={}x{} cell={} length={} speed={} interval={}s attempts={} "
                  "seed={}",
                  cfg.play_width, cfg.play_height, cfg.cell_size, cfg.initial_length, cfg.speed,
                  cfg.spawn_interval, cfg.spawn_max_attempts, cfg.seed);
    return cfg;
}

GameConfig GameConfig::from_config(const Config& config) {
    return from_json(config.get<nlohmann::json>("/game", nlohmann::json()));
}

} // namespace slither
