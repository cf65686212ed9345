// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file game_config.h
 * @brief Tunable parameters of a round, with defaults and validation
 *
 * Values are read from the "/game" section of the JSON config. Anything
 * missing keeps its default; anything present but invalid is rejected with
 * ConfigError rather than clamped.
 */

#pragma once

#include "fruit_spawner.h"
#include "grid_space.h"
#include "snake_body.h"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace slither {

class Config;

struct GameConfig {
    int play_width = DEFAULT_PLAY_WIDTH;
    int play_height = DEFAULT_PLAY_HEIGHT;
    int cell_size = DEFAULT_CELL_SIZE;
    int initial_length = DEFAULT_SNAKE_LENGTH;
    double speed = DEFAULT_SNAKE_SPEED;               ///< pixels per second
    double spawn_interval = DEFAULT_SPAWN_INTERVAL;   ///< seconds
    int spawn_max_attempts = DEFAULT_SPAWN_MAX_ATTEMPTS;
    uint32_t seed = 0;                                ///< 0 = seed from std::random_device

    /// @throws ConfigError describing the first invalid value
    void validate() const;

    /// @throws ConfigError if the play field is invalid
    [[nodiscard]] GridSpace grid() const;

    /// Seed to use for fruit placement (resolves 0 to a random seed)
    [[nodiscard]] uint32_t resolved_seed() const;

    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Build from a "/game"-style JSON object
     *
     * Integer fields must hold whole numbers in range; speed and
     * spawn_interval accept any JSON number.
     *
     * @throws nlohmann::json::type_error on a non-numeric speed or interval
     * @throws ConfigError on a fractional or out-of-range integer field, or
     *         if the result fails validate()
     */
    static GameConfig from_json(const nlohmann::json& game);

    /// Build from the "/game" section of a loaded Config
    static GameConfig from_config(const Config& config);
};

} // namespace slither
