// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file round_controller.h
 * @brief Per-tick driver for one round of Snake
 *
 * Owns the SnakeBody and FruitSpawner and is the only place that
 * cross-references them. The presentation layer calls advance() once per
 * frame with the measured frame time, forwards direction input, and reads the
 * snapshot accessors to draw.
 *
 * ## State machine:
 * - IDLE -> RUNNING on start()
 * - RUNNING -> GAME_OVER when the head leaves the field or hits the body
 * - any -> RUNNING on reset() (fresh snake, no fruit, full spawn countdown)
 *
 * ## Tick order:
 * snake update, spawner update, boundary check, self check, fruit check.
 * A wall or self collision ends the round before any fruit is eaten.
 *
 * A boost (repeating the current direction) moves the snake immediately but
 * runs no collision checks; the next advance() sees the result.
 *
 * @threading Single simulation thread
 */

#pragma once

#include "fruit_spawner.h"
#include "game_config.h"
#include "snake_body.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace slither {

enum class RoundState { IDLE, RUNNING, GAME_OVER };

enum class GameOverReason { NONE, WALL, SELF };

[[nodiscard]] const char* round_state_name(RoundState state);
[[nodiscard]] const char* game_over_reason_name(GameOverReason reason);

/// Outcome of a single advance() call
struct TickResult {
    RoundState state = RoundState::IDLE;
    GameOverReason game_over_reason = GameOverReason::NONE;
    std::vector<Fruit> consumed;  ///< Fruit eaten this tick (one growth each)
    std::optional<Fruit> spawned; ///< Fruit placed this tick
    int steps = 0;                ///< Cells the snake moved this tick
};

class RoundController {
  public:
    /// Called with (old, new) whenever the state is set, including a reset() while RUNNING
    using StateCallback = std::function<void(RoundState, RoundState)>;

    /**
     * @brief Create a round in the IDLE state
     * @throws ConfigError if config fails validation
     */
    explicit RoundController(const GameConfig& config = GameConfig{});

    /// IDLE -> RUNNING. Returns false (and does nothing) in any other state.
    bool start();

    /// Restore snake and spawner to their initial states and enter RUNNING
    void reset();

    /**
     * @brief Forward a direction request to the snake
     *
     * Ignored (returns IGNORED) unless the round is RUNNING.
     */
    DirectionChange change_direction(Direction dir);

    /**
     * @brief Advance the simulation by one frame
     *
     * Only RUNNING rounds change; other states just report themselves. A
     * non-positive or non-finite frame counts a tick and nothing else.
     */
    TickResult advance(double elapsed_seconds);

    // Snapshot accessors
    [[nodiscard]] RoundState state() const {
        return state_;
    }
    [[nodiscard]] GameOverReason game_over_reason() const {
        return game_over_reason_;
    }
    [[nodiscard]] bool is_game_over() const {
        return state_ == RoundState::GAME_OVER;
    }
    [[nodiscard]] const SnakeBody& snake() const {
        return snake_;
    }
    [[nodiscard]] const std::deque<Cell>& segments() const {
        return snake_.segments();
    }
    [[nodiscard]] const Cell& head() const {
        return snake_.head();
    }
    [[nodiscard]] int snake_length() const {
        return snake_.length();
    }
    [[nodiscard]] const std::vector<Fruit>& fruits() const {
        return spawner_.fruits();
    }
    [[nodiscard]] const GridSpace& grid() const {
        return grid_;
    }
    [[nodiscard]] const GameConfig& config() const {
        return config_;
    }

    // Round counters (reset with the round)
    [[nodiscard]] int fruit_eaten() const {
        return fruit_eaten_;
    }
    [[nodiscard]] uint64_t ticks() const {
        return ticks_;
    }
    [[nodiscard]] double elapsed() const {
        return elapsed_;
    }

    /// Spawner access for hooks (starvation callback, deterministic picker)
    FruitSpawner& spawner() {
        return spawner_;
    }

    void set_state_callback(StateCallback cb) {
        on_state_changed_ = std::move(cb);
    }

  private:
    void set_state(RoundState next);

    /// Remove every fruit under the head, growing once per fruit
    std::vector<Fruit> consume_fruit();

    GameConfig config_;
    GridSpace grid_;
    SnakeBody snake_;
    FruitSpawner spawner_;

    RoundState state_ = RoundState::IDLE;
    GameOverReason game_over_reason_ = GameOverReason::NONE;

    int fruit_eaten_ = 0;
    uint64_t ticks_ = 0;
    double elapsed_ = 0.0;

    StateCallback on_state_changed_;
};

} // namespace slither
