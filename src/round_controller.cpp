// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "round_controller.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace slither {

const char* round_state_name(RoundState state) {
    switch (state) {
    case RoundState::IDLE:
        return "idle";
    case RoundState::RUNNING:
        return "running";
    case RoundState::GAME_OVER:
        return "game_over";
    }
    return "unknown";
}

const char* game_over_reason_name(GameOverReason reason) {
    switch (reason) {
    case GameOverReason::NONE:
        return "none";
    case GameOverReason::WALL:
        return "wall";
    case GameOverReason::SELF:
        return "self";
    }
    return "unknown";
}

RoundController::RoundController(const GameConfig& config)
    : config_(config), grid_(config.grid()),
      snake_(grid_, config.initial_length, config.speed),
      spawner_(grid_, config.spawn_interval, config.spawn_max_attempts, config.resolved_seed()) {
    spdlog::debug("[RoundController] Created: {}x{} grid, {} px cells", grid_.columns(),
                  grid_.rows(), grid_.cell_size());
}

bool RoundController::start() {
    if (state_ != RoundState::IDLE) {
        spdlog::debug("[RoundController] start() ignored in state {}", round_state_name(state_));
        return false;
    }
    set_state(RoundState::RUNNING);
    return true;
}

void RoundController::reset() {
    snake_.reset();
    spawner_.reset();
    game_over_reason_ = GameOverReason::NONE;
    fruit_eaten_ = 0;
    ticks_ = 0;
    elapsed_ = 0.0;
    set_state(RoundState::RUNNING);
}

DirectionChange RoundController::change_direction(Direction dir) {
    if (state_ != RoundState::RUNNING) {
        return DirectionChange::IGNORED;
    }
    return snake_.change_direction(dir);
}

TickResult RoundController::advance(double elapsed_seconds) {
    TickResult result;
    if (state_ != RoundState::RUNNING) {
        result.state = state_;
        result.game_over_reason = game_over_reason_;
        return result;
    }

    ++ticks_;
    if (std::isfinite(elapsed_seconds) && elapsed_seconds > 0.0) {
        elapsed_ += elapsed_seconds;
    }

    result.steps = snake_.update(elapsed_seconds);
    result.spawned = spawner_.update(elapsed_seconds, snake_.segments());

    if (snake_.check_boundary_collision()) {
        game_over_reason_ = GameOverReason::WALL;
    } else if (snake_.check_self_collision()) {
        game_over_reason_ = GameOverReason::SELF;
    }

    if (game_over_reason_ != GameOverReason::NONE) {
        spdlog::info("[RoundController] Game over ({}) at head=({}, {}), length={}, fruit={}",
                     game_over_reason_name(game_over_reason_), snake_.head().col,
                     snake_.head().row, snake_.length(), fruit_eaten_);
        set_state(RoundState::GAME_OVER);
    } else {
        result.consumed = consume_fruit();
    }

    result.state = state_;
    result.game_over_reason = game_over_reason_;
    return result;
}

std::vector<Fruit> RoundController::consume_fruit() {
    std::vector<Fruit> eaten;
    Rect head_rect = grid_.cell_rect(snake_.head());

    // Collect first: remove() mutates the list being scanned
    for (const Fruit& fruit : spawner_.fruits()) {
        Rect fruit_rect{grid_.to_pixel_x(fruit.cell), grid_.to_pixel_y(fruit.cell), fruit.size,
                        fruit.size};
        if (head_rect.intersects(fruit_rect)) {
            eaten.push_back(fruit);
        }
    }

    for (const Fruit& fruit : eaten) {
        spawner_.remove(fruit);
        snake_.grow();
        ++fruit_eaten_;
        spdlog::debug("[RoundController] Ate fruit at ({}, {}), total={}", fruit.cell.col,
                      fruit.cell.row, fruit_eaten_);
    }
    return eaten;
}

void RoundController::set_state(RoundState next) {
    RoundState prev = state_;
    state_ = next;
    if (prev != next) {
        spdlog::info("[RoundController] {} -> {}", round_state_name(prev), round_state_name(next));
    }
    if (on_state_changed_) {
        on_state_changed_(prev, next);
    }
}

} // namespace slither
