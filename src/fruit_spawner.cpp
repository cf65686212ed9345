// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "fruit_spawner.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace slither {

FruitSpawner::FruitSpawner(const GridSpace& grid, double interval_seconds, int max_attempts,
                           uint32_t seed)
    : grid_(grid), interval_(interval_seconds), max_attempts_(max_attempts),
      countdown_(interval_seconds), rng_(seed) {
    if (!(interval_ > 0.0)) {
        throw ConfigError(fmt::format("spawn interval must be positive (got {})", interval_));
    }
    if (max_attempts_ < 1) {
        throw ConfigError(
            fmt::format("spawn retry limit must be at least 1 (got {})", max_attempts_));
    }
}

std::optional<Fruit> FruitSpawner::update(double elapsed_seconds,
                                          const std::deque<Cell>& snake_cells) {
    if (!std::isfinite(elapsed_seconds) || elapsed_seconds <= 0.0) {
        return std::nullopt;
    }

    countdown_ -= elapsed_seconds;
    if (countdown_ > 0.0) {
        return std::nullopt;
    }

    auto fruit = try_spawn(snake_cells);
    countdown_ = interval_;
    return fruit;
}

std::optional<Fruit> FruitSpawner::try_spawn(const std::deque<Cell>& snake_cells) {
    for (int attempt = 0; attempt < max_attempts_; ++attempt) {
        Cell candidate = picker_ ? picker_(grid_) : pick_random_cell();

        bool on_snake = std::find(snake_cells.begin(), snake_cells.end(), candidate) !=
                        snake_cells.end();
        if (on_snake) {
            continue;
        }

        Fruit fruit{candidate, grid_.cell_size()};
        fruits_.push_back(fruit);
        spdlog::debug("[FruitSpawner] Spawned fruit at ({}, {}) after {} attempt(s), live={}",
                      candidate.col, candidate.row, attempt + 1, fruits_.size());
        return fruit;
    }

    spdlog::warn("[FruitSpawner] No free cell found in {} attempts, skipping spawn",
                 max_attempts_);
    if (on_starved_) {
        on_starved_(max_attempts_);
    }
    return std::nullopt;
}

Cell FruitSpawner::pick_random_cell() {
    std::uniform_int_distribution<int> col_dist(0, grid_.columns() - 1);
    std::uniform_int_distribution<int> row_dist(0, grid_.rows() - 1);
    int col = col_dist(rng_);
    int row = row_dist(rng_);
    return {col, row};
}

bool FruitSpawner::remove(const Fruit& fruit) {
    auto it = std::find(fruits_.begin(), fruits_.end(), fruit);
    if (it == fruits_.end()) {
        return false;
    }
    fruits_.erase(it);
    return true;
}

void FruitSpawner::clear() {
    fruits_.clear();
}

void FruitSpawner::reset() {
    fruits_.clear();
    countdown_ = interval_;
}

void FruitSpawner::set_cell_picker(CellPicker picker) {
    picker_ = std::move(picker);
}

} // namespace slither
