// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file fruit_spawner.h
 * @brief Countdown-driven fruit placement that avoids the snake
 *
 * Every `interval` seconds one spawn cycle runs: up to `max_attempts` random
 * grid cells are drawn and the first one not covered by the snake becomes a
 * fruit. A cycle that runs out of attempts is skipped (logged, and reported
 * through the starvation callback if one is set). The countdown restarts
 * after every cycle whatever its outcome.
 *
 * Fruit are only checked against the snake, not against each other, so two
 * fruit may share a cell.
 *
 * @threading Single simulation thread
 */

#pragma once

#include "grid_space.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <random>
#include <utility>
#include <vector>

namespace slither {

static constexpr double DEFAULT_SPAWN_INTERVAL = 5.0; // seconds
static constexpr int DEFAULT_SPAWN_MAX_ATTEMPTS = 100;

/// A placed fruit. Immutable; identity is its cell.
struct Fruit {
    Cell cell;
    int size = DEFAULT_CELL_SIZE;

    bool operator==(const Fruit& o) const {
        return cell == o.cell && size == o.size;
    }
};

class FruitSpawner {
  public:
    /// Draws a candidate cell; defaults to a uniform pick over the whole grid
    using CellPicker = std::function<Cell(const GridSpace&)>;

    /// Invoked when a spawn cycle gives up; argument is the number of attempts made
    using StarvationCallback = std::function<void(int attempts)>;

    /**
     * @param seed Seed for the default random source
     * @throws ConfigError if interval_seconds <= 0 or max_attempts < 1
     */
    FruitSpawner(const GridSpace& grid, double interval_seconds = DEFAULT_SPAWN_INTERVAL,
                 int max_attempts = DEFAULT_SPAWN_MAX_ATTEMPTS, uint32_t seed = 0);

    /**
     * @brief Count down and run a spawn cycle when the countdown expires
     *
     * @param elapsed_seconds Time since the previous update; <= 0 or non-finite is a no-op
     * @param snake_cells Cells currently covered by the snake
     * @return The fruit placed by this call, if any
     */
    std::optional<Fruit> update(double elapsed_seconds, const std::deque<Cell>& snake_cells);

    /// Remove a fruit by value. Returns false if it was not live.
    bool remove(const Fruit& fruit);

    /// Drop all fruit; countdown is left alone
    void clear();

    /// Drop all fruit and restart the countdown at the full interval
    void reset();

    [[nodiscard]] const std::vector<Fruit>& fruits() const {
        return fruits_;
    }
    [[nodiscard]] double countdown() const {
        return countdown_;
    }
    [[nodiscard]] double interval() const {
        return interval_;
    }
    [[nodiscard]] int max_attempts() const {
        return max_attempts_;
    }

    /// Replace the random source (tests)
    void set_cell_picker(CellPicker picker);

    void set_starvation_callback(StarvationCallback cb) {
        on_starved_ = std::move(cb);
    }

  private:
    /// One spawn cycle; appends and returns the fruit on success
    std::optional<Fruit> try_spawn(const std::deque<Cell>& snake_cells);

    Cell pick_random_cell();

    GridSpace grid_;
    double interval_;
    int max_attempts_;
    double countdown_;

    std::vector<Fruit> fruits_;

    std::mt19937 rng_;
    CellPicker picker_;
    StarvationCallback on_starved_;
};

} // namespace slither
