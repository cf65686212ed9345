// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file snake_body.h
 * @brief Grid snake with time-accumulated movement
 *
 * Movement is continuous in time but discrete in space: elapsed time is
 * converted to distance (speed * dt) and added to an accumulator, and the
 * snake advances one whole cell each time the accumulator reaches cell_size.
 * Segments are therefore always grid-aligned when observed from outside.
 *
 * Repeating the current direction triggers a "boost": an immediate one-cell
 * move that bypasses the accumulator entirely. Mashing the same key moves
 * the snake as fast as input arrives, independent of frame timing.
 *
 * @threading Single simulation thread
 */

#pragma once

#include "grid_space.h"

#include <deque>

namespace slither {

static constexpr int DEFAULT_SNAKE_LENGTH = 3;
static constexpr double DEFAULT_SNAKE_SPEED = 20.0; // pixels per second

/// Result of a change_direction() request
enum class DirectionChange {
    IGNORED, ///< Exact reversal, request dropped
    BOOSTED, ///< Same direction, moved one cell immediately
    TURNED   ///< New direction adopted for subsequent steps
};

class SnakeBody {
  public:
    /**
     * @brief Create a snake in its initial layout
     *
     * Head at the horizontal centre, initial_length cells from the top edge,
     * body extending upward, facing down.
     *
     * @throws ConfigError if initial_length < 1, the snake does not fit the
     *         field, or speed is not positive
     */
    explicit SnakeBody(const GridSpace& grid, int initial_length = DEFAULT_SNAKE_LENGTH,
                       double speed = DEFAULT_SNAKE_SPEED);

    /**
     * @brief Advance by elapsed wall time
     *
     * No-op for elapsed_seconds <= 0, NaN or infinite. May step several cells
     * in one call when the elapsed time covers more than one cell (catch-up);
     * catch-up ends once the head leaves the grid.
     *
     * @return Number of cells stepped
     */
    int update(double elapsed_seconds);

    /**
     * @brief Request a new heading
     *
     * Reversal is ignored. Same direction performs one immediate move without
     * touching the accumulator or pending growth. Anything else takes effect
     * on the next step.
     */
    DirectionChange change_direction(Direction new_direction);

    /// Queue one segment of growth for a future step
    void grow();

    [[nodiscard]] bool check_boundary_collision() const;
    [[nodiscard]] bool check_self_collision() const;

    /// Restore initial layout, direction, speed, accumulator and pending growth
    void reset();

    /// Segments head-first
    [[nodiscard]] const std::deque<Cell>& segments() const {
        return segments_;
    }
    [[nodiscard]] const Cell& head() const;
    [[nodiscard]] const Cell& tail() const;
    [[nodiscard]] int length() const {
        return static_cast<int>(segments_.size());
    }
    [[nodiscard]] bool occupies(const Cell& cell) const;

    [[nodiscard]] Direction direction() const {
        return direction_;
    }
    [[nodiscard]] double speed() const {
        return speed_;
    }
    [[nodiscard]] double move_accumulator() const {
        return move_accumulator_;
    }
    [[nodiscard]] int pending_growth() const {
        return pending_growth_;
    }
    [[nodiscard]] const GridSpace& grid() const {
        return grid_;
    }

  private:
    /// Insert a new head one cell ahead; keep the tail if growth is pending
    void step(bool consume_growth);

    void require_non_empty() const;

    GridSpace grid_;
    int initial_length_;
    double initial_speed_;

    std::deque<Cell> segments_;
    Direction direction_ = Direction::DOWN;
    double speed_;
    double move_accumulator_ = 0.0;
    int pending_growth_ = 0;
};

} // namespace slither
