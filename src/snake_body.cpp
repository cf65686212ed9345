// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "snake_body.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace slither {

SnakeBody::SnakeBody(const GridSpace& grid, int initial_length, double speed)
    : grid_(grid), initial_length_(initial_length), initial_speed_(speed), speed_(speed) {
    if (initial_length_ < 1) {
        throw ConfigError(fmt::format("initial snake length must be >= 1 (got {})",
                                      initial_length_));
    }
    // Head sits initial_length cells below the top edge, so one extra row is needed
    if (initial_length_ + 1 > grid_.rows()) {
        throw ConfigError(fmt::format("snake of length {} does not fit {} rows", initial_length_,
                                      grid_.rows()));
    }
    if (!(speed_ > 0.0)) {
        throw ConfigError(fmt::format("snake speed must be positive (got {})", speed_));
    }
    reset();
}

void SnakeBody::reset() {
    direction_ = Direction::DOWN;
    speed_ = initial_speed_;
    move_accumulator_ = 0.0;
    pending_growth_ = 0;

    // Centre column rounds down when width / 2 is not on the grid
    int head_col = (grid_.width() / 2) / grid_.cell_size();
    int head_row = initial_length_;

    segments_.clear();
    for (int i = 0; i < initial_length_; ++i) {
        segments_.push_back({head_col, head_row - i});
    }

    spdlog::debug("[SnakeBody] Reset: head=({}, {}) length={} dir={}", head_col, head_row,
                  initial_length_, direction_name(direction_));
}

int SnakeBody::update(double elapsed_seconds) {
    if (!std::isfinite(elapsed_seconds) || elapsed_seconds <= 0.0) {
        return 0;
    }
    require_non_empty();

    const double cell = static_cast<double>(grid_.cell_size());
    move_accumulator_ += speed_ * elapsed_seconds;

    int steps = 0;
    while (move_accumulator_ >= cell) {
        step(true);
        move_accumulator_ -= cell;
        ++steps;

        // Off the field the round is over; drop the rest of the catch-up
        if (!grid_.contains(segments_.front())) {
            move_accumulator_ = std::fmod(move_accumulator_, cell);
            break;
        }
    }

    if (steps > 0) {
        spdlog::trace("[SnakeBody] Stepped {} cell(s): head=({}, {}) length={} acc={:.3f}", steps,
                      head().col, head().row, length(), move_accumulator_);
    }
    return steps;
}

DirectionChange SnakeBody::change_direction(Direction new_direction) {
    if (is_opposite(direction_, new_direction)) {
        spdlog::trace("[SnakeBody] Ignoring reversal {} -> {}", direction_name(direction_),
                      direction_name(new_direction));
        return DirectionChange::IGNORED;
    }

    if (new_direction == direction_) {
        require_non_empty();
        step(false);
        spdlog::trace("[SnakeBody] Boost {}: head=({}, {})", direction_name(direction_),
                      head().col, head().row);
        return DirectionChange::BOOSTED;
    }

    spdlog::trace("[SnakeBody] Turn {} -> {}", direction_name(direction_),
                  direction_name(new_direction));
    direction_ = new_direction;
    return DirectionChange::TURNED;
}

void SnakeBody::grow() {
    ++pending_growth_;
    spdlog::trace("[SnakeBody] Growth queued, pending={}", pending_growth_);
}

void SnakeBody::step(bool consume_growth) {
    DirectionVector v = direction_vector(direction_);
    Cell current = segments_.front();
    segments_.push_front({current.col + v.dx, current.row + v.dy});

    if (consume_growth && pending_growth_ > 0) {
        --pending_growth_;
    } else {
        segments_.pop_back();
    }
}

bool SnakeBody::check_boundary_collision() const {
    return !grid_.contains(head());
}

bool SnakeBody::check_self_collision() const {
    require_non_empty();
    Rect head_rect = grid_.cell_rect(segments_.front());
    return std::any_of(std::next(segments_.begin()), segments_.end(), [&](const Cell& seg) {
        return head_rect.intersects(grid_.cell_rect(seg));
    });
}

const Cell& SnakeBody::head() const {
    require_non_empty();
    return segments_.front();
}

const Cell& SnakeBody::tail() const {
    require_non_empty();
    return segments_.back();
}

bool SnakeBody::occupies(const Cell& cell) const {
    return std::find(segments_.begin(), segments_.end(), cell) != segments_.end();
}

void SnakeBody::require_non_empty() const {
    if (segments_.empty()) {
        spdlog::critical("[SnakeBody] Snake has no segments");
        throw std::logic_error("SnakeBody has no segments");
    }
}

} // namespace slither
