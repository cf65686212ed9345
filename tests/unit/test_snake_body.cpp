// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_snake_body.cpp
 * @brief Unit tests for SnakeBody movement, turning, growth and collisions
 *
 * Default geometry: 800x800 field, 20px cells, 20px/s, so update(1.0) is
 * exactly one cell step. The initial head is cell (20, 3) = pixel (400, 60).
 */

#include "snake_body.h"

#include <cstdlib>
#include <limits>
#include <random>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace slither;
using Catch::Approx;

namespace {

/// Every consecutive pair of segments is exactly one cell apart on one axis
bool is_contiguous(const SnakeBody& snake) {
    const auto& segs = snake.segments();
    for (size_t i = 1; i < segs.size(); ++i) {
        int dx = std::abs(segs[i].col - segs[i - 1].col);
        int dy = std::abs(segs[i].row - segs[i - 1].row);
        if (dx + dy != 1) {
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// Initial Layout
// ============================================================================

TEST_CASE("SnakeBody: initial layout", "[snake]") {
    GridSpace grid;
    SnakeBody snake(grid);

    REQUIRE(snake.length() == 3);
    REQUIRE(snake.direction() == Direction::DOWN);
    REQUIRE(snake.move_accumulator() == 0.0);
    REQUIRE(snake.pending_growth() == 0);
    REQUIRE(snake.speed() == Approx(20.0));

    // Head at horizontal centre, length*cell below the top, body above it
    REQUIRE(grid.to_pixel_x(snake.head()) == 400);
    REQUIRE(grid.to_pixel_y(snake.head()) == 60);
    REQUIRE(snake.segments()[1] == Cell{20, 2});
    REQUIRE(snake.tail() == Cell{20, 1});
    REQUIRE(is_contiguous(snake));
}

TEST_CASE("SnakeBody: custom length extends the body upward", "[snake]") {
    GridSpace grid;
    SnakeBody snake(grid, 5);

    REQUIRE(snake.length() == 5);
    REQUIRE(snake.head() == Cell{20, 5});
    REQUIRE(snake.tail() == Cell{20, 1});
}

TEST_CASE("SnakeBody: centre column rounds down off-grid", "[snake]") {
    // 300 / 2 = 150px is not a multiple of 20; head goes to column 7 (140px)
    GridSpace grid(300, 300, 20);
    SnakeBody snake(grid);
    REQUIRE(snake.head().col == 7);
}

TEST_CASE("SnakeBody: rejects invalid construction", "[snake][config]") {
    GridSpace grid;

    SECTION("length below one") {
        REQUIRE_THROWS_AS(SnakeBody(grid, 0), ConfigError);
    }

    SECTION("length that does not fit the rows") {
        REQUIRE_THROWS_AS(SnakeBody(grid, 40), ConfigError);
        REQUIRE_NOTHROW(SnakeBody(grid, 39));
    }

    SECTION("non-positive speed") {
        REQUIRE_THROWS_AS(SnakeBody(grid, 3, 0.0), ConfigError);
        REQUIRE_THROWS_AS(SnakeBody(grid, 3, -5.0), ConfigError);
    }
}

// ============================================================================
// Time Accumulation
// ============================================================================

TEST_CASE("SnakeBody: one second at 20px/s moves one cell", "[snake][update]") {
    GridSpace grid;
    SnakeBody snake(grid);

    REQUIRE(snake.update(1.0) == 1);

    REQUIRE(grid.to_pixel_x(snake.head()) == 400);
    REQUIRE(grid.to_pixel_y(snake.head()) == 80);
    REQUIRE(snake.length() == 3);
    REQUIRE(snake.tail() == Cell{20, 2});
    REQUIRE(snake.move_accumulator() == Approx(0.0));
}

TEST_CASE("SnakeBody: non-positive elapsed time is a no-op", "[snake][update]") {
    GridSpace grid;
    SnakeBody snake(grid);

    REQUIRE(snake.update(0.0) == 0);
    REQUIRE(snake.update(-3.0) == 0);
    REQUIRE(snake.head() == Cell{20, 3});
    REQUIRE(snake.move_accumulator() == 0.0);
}

TEST_CASE("SnakeBody: NaN or infinite elapsed time is a no-op", "[snake][update]") {
    GridSpace grid;
    SnakeBody snake(grid);
    snake.update(0.5);

    REQUIRE(snake.update(std::numeric_limits<double>::quiet_NaN()) == 0);
    REQUIRE(snake.update(std::numeric_limits<double>::infinity()) == 0);
    REQUIRE(snake.update(-std::numeric_limits<double>::infinity()) == 0);

    REQUIRE(snake.head() == Cell{20, 3});
    REQUIRE(snake.move_accumulator() == Approx(10.0));

    // Still moves normally afterwards
    REQUIRE(snake.update(0.5) == 1);
    REQUIRE(snake.head() == Cell{20, 4});
}

TEST_CASE("SnakeBody: partial steps accumulate", "[snake][update]") {
    GridSpace grid;
    SnakeBody snake(grid);

    REQUIRE(snake.update(0.5) == 0);
    REQUIRE(snake.move_accumulator() == Approx(10.0));
    REQUIRE(snake.head() == Cell{20, 3});

    REQUIRE(snake.update(0.5) == 1);
    REQUIRE(snake.head() == Cell{20, 4});
    REQUIRE(snake.move_accumulator() == Approx(0.0));
}

TEST_CASE("SnakeBody: long frames catch up several cells", "[snake][update]") {
    GridSpace grid;
    SnakeBody snake(grid);

    REQUIRE(snake.update(3.5) == 3);
    REQUIRE(snake.head() == Cell{20, 6});
    REQUIRE(snake.length() == 3);
    REQUIRE(snake.move_accumulator() == Approx(10.0));
    REQUIRE(is_contiguous(snake));
}

TEST_CASE("SnakeBody: accumulator stays in [0, cell) and length is conserved",
          "[snake][update][property]") {
    GridSpace grid(4000, 4000, 20);
    SnakeBody snake(grid, 3, 37.0);
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> dt_dist(-0.05, 0.9);

    for (int i = 0; i < 2000; ++i) {
        snake.update(dt_dist(rng));
        REQUIRE(snake.move_accumulator() >= 0.0);
        REQUIRE(snake.move_accumulator() < 20.0);
        REQUIRE(snake.length() == 3);
    }
    REQUIRE(is_contiguous(snake));
}

// ============================================================================
// Direction Changes
// ============================================================================

TEST_CASE("SnakeBody: reversal is ignored", "[snake][direction]") {
    GridSpace grid;
    SnakeBody snake(grid);

    REQUIRE(snake.change_direction(Direction::UP) == DirectionChange::IGNORED);
    REQUIRE(snake.direction() == Direction::DOWN);
    REQUIRE(snake.head() == Cell{20, 3});
}

TEST_CASE("SnakeBody: turning takes effect on the next step", "[snake][direction]") {
    GridSpace grid;
    SnakeBody snake(grid);

    REQUIRE(snake.change_direction(Direction::LEFT) == DirectionChange::TURNED);
    REQUIRE(snake.direction() == Direction::LEFT);
    REQUIRE(snake.head() == Cell{20, 3}); // no immediate move

    snake.update(1.0);
    REQUIRE(snake.head() == Cell{19, 3});
    REQUIRE(is_contiguous(snake));
}

TEST_CASE("SnakeBody: repeating the direction boosts one cell", "[snake][direction][boost]") {
    GridSpace grid;
    SnakeBody snake(grid);
    snake.update(0.5);
    REQUIRE(snake.move_accumulator() == Approx(10.0));

    REQUIRE(snake.change_direction(Direction::DOWN) == DirectionChange::BOOSTED);

    REQUIRE(snake.head() == Cell{20, 4});
    REQUIRE(snake.length() == 3);
    REQUIRE(snake.move_accumulator() == Approx(10.0)); // untouched
    REQUIRE(snake.direction() == Direction::DOWN);
}

TEST_CASE("SnakeBody: boosts ignore elapsed time", "[snake][direction][boost]") {
    GridSpace grid;
    SnakeBody snake(grid);

    for (int i = 0; i < 10; ++i) {
        snake.change_direction(Direction::DOWN);
    }
    REQUIRE(snake.head() == Cell{20, 13});
    REQUIRE(snake.length() == 3);
    REQUIRE(snake.move_accumulator() == 0.0);
}

TEST_CASE("SnakeBody: boost does not consume pending growth", "[snake][direction][boost]") {
    GridSpace grid;
    SnakeBody snake(grid);
    snake.grow();

    snake.change_direction(Direction::DOWN);
    REQUIRE(snake.length() == 3);
    REQUIRE(snake.pending_growth() == 1);

    snake.update(1.0);
    REQUIRE(snake.length() == 4);
    REQUIRE(snake.pending_growth() == 0);
}

TEST_CASE("SnakeBody: stored direction never flips to its opposite",
          "[snake][direction][property]") {
    GridSpace grid(4000, 4000, 20);
    SnakeBody snake(grid);
    std::mt19937 rng(99);
    std::uniform_int_distribution<int> pick(0, 3);
    const Direction all[] = {Direction::UP, Direction::DOWN, Direction::LEFT, Direction::RIGHT};

    Direction previous = snake.direction();
    for (int i = 0; i < 500; ++i) {
        snake.change_direction(all[pick(rng)]);
        REQUIRE_FALSE(is_opposite(previous, snake.direction()));
        previous = snake.direction();
    }
}

// ============================================================================
// Growth
// ============================================================================

TEST_CASE("SnakeBody: growth applies on the next step and keeps the tail", "[snake][grow]") {
    GridSpace grid;
    SnakeBody snake(grid);
    Cell old_tail = snake.tail();

    snake.grow();
    REQUIRE(snake.length() == 3); // not retroactive
    REQUIRE(snake.pending_growth() == 1);

    snake.update(1.0);
    REQUIRE(snake.length() == 4);
    REQUIRE(snake.tail() == old_tail);
    REQUIRE(snake.head() == Cell{20, 4});
    REQUIRE(snake.pending_growth() == 0);
    REQUIRE(is_contiguous(snake));
}

TEST_CASE("SnakeBody: multiple growth spreads across steps", "[snake][grow]") {
    GridSpace grid;
    SnakeBody snake(grid);
    snake.grow();
    snake.grow();

    snake.update(1.0);
    REQUIRE(snake.length() == 4);
    snake.update(1.0);
    REQUIRE(snake.length() == 5);
    snake.update(1.0);
    REQUIRE(snake.length() == 5);
}

// ============================================================================
// Collisions
// ============================================================================

TEST_CASE("SnakeBody: leaving the left edge is a boundary collision", "[snake][collision]") {
    GridSpace grid;
    SnakeBody snake(grid);

    snake.update(2.0);
    REQUIRE(grid.to_pixel_y(snake.head()) == 100);

    snake.change_direction(Direction::LEFT);
    snake.update(20.0);
    REQUIRE(grid.to_pixel_x(snake.head()) == 0);
    REQUIRE(grid.to_pixel_y(snake.head()) == 100);
    REQUIRE_FALSE(snake.check_boundary_collision());

    snake.update(1.0);
    REQUIRE(grid.to_pixel_x(snake.head()) == -20);
    REQUIRE(snake.check_boundary_collision());
}

TEST_CASE("SnakeBody: a huge frame stops one cell past the edge", "[snake][collision]") {
    GridSpace grid;
    SnakeBody snake(grid);

    // Far more time than the field is tall; catch-up ends on leaving the grid
    REQUIRE(snake.update(214748362.0) == 37);
    REQUIRE(snake.head() == Cell{20, 40});
    REQUIRE(snake.check_boundary_collision());
    REQUIRE(snake.move_accumulator() >= 0.0);
    REQUIRE(snake.move_accumulator() < 20.0);
    REQUIRE(snake.length() == 3);
    REQUIRE(is_contiguous(snake));
}

TEST_CASE("SnakeBody: boundary on every side", "[snake][collision]") {
    GridSpace grid(100, 100, 20);
    SnakeBody snake(grid, 1);
    // 5x5 grid, head at (2, 1)

    SECTION("top") {
        snake.change_direction(Direction::LEFT);
        snake.change_direction(Direction::UP);
        snake.update(1.0);
        REQUIRE_FALSE(snake.check_boundary_collision());
        snake.update(1.0);
        REQUIRE(snake.check_boundary_collision());
    }

    SECTION("bottom") {
        snake.update(3.0);
        REQUIRE(snake.head() == Cell{2, 4});
        REQUIRE_FALSE(snake.check_boundary_collision());
        snake.update(1.0);
        REQUIRE(snake.check_boundary_collision());
    }

    SECTION("right") {
        snake.change_direction(Direction::RIGHT);
        snake.update(2.0);
        REQUIRE_FALSE(snake.check_boundary_collision());
        snake.update(1.0);
        REQUIRE(snake.check_boundary_collision());
    }
}

TEST_CASE("SnakeBody: self collision on a tight loop", "[snake][collision]") {
    GridSpace grid;
    SnakeBody snake(grid, 5);
    // head (20,5), body up to (20,1)

    snake.change_direction(Direction::RIGHT);
    snake.update(1.0); // (21,5)
    snake.change_direction(Direction::UP);
    snake.update(1.0); // (21,4)
    REQUIRE_FALSE(snake.check_self_collision());

    snake.change_direction(Direction::LEFT);
    snake.update(1.0); // (20,4), still body
    REQUIRE(snake.head() == Cell{20, 4});
    REQUIRE(snake.check_self_collision());
    REQUIRE_FALSE(snake.check_boundary_collision());
}

TEST_CASE("SnakeBody: short snakes cannot hit themselves", "[snake][collision]") {
    GridSpace grid;
    SnakeBody snake(grid);

    snake.change_direction(Direction::RIGHT);
    snake.update(1.0);
    snake.change_direction(Direction::UP);
    snake.update(1.0);
    snake.change_direction(Direction::LEFT);
    snake.update(1.0);
    // Length 3: the tail has moved out of the way
    REQUIRE_FALSE(snake.check_self_collision());
}

// ============================================================================
// Reset
// ============================================================================

TEST_CASE("SnakeBody: reset restores the initial layout", "[snake][reset]") {
    GridSpace grid;
    SnakeBody snake(grid);
    auto initial = snake.segments();

    snake.grow();
    snake.grow();
    snake.change_direction(Direction::RIGHT);
    snake.update(4.3);
    snake.change_direction(Direction::RIGHT);
    REQUIRE(snake.length() == 5);

    snake.reset();

    REQUIRE(snake.length() == 3);
    REQUIRE(snake.segments() == initial);
    REQUIRE(snake.direction() == Direction::DOWN);
    REQUIRE(snake.move_accumulator() == 0.0);
    REQUIRE(snake.pending_growth() == 0);
    REQUIRE(snake.speed() == Approx(20.0));
}

TEST_CASE("SnakeBody: occupies", "[snake]") {
    GridSpace grid;
    SnakeBody snake(grid);

    REQUIRE(snake.occupies({20, 1}));
    REQUIRE(snake.occupies({20, 3}));
    REQUIRE_FALSE(snake.occupies({20, 4}));
    REQUIRE_FALSE(snake.occupies({21, 3}));
}
