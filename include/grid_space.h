// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file grid_space.h
 * @brief Play-field geometry shared by the snake, the fruit spawner and the round
 *
 * Everything at rest lives on an integer grid of square cells. Pixel
 * coordinates are derived from cells (cell * cell_size) and are only needed
 * for rectangle overlap tests and by the presentation layer.
 *
 * @threading Value types, no shared state
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace slither {

/// Thrown when a configuration value would break a geometric or timing invariant
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

static constexpr int DEFAULT_PLAY_WIDTH = 800;
static constexpr int DEFAULT_PLAY_HEIGHT = 800;
static constexpr int DEFAULT_CELL_SIZE = 20;

/// Integer grid coordinate (column, row). Rows grow downward.
struct Cell {
    int col = 0;
    int row = 0;

    bool operator==(const Cell& o) const {
        return col == o.col && row == o.row;
    }
    bool operator!=(const Cell& o) const {
        return !(*this == o);
    }
};

/// Axis-aligned rectangle in pixels
struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    /// Strict overlap: rectangles that only share an edge do not intersect
    [[nodiscard]] bool intersects(const Rect& o) const {
        return x < o.x + o.w && o.x < x + w && y < o.y + o.h && o.y < y + h;
    }
};

enum class Direction { UP, DOWN, LEFT, RIGHT };

/// Unit step of a direction in grid cells
struct DirectionVector {
    int dx;
    int dy;
};

[[nodiscard]] DirectionVector direction_vector(Direction dir);
[[nodiscard]] Direction opposite(Direction dir);
[[nodiscard]] bool is_opposite(Direction a, Direction b);
[[nodiscard]] const char* direction_name(Direction dir);

/**
 * @brief Parse "up", "down", "left" or "right" (case-insensitive)
 * @return Direction, or std::nullopt for anything else
 */
[[nodiscard]] std::optional<Direction> parse_direction(const std::string& str);

/**
 * @brief Dimensions of the play field and its cell grid
 *
 * Width and height must be positive multiples of cell_size; the constructor
 * throws ConfigError otherwise.
 */
class GridSpace {
  public:
    GridSpace(int width, int height, int cell_size);
    GridSpace() : GridSpace(DEFAULT_PLAY_WIDTH, DEFAULT_PLAY_HEIGHT, DEFAULT_CELL_SIZE) {}

    [[nodiscard]] int width() const {
        return width_;
    }
    [[nodiscard]] int height() const {
        return height_;
    }
    [[nodiscard]] int cell_size() const {
        return cell_size_;
    }
    [[nodiscard]] int columns() const {
        return width_ / cell_size_;
    }
    [[nodiscard]] int rows() const {
        return height_ / cell_size_;
    }

    /// Top-left pixel of a cell
    [[nodiscard]] int to_pixel_x(const Cell& cell) const {
        return cell.col * cell_size_;
    }
    [[nodiscard]] int to_pixel_y(const Cell& cell) const {
        return cell.row * cell_size_;
    }

    /// Round a pixel position to the nearest grid multiple
    [[nodiscard]] Cell snap(double px_x, double px_y) const;

    /// Bounding box of a cell in pixels
    [[nodiscard]] Rect cell_rect(const Cell& cell) const;

    /// True if the whole cell lies inside [0, width) x [0, height)
    [[nodiscard]] bool contains(const Cell& cell) const;

  private:
    int width_;
    int height_;
    int cell_size_;
};

} // namespace slither
