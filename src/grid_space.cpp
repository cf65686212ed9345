// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_space.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace slither {

DirectionVector direction_vector(Direction dir) {
    switch (dir) {
    case Direction::UP:
        return {0, -1};
    case Direction::DOWN:
        return {0, 1};
    case Direction::LEFT:
        return {-1, 0};
    case Direction::RIGHT:
        return {1, 0};
    }
    return {0, 0};
}

Direction opposite(Direction dir) {
    switch (dir) {
    case Direction::UP:
        return Direction::DOWN;
    case Direction::DOWN:
        return Direction::UP;
    case Direction::LEFT:
        return Direction::RIGHT;
    case Direction::RIGHT:
        return Direction::LEFT;
    }
    return dir;
}

bool is_opposite(Direction a, Direction b) {
    DirectionVector va = direction_vector(a);
    DirectionVector vb = direction_vector(b);
    return va.dx == -vb.dx && va.dy == -vb.dy;
}

const char* direction_name(Direction dir) {
    switch (dir) {
    case Direction::UP:
        return "up";
    case Direction::DOWN:
        return "down";
    case Direction::LEFT:
        return "left";
    case Direction::RIGHT:
        return "right";
    }
    return "unknown";
}

std::optional<Direction> parse_direction(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "up")
        return Direction::UP;
    if (lower == "down")
        return Direction::DOWN;
    if (lower == "left")
        return Direction::LEFT;
    if (lower == "right")
        return Direction::RIGHT;
    return std::nullopt;
}

GridSpace::GridSpace(int width, int height, int cell_size)
    : width_(width), height_(height), cell_size_(cell_size) {
    if (cell_size_ <= 0) {
        throw ConfigError(fmt::format("cell_size must be positive (got {})", cell_size_));
    }
    if (width_ < cell_size_ || height_ < cell_size_) {
        throw ConfigError(fmt::format("play field {}x{} is smaller than one {}px cell", width_,
                                      height_, cell_size_));
    }
    if (width_ % cell_size_ != 0 || height_ % cell_size_ != 0) {
        throw ConfigError(fmt::format("play field {}x{} is not a multiple of cell_size {}",
                                      width_, height_, cell_size_));
    }
}

Cell GridSpace::snap(double px_x, double px_y) const {
    return {static_cast<int>(std::lround(px_x / cell_size_)),
            static_cast<int>(std::lround(px_y / cell_size_))};
}

Rect GridSpace::cell_rect(const Cell& cell) const {
    return {to_pixel_x(cell), to_pixel_y(cell), cell_size_, cell_size_};
}

bool GridSpace::contains(const Cell& cell) const {
    // Cell units, so far-off heads cannot overflow a pixel product
    return cell.col >= 0 && cell.row >= 0 && cell.col < columns() && cell.row < rows();
}

} // namespace slither
