/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/VisionCone.hpp"
#include "core/Logger.hpp"
#include "world/Level.hpp"
#include <cmath>
#include <format>
#include <numbers>

namespace SneakEngine {

namespace {

struct Direction {
    double dx;
    double dy;
};

// Cardinal angles get exact components so no ray ever divides by ~0
Direction directionFor(double angleDegrees) {
    double wrapped = std::fmod(angleDegrees, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    if (wrapped == 0.0)   return {1.0, 0.0};
    if (wrapped == 90.0)  return {0.0, 1.0};
    if (wrapped == 180.0) return {-1.0, 0.0};
    if (wrapped == 270.0) return {0.0, -1.0};

    double radians = wrapped * std::numbers::pi / 180.0;
    return {std::cos(radians), std::sin(radians)};
}

int cellOf(double worldCoord) {
    return static_cast<int>(std::floor(worldCoord / TILE_SIZE));
}

// Near-axis rays can run far past the map; those points never reach cellOf
bool insideWorld(const Level& level, double x, double y) {
    const double maxX = static_cast<double>(level.getWidth()) * TILE_SIZE;
    const double maxY = static_cast<double>(level.getHeight()) * TILE_SIZE;
    return x >= 0.0 && x <= maxX && y >= 0.0 && y <= maxY;
}

bool blocksSight(const Level& level, int col, int row) {
    const Tile* tile = level.tileAt(Point(col, row));
    return tile == nullptr || tile->blocksMovement;
}

/*
 * March across horizontal grid lines (y = k * TILE_SIZE). Each crossing is
 * checked against the tile on the far side of the line.
 */
Vector2D marchHorizontalLines(const Level& level, double ex, double ey, Direction dir) {
    const double step = dir.dy > 0 ? TILE_SIZE : -TILE_SIZE;
    double y = std::floor(ey / TILE_SIZE) * TILE_SIZE + (dir.dy > 0 ? TILE_SIZE : 0.0);
    const double slope = dir.dx / dir.dy;
    double x = ex + (y - ey) * slope;
    const double xStep = step * slope;

    while (true) {
        if (!insideWorld(level, x, y)) {
            return Vector2D(static_cast<float>(x), static_cast<float>(y));
        }
        int row = cellOf(y) - (dir.dy > 0 ? 0 : 1);
        if (blocksSight(level, cellOf(x), row)) {
            return Vector2D(static_cast<float>(x), static_cast<float>(y));
        }
        x += xStep;
        y += step;
    }
}

// Same march across vertical grid lines (x = k * TILE_SIZE)
Vector2D marchVerticalLines(const Level& level, double ex, double ey, Direction dir) {
    const double step = dir.dx > 0 ? TILE_SIZE : -TILE_SIZE;
    double x = std::floor(ex / TILE_SIZE) * TILE_SIZE + (dir.dx > 0 ? TILE_SIZE : 0.0);
    const double slope = dir.dy / dir.dx;
    double y = ey + (x - ex) * slope;
    const double yStep = step * slope;

    while (true) {
        if (!insideWorld(level, x, y)) {
            return Vector2D(static_cast<float>(x), static_cast<float>(y));
        }
        int col = cellOf(x) - (dir.dx > 0 ? 0 : 1);
        if (blocksSight(level, col, cellOf(y))) {
            return Vector2D(static_cast<float>(x), static_cast<float>(y));
        }
        x += step;
        y += yStep;
    }
}

} // namespace

Vector2D VisionCone::castRay(const Level& level, const Vector2D& eye, double angleDegrees) {
    const Direction dir = directionFor(angleDegrees);
    const double ex = eye.getX();
    const double ey = eye.getY();

    const bool crossesRows = dir.dy != 0.0;
    const bool crossesColumns = dir.dx != 0.0;

    if (crossesRows && !crossesColumns) {
        return marchHorizontalLines(level, ex, ey, dir);
    }
    if (crossesColumns && !crossesRows) {
        return marchVerticalLines(level, ex, ey, dir);
    }

    Vector2D rowHit = marchHorizontalLines(level, ex, ey, dir);
    Vector2D colHit = marchVerticalLines(level, ex, ey, dir);
    return Vector2D::distanceSquared(eye, rowHit) <= Vector2D::distanceSquared(eye, colHit)
               ? rowHit
               : colHit;
}

VisionCone VisionCone::cast(const Level& level, Point mapPosition, int facing, int fov,
                            int stepDegrees) {
    if (stepDegrees <= 0) {
        VISION_WARN(std::format("Invalid sweep step {}; using {}", stepDegrees,
                                DEFAULT_STEP_DEGREES));
        stepDegrees = DEFAULT_STEP_DEGREES;
    }

    VisionCone cone;
    cone.m_startAngle = facing - fov / 2.0;
    cone.m_endAngle = facing + fov / 2.0;

    Point world = mapPosition.scaled(TILE_SIZE);
    Vector2D eye(static_cast<float>(world.getX() + TILE_SIZE / 2),
                 static_cast<float>(world.getY() + TILE_SIZE / 2));

    cone.m_points.reserve(static_cast<size_t>(fov / stepDegrees) + 3);
    cone.m_points.push_back(eye);

    for (double angle = cone.m_startAngle; angle < cone.m_endAngle; angle += stepDegrees) {
        cone.m_points.push_back(castRay(level, eye, angle));
    }
    cone.m_points.push_back(castRay(level, eye, cone.m_endAngle));

    return cone;
}

bool VisionCone::contains(const Vector2D& worldPoint) const {
    if (m_points.size() < 3) {
        return false;
    }

    bool inside = false;
    const float px = worldPoint.getX();
    const float py = worldPoint.getY();
    for (size_t i = 0, j = m_points.size() - 1; i < m_points.size(); j = i++) {
        const Vector2D& a = m_points[i];
        const Vector2D& b = m_points[j];
        if ((a.getY() > py) != (b.getY() > py)) {
            float crossX = a.getX() + (py - a.getY()) * (b.getX() - a.getX()) / (b.getY() - a.getY());
            if (px < crossX) {
                inside = !inside;
            }
        }
    }
    return inside;
}

} // namespace SneakEngine
