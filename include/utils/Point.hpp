/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef POINT_HPP
#define POINT_HPP

#include <algorithm>
#include <format>
#include <string>

// Integer grid coordinate; used for both map (tile) and world (pixel) space
class Point {
public:
    constexpr Point() = default;
    constexpr Point(int x, int y) : m_x(x), m_y(y) {}

    constexpr int getX() const { return m_x; }
    constexpr int getY() const { return m_y; }

    void setTo(int x, int y) {
        m_x = x;
        m_y = y;
    }

    constexpr Point translated(int dx, int dy) const { return Point(m_x + dx, m_y + dy); }

    // Per-axis clamp into [minX, maxX] x [minY, maxY]
    constexpr Point clamped(int minX, int minY, int maxX, int maxY) const {
        return Point(std::clamp(m_x, minX, maxX), std::clamp(m_y, minY, maxY));
    }

    // Map -> world
    constexpr Point scaled(int factor) const { return Point(m_x * factor, m_y * factor); }

    // World -> map; floors toward negative infinity
    constexpr Point reduced(int factor) const {
        return Point(floorDiv(m_x, factor), floorDiv(m_y, factor));
    }

    constexpr bool equals(int x, int y) const { return m_x == x && m_y == y; }

    constexpr bool operator==(const Point& other) const = default;

    std::string toString() const { return std::format("[{}, {}]", m_x, m_y); }

private:
    static constexpr int floorDiv(int a, int b) {
        int q = a / b;
        return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
    }

    int m_x{0};
    int m_y{0};
};

#endif // POINT_HPP
