/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>

// World-space 2D vector; vision cones and debug overlays are built from these
class Vector2D {
public:
    Vector2D() : m_x(0.0f), m_y(0.0f) {}
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y; }

    bool isFinite() const { return std::isfinite(m_x) && std::isfinite(m_y); }

    // Z component of the 3D cross product
    float cross(const Vector2D& v2) const {
        return m_x * v2.m_y - m_y * v2.m_x;
    }

    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    Vector2D& operator+=(const Vector2D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        return *this;
    }

    bool operator==(const Vector2D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y;
    }

    static float distanceSquared(const Vector2D& a, const Vector2D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

#endif  // VECTOR_2D_HPP
