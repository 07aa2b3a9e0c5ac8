/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VISION_CONE_HPP
#define VISION_CONE_HPP

#include "utils/Point.hpp"
#include "utils/Vector2D.hpp"
#include <cstddef>
#include <vector>

namespace SneakEngine {

class Level;

/**
 * @brief Line-of-sight polygon for one observer.
 *
 * The polygon starts at the eye (centre of the observer's tile) and is
 * followed by one hit point per swept ray, in increasing angle order. Rays
 * stop at the first tile that blocks movement or at the edge of the map;
 * entities never block sight.
 *
 * Usage:
 *   VisionCone cone = VisionCone::cast(level, guardPos, Facing::DOWN, 90, 5);
 *   bool seen = cone.contains(playerCentre);
 */
class VisionCone {
public:
    static constexpr int DEFAULT_STEP_DEGREES = 5;

    VisionCone() = default;

    /**
     * @param fov Full cone width in degrees, centred on facing
     * @param stepDegrees Sweep increment; the final ray is always at facing + fov/2
     */
    static VisionCone cast(const Level& level, Point mapPosition, int facing,
                           int fov, int stepDegrees = DEFAULT_STEP_DEGREES);

    /**
     * @brief Where a single ray first meets blocking geometry.
     * @param angleDegrees Clockwise from +X with Y down
     */
    static Vector2D castRay(const Level& level, const Vector2D& eye, double angleDegrees);

    [[nodiscard]] const std::vector<Vector2D>& getPoints() const noexcept { return m_points; }
    [[nodiscard]] bool empty() const noexcept { return m_points.empty(); }
    [[nodiscard]] size_t rayCount() const noexcept {
        return m_points.empty() ? 0 : m_points.size() - 1;
    }

    const Vector2D& getEye() const { return m_points.front(); }

    double getStartAngle() const { return m_startAngle; }
    double getEndAngle() const { return m_endAngle; }
    double angularSpan() const { return m_endAngle - m_startAngle; }

    // Even-odd point-in-polygon test in world space
    bool contains(const Vector2D& worldPoint) const;

private:
    std::vector<Vector2D> m_points;
    double m_startAngle{0.0};
    double m_endAngle{0.0};
};

} // namespace SneakEngine

#endif // VISION_CONE_HPP
