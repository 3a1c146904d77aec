#pragma once
#include <glm/glm.hpp>

// Positions are kilometres on a flat grid, origin at the bottom-left corner.
using Vec2 = glm::dvec2;

enum class DronePatternKind {
    Circular,
    Lawnmower
};

struct MapBounds {
    double widthKm = 0.0;
    double heightKm = 0.0;

    bool contains(const Vec2& p) const {
        return p.x >= 0.0 && p.x <= widthKm && p.y >= 0.0 && p.y <= heightKm;
    }

    Vec2 clamp(const Vec2& p) const {
        return Vec2(glm::clamp(p.x, 0.0, widthKm), glm::clamp(p.y, 0.0, heightKm));
    }

    Vec2 center() const { return Vec2(widthKm * 0.5, heightKm * 0.5); }
};
