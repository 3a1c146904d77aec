#pragma once
#include "core/Types.h"

// Compass convention: heading 0 = north (+y), 90 = east (+x).

// Normalize to [0, 360).
double normalizeDeg(double deg);

// Normalize to (-180, 180].
double wrapDeg180(double deg);

// Unit vector pointing along a compass heading.
Vec2 headingVector(double headingDeg);

// Compass bearing from one point to another. Returns 0 for coincident points.
double bearingDeg(const Vec2& from, const Vec2& to);

// Anything that moves across the map: drones and the catching system.
struct Actor {
    Vec2 position{ 0.0, 0.0 };
    double headingDeg = 0.0;
    double speedKmh = 0.0;
    double distanceTraveledKm = 0.0;

    // Where speed * dt along the current heading would end up.
    Vec2 projected(double dtHours) const;

    // Move to `next`, clamped into the map. A clamp is logged as a BoundsClamp
    // and reported through the return value; the hop is added to
    // distanceTraveledKm.
    bool moveWithin(const Vec2& next, const MapBounds& bounds, const char* who, int id);
};
