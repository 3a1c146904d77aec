#include "core/Actor.h"
#include "util/Logger.h"

#include <cmath>

namespace {
constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;
}

double normalizeDeg(double deg) {
    double d = std::fmod(deg, 360.0);
    if (d < 0.0) d += 360.0;
    if (d >= 360.0) d -= 360.0;   // -1e-17 + 360 rounds to 360
    return d;
}

double wrapDeg180(double deg) {
    double d = normalizeDeg(deg);
    if (d > 180.0) d -= 360.0;
    return d;
}

Vec2 headingVector(double headingDeg) {
    const double rad = headingDeg * DEG_TO_RAD;
    return Vec2(std::sin(rad), std::cos(rad));
}

double bearingDeg(const Vec2& from, const Vec2& to) {
    const Vec2 d = to - from;
    if (d.x == 0.0 && d.y == 0.0) return 0.0;
    return normalizeDeg(std::atan2(d.x, d.y) * RAD_TO_DEG);
}

Vec2 Actor::projected(double dtHours) const {
    return position + headingVector(headingDeg) * (speedKmh * dtHours);
}

bool Actor::moveWithin(const Vec2& next, const MapBounds& bounds, const char* who, int id) {
    Vec2 target = next;
    const bool clamped = !bounds.contains(next);
    if (clamped) {
        target = bounds.clamp(next);
        Log::clamp("[CLAMP] ", who, " ", id, " (", next.x, ", ", next.y,
            ") -> (", target.x, ", ", target.y, ")\n");
    }

    distanceTraveledKm += glm::length(target - position);
    position = target;
    return clamped;
}
