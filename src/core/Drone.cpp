#include "core/Drone.h"
#include "ocean/OceanField.h"

#include <cmath>
#include <type_traits>
#include <utility>

namespace {
constexpr double TWO_PI = 6.283185307179586;
constexpr double RAD_TO_DEG = 57.29577951308232;
}

//
// ================================
//     LAWNMOWER PLAN GEOMETRY
// ================================
//
double LawnmowerPattern::rowY(int row) const {
    return origin.y + yDirection * row * strategy.vKm;
}

// Even rows start on the origin's x, odd rows at the far end.
double LawnmowerPattern::rowStartX(int row) const {
    return (row % 2 == 0) ? origin.x : origin.x + xDirection * strategy.hKm;
}

int LawnmowerPattern::rowXDirection(int row) const {
    return (row % 2 == 0) ? xDirection : -xDirection;
}

Vec2 LawnmowerPattern::planPosition() const {
    const double rowEndX = rowStartX(rowIndex) + rowXDirection(rowIndex) * strategy.hKm;
    if (inTransfer) {
        return Vec2(rowEndX, rowY(rowIndex) + yDirection * transferKm);
    }
    return Vec2(rowStartX(rowIndex) + rowXDirection(rowIndex) * alongRowKm, rowY(rowIndex));
}

double LawnmowerPattern::planHeadingDeg() const {
    if (inTransfer) {
        return yDirection > 0 ? 0.0 : 180.0;
    }
    return rowXDirection(rowIndex) > 0 ? 90.0 : 270.0;
}

Vec2 orbitCenter(const CircularPattern& c, const Actor& leader) {
    return leader.position + headingVector(leader.headingDeg) * c.forwardDistanceKm;
}

//
// ================================
//          CONSTRUCTION
// ================================
//
Drone::Drone(int id, double scanRadiusKm, DronePattern pattern)
    : id(id),
    scanRadiusKm(scanRadiusKm),
    pattern(std::move(pattern))
{
}

Drone Drone::circular(int id,
    const Actor& leader,
    double scanRadiusKm,
    double orbitRadiusKm,
    double angularRateRadPerHour,
    double forwardDistanceKm,
    double initialAngleRad)
{
    CircularPattern c;
    c.orbitRadiusKm = orbitRadiusKm;
    c.angularRateRadPerHour = angularRateRadPerHour;
    c.forwardDistanceKm = forwardDistanceKm;
    c.angleRad = std::fmod(initialAngleRad, TWO_PI);

    Drone d(id, scanRadiusKm, c);
    d.actor.speedKmh = orbitRadiusKm * angularRateRadPerHour;
    d.actor.position = orbitCenter(c, leader) +
        Vec2(std::sin(c.angleRad), std::cos(c.angleRad)) * orbitRadiusKm;
    // Clockwise tangent
    d.actor.headingDeg = normalizeDeg(c.angleRad * RAD_TO_DEG + 90.0);
    return d;
}

Drone Drone::lawnmower(int id,
    const Vec2& start,
    double scanRadiusKm,
    const Strategy& strategy,
    int xDirection,
    int yDirection)
{
    LawnmowerPattern l;
    l.strategy = strategy;
    l.origin = start;
    l.xDirection = xDirection >= 0 ? 1 : -1;
    l.yDirection = yDirection >= 0 ? 1 : -1;

    Drone d(id, scanRadiusKm, l);
    d.actor.speedKmh = strategy.speedKmh;
    d.actor.position = start;
    d.actor.headingDeg = l.planHeadingDeg();
    return d;
}

DronePatternKind Drone::getKind() const {
    return std::holds_alternative<CircularPattern>(pattern)
        ? DronePatternKind::Circular
        : DronePatternKind::Lawnmower;
}

//
// ================================
//          MOTION
// ================================
//
void Drone::step(double dtHours, const Actor& leader, const MapBounds& bounds) {
    std::visit([&](auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, CircularPattern>) {
            stepCircular(p, dtHours, leader, bounds);
        }
        else {
            stepLawnmower(p, dtHours, bounds);
        }
    }, pattern);
}

void Drone::stepCircular(CircularPattern& c, double dtHours, const Actor& leader, const MapBounds& bounds) {
    c.angleRad = std::fmod(c.angleRad + c.angularRateRadPerHour * dtHours, TWO_PI);

    const Vec2 previous = actor.position;
    const Vec2 next = orbitCenter(c, leader) +
        Vec2(std::sin(c.angleRad), std::cos(c.angleRad)) * c.orbitRadiusKm;

    actor.moveWithin(next, bounds, "drone", id);
    if (actor.position != previous) {
        actor.headingDeg = bearingDeg(previous, actor.position);
    }
}

void Drone::stepLawnmower(LawnmowerPattern& l, double dtHours, const MapBounds& bounds) {
    const double h = l.strategy.hKm;
    const double v = l.strategy.vKm;
    if (h <= 0.0 && v <= 0.0) return;

    // Spend the whole step's distance: finish the row, take the V leg, start
    // the next row, as far as the budget reaches.
    double budget = l.strategy.speedKmh * dtHours;
    while (budget > 0.0) {
        if (!l.inTransfer) {
            const double left = h - l.alongRowKm;
            if (budget < left) {
                l.alongRowKm += budget;
                budget = 0.0;
            }
            else {
                l.alongRowKm = h;
                budget -= left;
                l.inTransfer = true;
                l.transferKm = 0.0;
            }
        }
        else {
            const double left = v - l.transferKm;
            if (budget < left) {
                l.transferKm += budget;
                budget = 0.0;
            }
            else {
                budget -= left;
                l.inTransfer = false;
                l.transferKm = 0.0;
                l.alongRowKm = 0.0;
                ++l.rowIndex;
            }
        }
    }

    actor.moveWithin(l.planPosition(), bounds, "drone", id);
    actor.headingDeg = l.planHeadingDeg();
}

DensityReport Drone::report(const OceanField& ocean, double timeHours) const {
    DensityReport r;
    r.droneId = id;
    r.position = actor.position;
    r.density = ocean.sampleDensity(actor.position, scanRadiusKm);
    r.timeHours = timeHours;
    return r;
}
