#pragma once
#include "core/Actor.h"
#include "core/Types.h"
#include "strategy/StrategyCatalog.h"

#include <variant>

class OceanField;

// What a drone saw this step.
struct DensityReport {
    int droneId = -1;
    Vec2 position{ 0.0, 0.0 };
    double density = 0.0;
    double timeHours = 0.0;
};

// Orbits a point held ahead of the catching system along its heading.
struct CircularPattern {
    double orbitRadiusKm = 0.0;
    double angularRateRadPerHour = 0.0;
    double forwardDistanceKm = 0.0;
    double angleRad = 0.0;            // 0 = north of the orbit centre, clockwise
};

// Boustrophedon sweep: rows of width H, V apart. Tracked in its own frame
// anchored at `origin`; the map position is this plan clamped to the map.
struct LawnmowerPattern {
    Strategy strategy;
    Vec2 origin{ 0.0, 0.0 };
    int xDirection = 1;               // first row heads east (+1) or west (-1)
    int yDirection = 1;               // rows advance north (+1) or south (-1)

    int rowIndex = 0;
    double alongRowKm = 0.0;          // progress on the current row
    bool inTransfer = false;          // on the V leg between rows
    double transferKm = 0.0;

    double rowY(int row) const;
    double rowStartX(int row) const;
    int rowXDirection(int row) const;

    Vec2 planPosition() const;
    double planHeadingDeg() const;
};

using DronePattern = std::variant<CircularPattern, LawnmowerPattern>;

class Drone {
public:
    static Drone circular(int id,
        const Actor& leader,
        double scanRadiusKm,
        double orbitRadiusKm,
        double angularRateRadPerHour,
        double forwardDistanceKm,
        double initialAngleRad);

    static Drone lawnmower(int id,
        const Vec2& start,
        double scanRadiusKm,
        const Strategy& strategy,
        int xDirection,
        int yDirection);

    // Called once per simulation tick. `leader` is the catching system.
    void step(double dtHours, const Actor& leader, const MapBounds& bounds);

    // Samples the field at the current position; never modifies it.
    DensityReport report(const OceanField& ocean, double timeHours) const;

    int getId() const { return id; }
    const Actor& getActor() const { return actor; }
    const Vec2& getPosition() const { return actor.position; }
    double getHeadingDeg() const { return actor.headingDeg; }
    double getScanRadiusKm() const { return scanRadiusKm; }
    DronePatternKind getKind() const;
    const DronePattern& getPattern() const { return pattern; }

private:
    Drone(int id, double scanRadiusKm, DronePattern pattern);

    void stepCircular(CircularPattern& c, double dtHours, const Actor& leader, const MapBounds& bounds);
    void stepLawnmower(LawnmowerPattern& l, double dtHours, const MapBounds& bounds);

    int id;
    double scanRadiusKm;
    Actor actor;
    DronePattern pattern;
};

// Orbit centre for a circular drone following `leader`.
Vec2 orbitCenter(const CircularPattern& c, const Actor& leader);
