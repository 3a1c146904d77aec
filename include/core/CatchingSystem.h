#pragma once
#include "core/Actor.h"
#include "core/Drone.h"
#include "core/Types.h"

#include <optional>
#include <vector>

class OceanField;

// What happened during one CatchingSystem::step.
struct CatchOutcome {
    bool hadTarget = false;
    DensityReport target;
    bool inRange = false;        // target within span / 2 after moving
    double requested = 0.0;
    double removed = 0.0;
};

// Slow collector that greedily steers toward the densest drone report and
// removes mass once it gets there. Turning is rate-limited; speed is fixed.
class CatchingSystem {
public:
    CatchingSystem(const Vec2& start,
        double headingDeg,
        double speedKmh,
        double maxTurnDegPerHour,
        double spanKm);

    // Called once per simulation tick with every report gathered this step.
    // No reports: hold heading and keep going straight.
    CatchOutcome step(double dtHours,
        const std::vector<DensityReport>& recentReports,
        OceanField& ocean,
        const MapBounds& bounds);

    // Highest density; ties go to the nearest report, then the earliest one.
    static std::optional<std::size_t> selectTarget(const std::vector<DensityReport>& reports,
        const Vec2& from);

    const Actor& getActor() const { return actor; }
    const Vec2& getPosition() const { return actor.position; }
    double getHeadingDeg() const { return actor.headingDeg; }
    double getSpanKm() const { return spanKm; }
    double getMaxTurnDegPerHour() const { return maxTurnDegPerHour; }
    double getTotalProcessed() const { return totalProcessed; }
    const std::optional<DensityReport>& getLastTarget() const { return lastTarget; }

private:
    Actor actor;
    double maxTurnDegPerHour;
    double spanKm;

    double totalProcessed = 0.0;
    std::optional<DensityReport> lastTarget;
};
