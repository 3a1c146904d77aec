#pragma once
#include "strategy/StrategyCatalog.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Actor ids in the log: 0 is the catching system, drone i is i + 1.
constexpr int CATCHING_SYSTEM_ACTOR_ID = 0;

struct TrajectoryEntry {
    int stepIndex = 0;
    int actorId = 0;
    double xKm = 0.0;
    double yKm = 0.0;
    double headingDeg = 0.0;

    bool operator==(const TrajectoryEntry& o) const {
        return stepIndex == o.stepIndex && actorId == o.actorId &&
            xKm == o.xKm && yKm == o.yKm && headingDeg == o.headingDeg;
    }
};

struct StepStats {
    int stepIndex = 0;
    double particlesDetected = 0.0;     // sum of this step's drone reports
    double particlesProcessed = 0.0;    // removed by the catching system
    double cumulativeDetected = 0.0;
    double cumulativeProcessed = 0.0;
    double systemDensity = 0.0;         // at the catching system, after removal
    std::vector<double> droneDensities;

    bool operator==(const StepStats& o) const {
        return stepIndex == o.stepIndex &&
            particlesDetected == o.particlesDetected &&
            particlesProcessed == o.particlesProcessed &&
            cumulativeDetected == o.cumulativeDetected &&
            cumulativeProcessed == o.cumulativeProcessed &&
            systemDensity == o.systemDensity &&
            droneDensities == o.droneDensities;
    }
};

struct ActorSummary {
    int actorId = 0;
    std::string name;
    double distanceTraveledKm = 0.0;
};

// Everything a finished (or cancelled) run hands to the outside world.
struct RunLog {
    std::string pattern;
    std::string strategyName;           // empty for circular runs
    std::optional<Strategy> strategy;   // published estimates, lawnmower only
    std::uint64_t seed = 0;
    bool seedGenerated = false;

    int requestedSteps = 0;
    int completedSteps = 0;
    bool cancelled = false;
    double timeStepHours = 0.0;
    double mapWidthKm = 0.0;
    double mapHeightKm = 0.0;

    std::vector<ActorSummary> actors;
    std::vector<TrajectoryEntry> trajectory;   // step-major, actor-minor
    std::vector<StepStats> steps;

    double particlesDetected = 0.0;
    double particlesProcessed = 0.0;

    // processed / detected, 0 when nothing was detected.
    double efficiency() const;

    std::vector<TrajectoryEntry> trajectoryFor(int actorId) const;
};
