#pragma once
#include "core/Types.h"
#include <cstdint>
#include <optional>
#include <string>

// =============================================================================
// SimulationConfig - All the knobs and dials for one ocean sweep run
//
// Parameters are organized into logical groups:
//   - Global: pattern, strategy, seed, step count, timestep
//   - Map: field bounds and wind
//   - Swarm: drone count and orbit geometry
//   - Catching system: speed, turn limit, span
//   - Particles: how the initial density field is laid out
// =============================================================================

struct ParticleDensitySettings {
    int clusterCount = 12;             // High-density patches
    double baseNoise = 0.05;           // Max background mass per cell
    double cellSizeKm = 1.0;           // Grid resolution

    double clusterStrengthMin = 0.5;   // Peak mass added at a cluster centre
    double clusterStrengthMax = 1.0;
    double clusterRadiusMinKm = 2.0;   // Gaussian falloff radius
    double clusterRadiusMaxKm = 6.0;
};

struct SimulationConfig {

    // -------------------------------------------------------------------------
    // Global Simulation Parameters
    // -------------------------------------------------------------------------
    DronePatternKind pattern = DronePatternKind::Lawnmower;
    std::optional<std::string> strategyName;   // Lawnmower only; catalog default if absent
    std::optional<std::uint64_t> seed;         // Generated and echoed back if absent
    int steps = 200;
    double timeStepHours = 0.1;                // 6 simulated minutes per step

    // -------------------------------------------------------------------------
    // Map and Wind
    // -------------------------------------------------------------------------
    double mapWidthKm = 100.0;
    double mapHeightKm = 100.0;

    double windDirectionDeg = 45.0;    // Compass direction the surface drift moves toward
    double windSpeedKmh = 0.93;        // ~0.5 knots

    // -------------------------------------------------------------------------
    // Swarm Configuration
    // -------------------------------------------------------------------------
    int droneCount = 2;
    double droneScanRadiusKm = 0.3;    // 300 m field of view

    // Circular pattern geometry. Drone i orbits with radius
    // orbitRadiusKm + i * orbitRadiusStaggerKm around a point placed
    // forwardDistanceKm + forwardStaggerKm * ceil(i / 2) ahead of the system.
    double orbitRadiusKm = 2.0;
    double orbitRadiusStaggerKm = 2.0;
    double forwardDistanceKm = 6.0;
    double forwardStaggerKm = 3.0;
    double orbitAngularRateRadPerHour = 1.5;

    // -------------------------------------------------------------------------
    // Catching System
    // -------------------------------------------------------------------------
    double systemSpeedKmh = 2.78;          // 1.5 knots
    double systemMaxTurnDeg = 45.0;        // ... per systemTurnWindowHours
    double systemTurnWindowHours = 3.0;
    double systemSpanKm = 1.4;

    // -------------------------------------------------------------------------
    // Particle Field
    // -------------------------------------------------------------------------
    ParticleDensitySettings particles;

    MapBounds bounds() const { return MapBounds{ mapWidthKm, mapHeightKm }; }

    double systemTurnRateDegPerHour() const {
        return systemMaxTurnDeg / systemTurnWindowHours;
    }

    // Throws ConfigurationError describing the first invalid field.
    void validate() const;
};

const char* toString(DronePatternKind pattern);

// Both throw ConfigurationError on bad input.
DronePatternKind parsePattern(const std::string& text);
std::uint64_t parseSeed(const std::string& text);
