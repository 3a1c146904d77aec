#include "core/SimulationEngine.h"
#include "util/Logger.h"

#include <string>

namespace {

SimulationConfig validated(const SimulationConfig& config) {
    config.validate();
    return config;
}

// Lawnmower runs resolve their strategy up front so an unknown name fails
// before anything moves. Circular drones never look at it.
std::optional<Strategy> resolveStrategy(const SimulationConfig& cfg, const StrategyCatalog& catalog) {
    if (cfg.pattern != DronePatternKind::Lawnmower) {
        if (cfg.strategyName) {
            Log::config("[CONFIG] circular pattern ignores strategy '", *cfg.strategyName, "'\n");
        }
        return std::nullopt;
    }
    return cfg.strategyName ? catalog.lookup(*cfg.strategyName) : catalog.defaultStrategy();
}

} // namespace

const char* toString(EngineState state) {
    switch (state) {
    case EngineState::Initialized: return "initialized";
    case EngineState::Running:     return "running";
    case EngineState::Completed:   return "completed";
    case EngineState::Cancelled:   return "cancelled";
    }
    return "unknown";
}

SimulationEngine::SimulationEngine(const SimulationConfig& config, const StrategyCatalog& catalog)
    : cfg(validated(config)),
    strategy(resolveStrategy(cfg, catalog)),
    wind{ cfg.windDirectionDeg, cfg.windSpeedKmh },
    system(cfg.bounds().center(),
        0.0,
        cfg.systemSpeedKmh,
        cfg.systemTurnRateDegPerHour(),
        cfg.systemSpanKm)
{
    log.pattern = toString(cfg.pattern);
    log.seedGenerated = !cfg.seed.has_value();
    log.seed = cfg.seed ? *cfg.seed : generateSeed();
    log.requestedSteps = cfg.steps;
    log.timeStepHours = cfg.timeStepHours;
    log.mapWidthKm = cfg.mapWidthKm;
    log.mapHeightKm = cfg.mapHeightKm;

    if (strategy) {
        log.strategyName = strategy->name;
        log.strategy = strategy;

        if (strategy->hKm > cfg.mapWidthKm || strategy->vKm > cfg.mapHeightKm) {
            Log::config("[CONFIG] WARNING: strategy '", strategy->name, "' (H=", strategy->hKm,
                " km, V=", strategy->vKm, " km) does not fit the ", cfg.mapWidthKm, " x ",
                cfg.mapHeightKm, " km map; drone positions will be clamped\n");
        }
    }

    // Create drones. Lawnmowers leave from the catching system in alternating
    // directions; circular drones spread their phases around the orbit.
    drones.reserve(cfg.droneCount);
    for (int i = 0; i < cfg.droneCount; ++i) {
        if (cfg.pattern == DronePatternKind::Lawnmower) {
            const int dir = (i % 2 == 0) ? 1 : -1;
            drones.push_back(Drone::lawnmower(i,
                system.getPosition(),
                cfg.droneScanRadiusKm,
                *strategy,
                dir,
                dir));
        }
        else {
            const int rank = (i + 1) / 2;
            drones.push_back(Drone::circular(i,
                system.getActor(),
                cfg.droneScanRadiusKm,
                cfg.orbitRadiusKm + i * cfg.orbitRadiusStaggerKm,
                cfg.orbitAngularRateRadPerHour,
                cfg.forwardDistanceKm + rank * cfg.forwardStaggerKm,
                6.283185307179586 * i / cfg.droneCount));
        }
    }

    log.actors.push_back(ActorSummary{ CATCHING_SYSTEM_ACTOR_ID, "catching-system", 0.0 });
    for (const auto& d : drones) {
        log.actors.push_back(ActorSummary{ d.getId() + 1, "drone-" + std::to_string(d.getId()), 0.0 });
    }
}

const RunLog& SimulationEngine::run() {
    return runSteps(cfg.steps - currentStep);
}

const RunLog& SimulationEngine::runSteps(int count) {
    if (state == EngineState::Completed || state == EngineState::Cancelled) {
        return log;
    }
    if (state == EngineState::Initialized) {
        start();
    }

    for (int i = 0; i < count && currentStep < cfg.steps; ++i) {
        if (cancelRequested) break;
        step();
    }

    if (currentStep >= cfg.steps) {
        finish(EngineState::Completed);
    }
    else if (cancelRequested) {
        finish(EngineState::Cancelled);
    }
    return log;
}

void SimulationEngine::start() {
    rng.seed(log.seed);
    ocean.initialize(cfg.bounds(), rng, cfg.particles);
    state = EngineState::Running;

    Log::config("[CONFIG] pattern=", log.pattern,
        " strategy=", (log.strategyName.empty() ? "-" : log.strategyName),
        " seed=", log.seed, (log.seedGenerated ? " (generated)" : ""),
        " steps=", cfg.steps, " drones=", drones.size(), "\n");
}

void SimulationEngine::step() {
    const MapBounds bounds = cfg.bounds();
    const double dt = cfg.timeStepHours;

    ++currentStep;
    const double now = currentStep * dt;

    // 1. Drones move, then every one of them reports. All reads happen before
    //    any removal this step.
    for (auto& d : drones) {
        d.step(dt, system.getActor(), bounds);
    }

    std::vector<DensityReport> reports;
    reports.reserve(drones.size());
    for (const auto& d : drones) {
        reports.push_back(d.report(ocean, now));
    }

    // 2. Catching system steers on this step's reports and removes mass.
    const CatchOutcome outcome = system.step(dt, reports, ocean, bounds);

    // 3. Surface drift.
    ocean.drift(wind, dt);

    // 4. Record.
    StepStats stats;
    stats.stepIndex = currentStep;
    for (const auto& r : reports) {
        stats.particlesDetected += r.density;
        stats.droneDensities.push_back(r.density);
    }
    stats.particlesProcessed = outcome.removed;
    stats.systemDensity = ocean.sampleDensity(system.getPosition(), system.getSpanKm() * 0.5);

    log.particlesDetected += stats.particlesDetected;
    log.particlesProcessed += stats.particlesProcessed;
    stats.cumulativeDetected = log.particlesDetected;
    stats.cumulativeProcessed = log.particlesProcessed;

    const Actor& sys = system.getActor();
    log.trajectory.push_back(TrajectoryEntry{ currentStep, CATCHING_SYSTEM_ACTOR_ID,
        sys.position.x, sys.position.y, sys.headingDeg });
    for (const auto& d : drones) {
        log.trajectory.push_back(TrajectoryEntry{ currentStep, d.getId() + 1,
            d.getPosition().x, d.getPosition().y, d.getHeadingDeg() });
    }

    log.steps.push_back(stats);
    log.completedSteps = currentStep;

    if (currentStep % 10 == 1) {
        Log::progress("Step ", currentStep, ": Detected ", stats.particlesDetected,
            ", Processed ", stats.particlesProcessed, "\n");
    }

    if (stepCallback) {
        stepCallback(stats);
    }
}

void SimulationEngine::finish(EngineState endState) {
    state = endState;
    log.cancelled = (endState == EngineState::Cancelled);

    log.actors[0].distanceTraveledKm = system.getActor().distanceTraveledKm;
    for (std::size_t i = 0; i < drones.size(); ++i) {
        log.actors[i + 1].distanceTraveledKm = drones[i].getActor().distanceTraveledKm;
    }

    Log::print("\nSimulation ", toString(state), " after ", currentStep, " of ", cfg.steps, " steps\n");
    Log::print("Total particles detected: ", log.particlesDetected, "\n");
    Log::print("Total particles processed: ", log.particlesProcessed, "\n");
    Log::print("Efficiency: ", log.efficiency(), "\n");
}
