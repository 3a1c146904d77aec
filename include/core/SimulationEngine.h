#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "config/SimulationConfig.h"
#include "core/CatchingSystem.h"
#include "core/Drone.h"
#include "core/RNG.h"
#include "core/RunLog.h"
#include "ocean/OceanField.h"
#include "strategy/StrategyCatalog.h"

enum class EngineState {
    Initialized,
    Running,
    Completed,
    Cancelled
};

const char* toString(EngineState state);

// One simulation run. Construction validates the configuration and resolves
// the strategy (throwing ConfigurationError on any problem); run() seeds the
// random source, lays out the field and steps every actor to completion.
class SimulationEngine {
public:
    SimulationEngine(const SimulationConfig& config, const StrategyCatalog& catalog);

    // Runs every remaining step. Returns the finished (or cancelled) log.
    const RunLog& run();

    // Advances at most `count` steps; stays Running while steps remain.
    const RunLog& runSteps(int count);

    // Stop at the next step boundary. The log keeps every completed step.
    void requestCancel() { cancelRequested = true; }

    // Invoked after each completed step.
    void setStepCallback(std::function<void(const StepStats&)> callback) {
        stepCallback = callback;
    }

    EngineState getState() const { return state; }
    int getCurrentStep() const { return currentStep; }
    double getTime() const { return currentStep * cfg.timeStepHours; }

    const RunLog& getLog() const { return log; }
    const SimulationConfig& getConfig() const { return cfg; }
    const std::optional<Strategy>& getStrategy() const { return strategy; }
    const OceanField& getOcean() const { return ocean; }
    const CatchingSystem& getCatchingSystem() const { return system; }
    const std::vector<Drone>& getDrones() const { return drones; }

private:
    void start();
    void step();
    void finish(EngineState endState);

    SimulationConfig cfg;
    std::optional<Strategy> strategy;
    EngineState state = EngineState::Initialized;

    Rng rng;
    OceanField ocean;
    WindVector wind;
    CatchingSystem system;
    std::vector<Drone> drones;

    RunLog log;
    int currentStep = 0;
    bool cancelRequested = false;

    std::function<void(const StepStats&)> stepCallback;
};
