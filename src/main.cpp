// =============================================================================
// Ocean Sweep Simulator
//
// Drones search a drifting field of floating particles and report what they
// see; a slow catching system steers toward the densest reports and removes
// what it reaches. Runs to completion and writes the trajectory log for the
// rendering tools.
// =============================================================================

#include "config/SimulationConfig.h"
#include "core/Errors.h"
#include "core/SimulationEngine.h"
#include "export/RunLogWriter.h"
#include "strategy/StrategyCatalog.h"
#include "util/Logger.h"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void printUsage() {
    std::cout << "oceansweep usage:\n"
              << "  oceansweep --pattern <circular|lawnmower> [--strategy name] [--seed n]\n"
              << "             [--steps n] [--drones n] [--width km] [--height km]\n"
              << "             [--clusters n] [--noise v] [--out dir] [--verbose]\n"
              << "  oceansweep --list-strategies\n";
}

void listStrategies(const StrategyCatalog& catalog) {
    for (const auto& name : catalog.list()) {
        const Strategy& s = catalog.lookup(name);
        std::cout << name << (name == StrategyCatalog::DEFAULT_NAME ? " (default)" : "") << "\n";
        for (const auto& kv : s.fields) {
            std::cout << "  " << kv.first << ": " << kv.second << "\n";
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    SimulationConfig config;
    std::string outDir = "output";
    bool patternSet = false;

    const StrategyCatalog catalog;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw ConfigurationError("missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--pattern") {
                config.pattern = parsePattern(next());
                patternSet = true;
            } else if (arg == "--strategy") {
                config.strategyName = next();
            } else if (arg == "--seed") {
                config.seed = parseSeed(next());
            } else if (arg == "--steps") {
                config.steps = std::stoi(next());
            } else if (arg == "--drones") {
                config.droneCount = std::stoi(next());
            } else if (arg == "--width") {
                config.mapWidthKm = std::stod(next());
            } else if (arg == "--height") {
                config.mapHeightKm = std::stod(next());
            } else if (arg == "--clusters") {
                config.particles.clusterCount = std::stoi(next());
            } else if (arg == "--noise") {
                config.particles.baseNoise = std::stod(next());
            } else if (arg == "--out") {
                outDir = next();
            } else if (arg == "--verbose") {
                Log::enabled = true;
            } else if (arg == "--list-strategies") {
                listStrategies(catalog);
                return 0;
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                printUsage();
                return 2;
            }
        }

        if (!patternSet) {
            printUsage();
            return 2;
        }

        SimulationEngine engine(config, catalog);
        const RunLog& log = engine.run();

        RunLogWriter::writeAll(outDir, log);

        std::cout << "Run " << RunLogWriter::runName(log) << " " << toString(engine.getState()) << "\n";
        std::cout << "Seed: " << log.seed << (log.seedGenerated ? " (generated)" : "") << "\n";
        std::cout << "Total particles detected: " << log.particlesDetected << "\n";
        std::cout << "Total particles processed: " << log.particlesProcessed << "\n";
        std::cout << "Efficiency: " << log.efficiency() << "\n";
        std::cout << "Output written to: " << outDir << "\n";
    }
    catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: not a number (" << e.what() << ")\n";
        return 2;
    }
    catch (const std::out_of_range& e) {
        std::cerr << "Configuration error: value out of range (" << e.what() << ")\n";
        return 2;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
