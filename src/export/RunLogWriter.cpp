#include "export/RunLogWriter.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace RunLogWriter {

    namespace {

        std::string sanitize(std::string name) {
            for (auto& c : name) {
                if (c == ':') c = '-';
                else if (c == ' ') c = '_';
            }
            return name;
        }

        void writeFile(const std::filesystem::path& path,
            void (*writer)(std::ostream&, const RunLog&),
            const RunLog& log)
        {
            std::ofstream out(path);
            if (!out) {
                throw std::runtime_error("RunLogWriter: cannot open " + path.string());
            }
            writer(out, log);
            out.flush();
            if (!out) {
                throw std::runtime_error("RunLogWriter: failed writing " + path.string());
            }
        }

    } // namespace

    std::string runName(const RunLog& log) {
        std::string name = "simulation_" + log.pattern;

        if (!log.strategyName.empty()) {
            name += "_" + sanitize(log.strategyName);
            if (log.strategy) {
                name += "_H" + log.strategy->field(StrategyFields::H) +
                    "_V" + log.strategy->field(StrategyFields::V);
            }
        }

        name += "_seed" + std::to_string(log.seed);
        return name;
    }

    void writeTrajectoryCsv(std::ostream& out, const RunLog& log) {
        out << "step_index,actor_id,x_km,y_km,heading_deg\n";
        out << std::setprecision(10);
        for (const auto& e : log.trajectory) {
            out << e.stepIndex << ',' << e.actorId << ','
                << e.xKm << ',' << e.yKm << ',' << e.headingDeg << '\n';
        }
    }

    void writeStepStatsCsv(std::ostream& out, const RunLog& log) {
        out << "step_index,particles_detected,particles_processed,"
            << "cumulative_detected,cumulative_processed,system_density";
        const std::size_t droneCount = log.actors.empty() ? 0 : log.actors.size() - 1;
        for (std::size_t i = 0; i < droneCount; ++i) {
            out << ",drone_" << i << "_density";
        }
        out << '\n';

        out << std::setprecision(10);
        for (const auto& s : log.steps) {
            out << s.stepIndex << ',' << s.particlesDetected << ',' << s.particlesProcessed << ','
                << s.cumulativeDetected << ',' << s.cumulativeProcessed << ',' << s.systemDensity;
            for (double d : s.droneDensities) {
                out << ',' << d;
            }
            out << '\n';
        }
    }

    void writeSummary(std::ostream& out, const RunLog& log) {
        out << std::setprecision(10);
        out << "particles_detected: " << log.particlesDetected << '\n';
        out << "particles_processed: " << log.particlesProcessed << '\n';
        out << "efficiency: " << log.efficiency() << '\n';

        out << "pattern: " << log.pattern << '\n';
        out << "strategy: " << (log.strategyName.empty() ? "-" : log.strategyName) << '\n';
        out << "seed: " << log.seed << (log.seedGenerated ? " (generated)" : "") << '\n';
        out << "steps: " << log.completedSteps << " / " << log.requestedSteps
            << (log.cancelled ? " (cancelled)" : "") << '\n';
        out << "time_step_hours: " << log.timeStepHours << '\n';
        out << "map_km: " << log.mapWidthKm << " x " << log.mapHeightKm << '\n';

        if (log.strategy) {
            // Published estimates, verbatim, for comparison with the flown distance.
            for (const auto& kv : log.strategy->fields) {
                out << "strategy." << kv.first << ": " << kv.second << '\n';
            }
        }

        for (const auto& a : log.actors) {
            out << "distance_km." << a.name << ": " << a.distanceTraveledKm << '\n';
        }
    }

    void writeAll(const std::string& dir, const RunLog& log) {
        const std::filesystem::path base(dir);
        std::error_code ec;
        std::filesystem::create_directories(base, ec);
        if (ec) {
            throw std::runtime_error("RunLogWriter: cannot create " + dir + ": " + ec.message());
        }

        const std::string name = runName(log);
        writeFile(base / (name + "_trajectory.csv"), &writeTrajectoryCsv, log);
        writeFile(base / (name + "_steps.csv"), &writeStepStatsCsv, log);
        writeFile(base / (name + "_summary.txt"), &writeSummary, log);
    }

}
