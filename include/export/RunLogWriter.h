#pragma once
#include <ostream>
#include <string>

#include "core/RunLog.h"

// Turns a finished run into the files the rendering and report tools read.
namespace RunLogWriter {

    // simulation_<pattern>[_<strategy>_H<h>_V<v>]_seed<seed>
    std::string runName(const RunLog& log);

    // step_index,actor_id,x_km,y_km,heading_deg
    void writeTrajectoryCsv(std::ostream& out, const RunLog& log);

    // One row per step with detected/processed totals and per-drone densities.
    void writeStepStatsCsv(std::ostream& out, const RunLog& log);

    // key: value lines, aggregates first.
    void writeSummary(std::ostream& out, const RunLog& log);

    // Writes <dir>/<runName>_{trajectory.csv,steps.csv,summary.txt}, creating
    // `dir` if needed. Throws std::runtime_error if a file cannot be written.
    void writeAll(const std::string& dir, const RunLog& log);

}
