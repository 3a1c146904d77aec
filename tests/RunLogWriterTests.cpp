// tests/RunLogWriterTests.cpp
//
// Run log output: file naming, CSV layout, summary contents.

#include "core/SimulationEngine.h"
#include "export/RunLogWriter.h"
#include "strategy/StrategyCatalog.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ============================================================================
//                           HELPER FUNCTIONS
// ============================================================================

static std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

static RunLog lawnmowerLog() {
    const StrategyCatalog catalog;
    SimulationConfig cfg;
    cfg.pattern = DronePatternKind::Lawnmower;
    cfg.strategyName = "1:5 Ratio";
    cfg.seed = 12345;
    cfg.steps = 10;

    SimulationEngine engine(cfg, catalog);
    return engine.run();
}

// ============================================================================
//                               TESTS
// ============================================================================

static void test_run_name() {
    std::cout << "\n[TEST] run_name\n";

    const RunLog log = lawnmowerLog();
    assert(RunLogWriter::runName(log) == "simulation_lawnmower_1-5_Ratio_H1732_V866_seed12345");

    RunLog circular;
    circular.pattern = "circular";
    circular.seed = 7;
    assert(RunLogWriter::runName(circular) == "simulation_circular_seed7");

    std::cout << "  -> OK\n";
}

static void test_trajectory_csv() {
    std::cout << "\n[TEST] trajectory_csv\n";

    const RunLog log = lawnmowerLog();
    std::ostringstream out;
    RunLogWriter::writeTrajectoryCsv(out, log);

    const auto rows = lines(out.str());
    assert(rows.size() == log.trajectory.size() + 1);
    assert(rows[0] == "step_index,actor_id,x_km,y_km,heading_deg");
    assert(rows[1].rfind("1,0,", 0) == 0);      // step 1, catching system
    assert(rows[2].rfind("1,1,", 0) == 0);
    assert(rows.back().rfind("10,2,", 0) == 0);

    std::cout << "  -> OK, " << rows.size() - 1 << " rows\n";
}

static void test_step_stats_csv() {
    std::cout << "\n[TEST] step_stats_csv\n";

    const RunLog log = lawnmowerLog();
    std::ostringstream out;
    RunLogWriter::writeStepStatsCsv(out, log);

    const auto rows = lines(out.str());
    assert(rows.size() == 11);
    assert(rows[0] == "step_index,particles_detected,particles_processed,"
        "cumulative_detected,cumulative_processed,system_density,"
        "drone_0_density,drone_1_density");
    assert(rows[1].rfind("1,", 0) == 0);

    std::cout << "  -> OK\n";
}

static void test_summary() {
    std::cout << "\n[TEST] summary\n";

    const RunLog log = lawnmowerLog();
    std::ostringstream out;
    RunLogWriter::writeSummary(out, log);
    const std::string text = out.str();
    const auto rows = lines(text);

    assert(rows.size() > 3);
    assert(rows[0].rfind("particles_detected: ", 0) == 0);
    assert(rows[1].rfind("particles_processed: ", 0) == 0);
    assert(rows[2].rfind("efficiency: ", 0) == 0);

    assert(text.find("pattern: lawnmower\n") != std::string::npos);
    assert(text.find("strategy: 1:5 Ratio\n") != std::string::npos);
    assert(text.find("seed: 12345\n") != std::string::npos);
    assert(text.find("steps: 10 / 10\n") != std::string::npos);
    assert(text.find("strategy.Area (km²): 300,000\n") != std::string::npos);
    assert(text.find("strategy.Total distance traveled (km): 1,000,058\n") != std::string::npos);
    assert(text.find("distance_km.catching-system: ") != std::string::npos);
    assert(text.find("distance_km.drone-1: ") != std::string::npos);

    std::cout << "  -> OK\n";
}

static void test_efficiency_bounds() {
    std::cout << "\n[TEST] efficiency_bounds\n";

    RunLog log;
    assert(log.efficiency() == 0.0);

    log.particlesDetected = 4.0;
    log.particlesProcessed = 1.0;
    assert(log.efficiency() == 0.25);

    log.particlesProcessed = 5.0;
    assert(log.efficiency() == 1.0);

    std::cout << "  -> OK\n";
}

static void test_write_all() {
    std::cout << "\n[TEST] write_all\n";

    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "oceansweep_writer_test";
    fs::remove_all(dir);

    const RunLog log = lawnmowerLog();
    RunLogWriter::writeAll(dir.string(), log);

    const std::string name = RunLogWriter::runName(log);
    for (const char* suffix : { "_trajectory.csv", "_steps.csv", "_summary.txt" }) {
        const fs::path p = dir / (name + suffix);
        assert(fs::exists(p));
        assert(fs::file_size(p) > 0);
    }

    // A plain file where the directory should be.
    const fs::path blocker = dir / "blocker";
    std::ofstream(blocker) << "x";
    bool threw = false;
    try {
        RunLogWriter::writeAll((blocker / "out").string(), log);
    }
    catch (const std::runtime_error& e) {
        threw = true;
        std::cout << "  rejected: " << e.what() << "\n";
    }
    assert(threw);

    fs::remove_all(dir);
    std::cout << "  -> OK\n";
}

int main(int argc, char* argv[]) {
    std::cout << "========================================\n";
    std::cout << "  Run Log Writer Test Suite\n";
    std::cout << "========================================\n";

    bool runAll = (argc == 1);
    std::string testName = (argc > 1) ? argv[1] : "";

    if (runAll || testName == "name") test_run_name();
    if (runAll || testName == "trajectory") test_trajectory_csv();
    if (runAll || testName == "steps") test_step_stats_csv();
    if (runAll || testName == "summary") test_summary();
    if (runAll || testName == "efficiency") test_efficiency_bounds();
    if (runAll || testName == "write") test_write_all();

    std::cout << "\n========================================\n";
    std::cout << "  All requested tests completed!\n";
    std::cout << "========================================\n";

    return 0;
}
