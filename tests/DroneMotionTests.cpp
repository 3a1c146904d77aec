// tests/DroneMotionTests.cpp
//
// Drone patterns: lawnmower row geometry and headings, circular orbits that
// follow the catching system, and density reports.

#include "core/Drone.h"
#include "ocean/OceanField.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <variant>

static bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

// 10 km rows, 2 km apart, flown at 4 km/h.
static Strategy smallStrategy() {
    Strategy s;
    s.name = "test";
    s.hKm = 10.0;
    s.vKm = 2.0;
    s.speedKmh = 4.0;
    return s;
}

static void test_lawnmower_row_geometry() {
    std::cout << "\n[TEST] lawnmower_row_geometry\n";

    const MapBounds bounds{ 1000.0, 1000.0 };
    const Strategy s = smallStrategy();
    Drone d = Drone::lawnmower(0, Vec2(100.0, 100.0), 0.3, s, 1, 1);
    assert(d.getKind() == DronePatternKind::Lawnmower);
    assert(d.getHeadingDeg() == 90.0);

    double minX = 100.0, maxX = 100.0;
    std::map<int, double> rowY;

    // 2 km per step, 12 km per row plus transfer: ten rows.
    for (int i = 0; i < 60; ++i) {
        d.step(0.5, Actor{}, bounds);

        const auto& l = std::get<LawnmowerPattern>(d.getPattern());
        const Vec2 p = d.getPosition();
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);

        if (!l.inTransfer) {
            assert(near(p.y, 100.0 + 2.0 * l.rowIndex));
            rowY[l.rowIndex] = p.y;
            assert(d.getHeadingDeg() == (l.rowIndex % 2 == 0 ? 90.0 : 270.0));
        }
        else {
            assert(near(p.x, l.rowIndex % 2 == 0 ? 110.0 : 100.0));
            assert(d.getHeadingDeg() == 0.0);
        }
    }

    assert(near(maxX - minX, s.hKm));
    assert(rowY.size() >= 9);
    for (auto it = std::next(rowY.begin()); it != rowY.end(); ++it) {
        assert(near(it->second - std::prev(it)->second, s.vKm));
    }
    // Every step ends on a leg boundary or inside one leg, so no corner is cut.
    assert(near(d.getActor().distanceTraveledKm, 120.0, 1e-6));

    std::cout << "  -> OK, " << rowY.size() << " rows, width " << (maxX - minX) << "\n";
}

static void test_lawnmower_direction_flags() {
    std::cout << "\n[TEST] lawnmower_direction_flags\n";

    const MapBounds bounds{ 1000.0, 1000.0 };
    Drone d = Drone::lawnmower(1, Vec2(500.0, 500.0), 0.3, smallStrategy(), -1, -1);

    d.step(0.5, Actor{}, bounds);
    assert(near(d.getPosition().x, 498.0));
    assert(near(d.getPosition().y, 500.0));
    assert(d.getHeadingDeg() == 270.0);

    // End of the first row: the transfer heads south.
    for (int i = 0; i < 4; ++i) d.step(0.5, Actor{}, bounds);
    assert(near(d.getPosition().x, 490.0));
    assert(near(d.getPosition().y, 500.0));
    assert(d.getHeadingDeg() == 180.0);

    // Second row starts V further south and runs back east.
    d.step(0.5, Actor{}, bounds);
    assert(near(d.getPosition().x, 490.0));
    assert(near(d.getPosition().y, 498.0));
    assert(d.getHeadingDeg() == 90.0);

    std::cout << "  -> OK\n";
}

static void test_lawnmower_stays_on_map() {
    std::cout << "\n[TEST] lawnmower_stays_on_map\n";

    const StrategyCatalog catalog;
    const MapBounds bounds{ 100.0, 100.0 };
    Drone d = Drone::lawnmower(0, bounds.center(), 0.3, catalog.defaultStrategy(), 1, 1);

    d.step(0.1, Actor{}, bounds);
    assert(near(d.getPosition().x, 60.0));
    assert(near(d.getPosition().y, 50.0));

    for (int i = 0; i < 200; ++i) {
        d.step(0.1, Actor{}, bounds);
        assert(bounds.contains(d.getPosition()));
    }

    std::cout << "  -> OK, parked at (" << d.getPosition().x << ", " << d.getPosition().y << ")\n";
}

static void test_lawnmower_without_geometry_holds() {
    std::cout << "\n[TEST] lawnmower_without_geometry_holds\n";

    Strategy s;
    s.speedKmh = 50.0;
    Drone d = Drone::lawnmower(0, Vec2(5.0, 5.0), 0.3, s, 1, 1);
    d.step(0.1, Actor{}, MapBounds{ 10.0, 10.0 });
    assert(d.getPosition() == Vec2(5.0, 5.0));

    std::cout << "  -> OK\n";
}

static void test_circular_orbit() {
    std::cout << "\n[TEST] circular_orbit\n";

    const MapBounds bounds{ 100.0, 100.0 };
    Actor leader;
    leader.position = Vec2(50.0, 50.0);
    leader.headingDeg = 0.0;

    Drone d = Drone::circular(0, leader, 0.3, 2.0, 1.5, 6.0, 0.0);
    assert(d.getKind() == DronePatternKind::Circular);
    assert(near(d.getPosition().x, 50.0));
    assert(near(d.getPosition().y, 58.0));
    assert(near(d.getHeadingDeg(), 90.0));
    assert(near(d.getActor().speedKmh, 3.0));

    for (int i = 0; i < 100; ++i) {
        const double before = std::get<CircularPattern>(d.getPattern()).angleRad;
        d.step(0.1, leader, bounds);

        const auto& c = std::get<CircularPattern>(d.getPattern());
        const double advanced = std::fmod(before + 0.15, 6.283185307179586);
        assert(near(c.angleRad, advanced));

        const Vec2 centre = orbitCenter(c, leader);
        assert(near(glm::length(d.getPosition() - centre), 2.0));
    }

    std::cout << "  -> OK\n";
}

static void test_circular_follows_leader() {
    std::cout << "\n[TEST] circular_follows_leader\n";

    const MapBounds bounds{ 100.0, 100.0 };
    Actor leader;
    leader.position = Vec2(50.0, 50.0);
    leader.headingDeg = 0.0;

    Drone d = Drone::circular(0, leader, 0.3, 2.0, 1.5, 6.0, 0.0);

    // Leader turns east: the orbit centre swings ahead of it.
    leader.headingDeg = 90.0;
    d.step(0.1, leader, bounds);
    const Vec2 centre = orbitCenter(std::get<CircularPattern>(d.getPattern()), leader);
    assert(near(centre.x, 56.0));
    assert(near(centre.y, 50.0));
    assert(near(glm::length(d.getPosition() - centre), 2.0));

    std::cout << "  -> OK\n";
}

static void test_report_samples_without_changing() {
    std::cout << "\n[TEST] report_samples_without_changing\n";

    OceanField ocean;
    ocean.initialize(MapBounds{ 10.0, 10.0 }, 1, 0, 0.0);
    ocean.setCellMass(5, 5, 2.0);

    const Drone d = Drone::lawnmower(3, Vec2(5.5, 5.5), 0.3, smallStrategy(), 1, 1);
    const DensityReport r = d.report(ocean, 1.7);

    assert(r.droneId == 3);
    assert(r.position == d.getPosition());
    assert(r.timeHours == 1.7);
    assert(r.density > 0.0);
    assert(r.density == ocean.sampleDensity(d.getPosition(), d.getScanRadiusKm()));
    assert(ocean.cellMass(5, 5) == 2.0);

    std::cout << "  -> OK, density " << r.density << "\n";
}

int main(int argc, char* argv[]) {
    std::cout << "========================================\n";
    std::cout << "  Drone Motion Test Suite\n";
    std::cout << "========================================\n";

    bool runAll = (argc == 1);
    std::string testName = (argc > 1) ? argv[1] : "";

    if (runAll || testName == "rows") test_lawnmower_row_geometry();
    if (runAll || testName == "directions") test_lawnmower_direction_flags();
    if (runAll || testName == "clamp") test_lawnmower_stays_on_map();
    if (runAll || testName == "degenerate") test_lawnmower_without_geometry_holds();
    if (runAll || testName == "orbit") test_circular_orbit();
    if (runAll || testName == "follow") test_circular_follows_leader();
    if (runAll || testName == "report") test_report_samples_without_changing();

    std::cout << "\n========================================\n";
    std::cout << "  All requested tests completed!\n";
    std::cout << "========================================\n";

    return 0;
}
