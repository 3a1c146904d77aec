#pragma once
#include "config/SimulationConfig.h"
#include "core/RNG.h"
#include "core/Types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

// Surface drift. Direction is the compass heading the water moves toward.
struct WindVector {
    double directionDeg = 0.0;
    double speedKmh = 0.0;

    Vec2 velocityKmh() const;
};

// Particle mass on a regular grid covering the map. Cell (ix, iy) spans
// [ix * cell, (ix + 1) * cell) x [iy * cell, (iy + 1) * cell) and its mass is
// spread uniformly over that square. Mass is never negative and only
// removeDensity() changes the total.
class OceanField {
public:
    OceanField() = default;

    // Seeds a private generator from `seed`; default cluster shapes.
    void initialize(const MapBounds& bounds,
        std::uint64_t seed,
        int clusterCount,
        double baseNoise);

    // Draws from the caller's generator. Throws ConfigurationError for
    // non-positive bounds or cell size, negative counts or noise.
    void initialize(const MapBounds& bounds,
        Rng& rng,
        const ParticleDensitySettings& settings);

    // Upwind transfer to the neighbouring cell along each axis. Boundary cells
    // keep whatever would have left the grid.
    void drift(const WindVector& wind, double dtHours);

    // Mass inside the disc, weighting each cell by its overlap with it.
    double sampleDensity(const Vec2& point, double radiusKm) const;

    // Removes up to `amount` from the disc, each cell giving in proportion to
    // its share of the sampled total. Returns the mass actually removed.
    double removeDensity(const Vec2& point, double radiusKm, double amount);

    double totalMass() const;

    bool isInitialized() const { return !cells.empty(); }
    const MapBounds& getBounds() const { return bounds; }
    double getCellSizeKm() const { return cellSizeKm; }
    int getColumns() const { return cols; }
    int getRows() const { return rows; }

    double cellMass(int ix, int iy) const;
    void setCellMass(int ix, int iy, double mass);
    double minCellMass() const;

private:
    struct CellWeight {
        std::size_t index;
        double weight;     // fraction of the cell inside the disc
    };

    std::vector<CellWeight> footprint(const Vec2& point, double radiusKm) const;
    std::size_t indexOf(int ix, int iy) const;

    MapBounds bounds;
    double cellSizeKm = 1.0;
    int cols = 0;
    int rows = 0;
    std::vector<double> cells;   // row-major, iy * cols + ix
};
