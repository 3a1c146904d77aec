#include "ocean/OceanField.h"
#include "core/Actor.h"
#include "core/Errors.h"
#include "util/Logger.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {

// Sub-samples per axis used to estimate how much of a cell a disc covers.
constexpr int OVERLAP_SAMPLES = 8;

struct Cluster {
    Vec2 center;
    double radiusKm;
    double strength;
};

} // namespace

Vec2 WindVector::velocityKmh() const {
    return headingVector(directionDeg) * speedKmh;
}

void OceanField::initialize(const MapBounds& mapBounds,
    std::uint64_t seed,
    int clusterCount,
    double baseNoise)
{
    ParticleDensitySettings settings;
    settings.clusterCount = clusterCount;
    settings.baseNoise = baseNoise;

    Rng rng(seed);
    initialize(mapBounds, rng, settings);
}

void OceanField::initialize(const MapBounds& mapBounds,
    Rng& rng,
    const ParticleDensitySettings& settings)
{
    if (!(mapBounds.widthKm > 0.0) || !(mapBounds.heightKm > 0.0)) {
        throw ConfigurationError("OceanField: map bounds must be positive");
    }
    if (!(settings.cellSizeKm > 0.0)) {
        throw ConfigurationError("OceanField: cell size must be positive");
    }
    if (settings.clusterCount < 0 || settings.baseNoise < 0.0) {
        throw ConfigurationError("OceanField: cluster count and noise must not be negative");
    }

    bounds = mapBounds;
    cellSizeKm = settings.cellSizeKm;
    cols = std::max(1, static_cast<int>(std::ceil(bounds.widthKm / cellSizeKm)));
    rows = std::max(1, static_cast<int>(std::ceil(bounds.heightKm / cellSizeKm)));
    cells.assign(static_cast<std::size_t>(cols) * rows, 0.0);

    // Draw every cluster before any noise so the layout depends only on the seed
    // and the counts, not on grid resolution.
    std::vector<Cluster> clusters;
    clusters.reserve(settings.clusterCount);
    for (int i = 0; i < settings.clusterCount; ++i) {
        Cluster c;
        c.center = Vec2(uniformReal(rng, 0.0, bounds.widthKm),
            uniformReal(rng, 0.0, bounds.heightKm));
        c.radiusKm = uniformReal(rng, settings.clusterRadiusMinKm, settings.clusterRadiusMaxKm);
        c.strength = uniformReal(rng, settings.clusterStrengthMin, settings.clusterStrengthMax);
        clusters.push_back(c);
    }

    for (int iy = 0; iy < rows; ++iy) {
        for (int ix = 0; ix < cols; ++ix) {
            double mass = settings.baseNoise > 0.0
                ? uniformReal(rng, 0.0, settings.baseNoise)
                : 0.0;

            const Vec2 centre((ix + 0.5) * cellSizeKm, (iy + 0.5) * cellSizeKm);
            for (const auto& c : clusters) {
                const Vec2 d = centre - c.center;
                const double dist2 = glm::dot(d, d);
                const double reach = 3.0 * c.radiusKm;
                // Gaussian falloff, cut off at three radii
                if (dist2 < reach * reach) {
                    mass += c.strength * std::exp(-dist2 / (2.0 * c.radiusKm * c.radiusKm));
                }
            }

            cells[indexOf(ix, iy)] = mass;
        }
    }

    Log::config("[OCEAN] ", cols, "x", rows, " cells of ", cellSizeKm, " km, ",
        settings.clusterCount, " clusters, total mass ", totalMass(), "\n");
}

void OceanField::drift(const WindVector& wind, double dtHours) {
    if (cells.empty() || !(dtHours > 0.0)) return;

    const Vec2 v = wind.velocityKmh();

    auto shift = [this](double fraction, int dx, int dy) {
        if (!(fraction > 0.0)) return;
        fraction = std::min(1.0, fraction);

        std::vector<double> next(cells.size(), 0.0);
        for (int iy = 0; iy < rows; ++iy) {
            for (int ix = 0; ix < cols; ++ix) {
                const std::size_t i = indexOf(ix, iy);
                const int tx = ix + dx;
                const int ty = iy + dy;

                if (tx < 0 || tx >= cols || ty < 0 || ty >= rows) {
                    next[i] += cells[i];   // edge retains its mass
                    continue;
                }

                const double out = cells[i] * fraction;
                next[i] += cells[i] - out;
                next[indexOf(tx, ty)] += out;
            }
        }
        cells.swap(next);
    };

    shift(std::abs(v.x) * dtHours / cellSizeKm, v.x > 0.0 ? 1 : -1, 0);
    shift(std::abs(v.y) * dtHours / cellSizeKm, 0, v.y > 0.0 ? 1 : -1);
}

double OceanField::sampleDensity(const Vec2& point, double radiusKm) const {
    double total = 0.0;
    for (const auto& cw : footprint(point, radiusKm)) {
        total += cw.weight * cells[cw.index];
    }
    return total;
}

double OceanField::removeDensity(const Vec2& point, double radiusKm, double amount) {
    if (!(amount > 0.0)) return 0.0;

    const auto fp = footprint(point, radiusKm);

    double available = 0.0;
    for (const auto& cw : fp) {
        available += cw.weight * cells[cw.index];
    }
    if (!(available > 0.0)) {
        Log::underflow("[UNDERFLOW] requested ", amount, " at (", point.x, ", ",
            point.y, ") but no mass present\n");
        return 0.0;
    }

    const double target = std::min(amount, available);
    if (amount > available) {
        Log::underflow("[UNDERFLOW] requested ", amount, " at (", point.x, ", ",
            point.y, "), only ", available, " present\n");
    }

    double removed = 0.0;
    for (const auto& cw : fp) {
        double& mass = cells[cw.index];
        const double share = cw.weight * mass / available;
        const double take = std::min(mass, target * share);
        mass = std::max(0.0, mass - take);
        removed += take;
    }
    return removed;
}

double OceanField::totalMass() const {
    return std::accumulate(cells.begin(), cells.end(), 0.0);
}

double OceanField::cellMass(int ix, int iy) const {
    return cells[indexOf(ix, iy)];
}

void OceanField::setCellMass(int ix, int iy, double mass) {
    cells[indexOf(ix, iy)] = std::max(0.0, mass);
}

double OceanField::minCellMass() const {
    if (cells.empty()) return 0.0;
    return *std::min_element(cells.begin(), cells.end());
}

std::size_t OceanField::indexOf(int ix, int iy) const {
    return static_cast<std::size_t>(iy) * cols + ix;
}

std::vector<OceanField::CellWeight> OceanField::footprint(const Vec2& point, double radiusKm) const {
    std::vector<CellWeight> out;
    if (cells.empty() || !(radiusKm > 0.0)) return out;

    const int x0 = std::max(0, static_cast<int>(std::floor((point.x - radiusKm) / cellSizeKm)));
    const int x1 = std::min(cols - 1, static_cast<int>(std::floor((point.x + radiusKm) / cellSizeKm)));
    const int y0 = std::max(0, static_cast<int>(std::floor((point.y - radiusKm) / cellSizeKm)));
    const int y1 = std::min(rows - 1, static_cast<int>(std::floor((point.y + radiusKm) / cellSizeKm)));

    const double r2 = radiusKm * radiusKm;
    const double sub = cellSizeKm / OVERLAP_SAMPLES;

    for (int iy = y0; iy <= y1; ++iy) {
        for (int ix = x0; ix <= x1; ++ix) {
            const double left = ix * cellSizeKm;
            const double bottom = iy * cellSizeKm;

            // Nearest and farthest points of the cell from the disc centre.
            const double nx = glm::clamp(point.x, left, left + cellSizeKm) - point.x;
            const double ny = glm::clamp(point.y, bottom, bottom + cellSizeKm) - point.y;
            if (nx * nx + ny * ny > r2) continue;

            const double fx = std::max(std::abs(point.x - left), std::abs(point.x - left - cellSizeKm));
            const double fy = std::max(std::abs(point.y - bottom), std::abs(point.y - bottom - cellSizeKm));

            double weight = 1.0;
            if (fx * fx + fy * fy > r2) {
                int inside = 0;
                for (int sy = 0; sy < OVERLAP_SAMPLES; ++sy) {
                    for (int sx = 0; sx < OVERLAP_SAMPLES; ++sx) {
                        const double px = left + (sx + 0.5) * sub - point.x;
                        const double py = bottom + (sy + 0.5) * sub - point.y;
                        if (px * px + py * py <= r2) ++inside;
                    }
                }
                weight = static_cast<double>(inside) / (OVERLAP_SAMPLES * OVERLAP_SAMPLES);
            }

            if (weight > 0.0) {
                out.push_back(CellWeight{ indexOf(ix, iy), weight });
            }
        }
    }
    return out;
}
