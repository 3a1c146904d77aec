#include "config/SimulationConfig.h"
#include "core/Errors.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace {

void require(bool ok, const std::string& message) {
    if (!ok) {
        throw ConfigurationError(message);
    }
}

std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

} // namespace

void SimulationConfig::validate() const {
    // Every check is phrased so that NaN fails it.
    require(mapWidthKm > 0.0 && mapHeightKm > 0.0,
        "map bounds must be positive (got " + std::to_string(mapWidthKm) +
        " x " + std::to_string(mapHeightKm) + " km)");
    require(steps > 0, "step count must be positive (got " + std::to_string(steps) + ")");
    require(timeStepHours > 0.0, "time step must be positive");
    require(droneCount > 0, "drone count must be positive (got " + std::to_string(droneCount) + ")");
    require(droneScanRadiusKm > 0.0, "drone scan radius must be positive");

    require(orbitRadiusKm >= 0.0 && orbitRadiusStaggerKm >= 0.0,
        "orbit radius and stagger must not be negative");
    require(forwardDistanceKm >= 0.0 && forwardStaggerKm >= 0.0,
        "forward distance and stagger must not be negative");
    require(orbitAngularRateRadPerHour >= 0.0, "orbit angular rate must not be negative");

    require(systemSpeedKmh >= 0.0, "catching system speed must not be negative");
    require(systemMaxTurnDeg >= 0.0, "catching system turn limit must not be negative");
    require(systemTurnWindowHours > 0.0, "catching system turn window must be positive");
    require(systemSpanKm > 0.0, "catching system span must be positive");

    require(windSpeedKmh >= 0.0, "wind speed must not be negative");

    require(particles.cellSizeKm > 0.0, "grid cell size must be positive");
    require(particles.clusterCount >= 0, "cluster count must not be negative");
    require(particles.baseNoise >= 0.0, "base noise must not be negative");
    require(particles.clusterStrengthMin >= 0.0 &&
        particles.clusterStrengthMin <= particles.clusterStrengthMax,
        "cluster strength range is invalid");
    require(particles.clusterRadiusMinKm > 0.0 &&
        particles.clusterRadiusMinKm <= particles.clusterRadiusMaxKm,
        "cluster radius range is invalid");
}

const char* toString(DronePatternKind pattern) {
    switch (pattern) {
    case DronePatternKind::Circular:  return "circular";
    case DronePatternKind::Lawnmower: return "lawnmower";
    }
    return "unknown";
}

DronePatternKind parsePattern(const std::string& text) {
    const std::string v = toLower(text);
    if (v == "circular") return DronePatternKind::Circular;
    if (v == "lawnmower") return DronePatternKind::Lawnmower;
    throw ConfigurationError("unknown drone pattern '" + text +
        "' (expected circular or lawnmower)");
}

std::uint64_t parseSeed(const std::string& text) {
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(),
            [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ConfigurationError("malformed seed '" + text + "'");
    }

    std::uint64_t value = 0;
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    for (char c : text) {
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (max - digit) / 10) {
            throw ConfigurationError("seed '" + text + "' is out of range");
        }
        value = value * 10 + digit;
    }
    return value;
}
