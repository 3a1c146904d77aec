#pragma once
#include <string>
#include <utility>
#include <vector>

// Published field labels. Presentation code displays these verbatim, so they
// and the matching text values must never be reformatted.
namespace StrategyFields {
    inline const std::string AREA = "Area (km²)";
    inline const std::string KW = "Kw (%)";
    inline const std::string KP = "Kp (%)";
    inline const std::string H = "H (km)";
    inline const std::string V = "V (km)";
    inline const std::string TOTAL_DISTANCE = "Total distance traveled (km)";
    inline const std::string SPEED = "Drone speed (km/h)";
    inline const std::string TIME_HOURS = "Time needed for the scan (h)";
    inline const std::string TIME_DAYS = "Time needed for scan (days)";
    inline const std::string TIME_MINUTES = "Time needed for scan (min)";
}

// One lawnmower scan geometry. Numeric members drive the sweep and
// estimates; `fields` keeps the published text of every column in table order.
struct Strategy {
    std::string name;

    double areaKm2 = 0.0;
    double kwPercent = 0.0;         // width-coverage ratio
    double kpPercent = 0.0;         // pass-overlap ratio
    double hKm = 0.0;               // row width
    double vKm = 0.0;               // row spacing
    double totalDistanceKm = 0.0;
    double speedKmh = 0.0;
    double timeHours = 0.0;
    double timeDays = 0.0;
    double timeMinutes = 0.0;

    std::vector<std::pair<std::string, std::string>> fields;

    // Published text for a label, or empty if the label is unknown.
    std::string field(const std::string& label) const;
};

// Named strategies in publication order. Built once and handed to whatever
// needs it; entries never change after construction.
class StrategyCatalog {
public:
    static constexpr const char* DEFAULT_NAME = "1:5 Ratio";

    // The published table.
    StrategyCatalog();

    // Throws ConfigurationError for unknown names.
    const Strategy& lookup(const std::string& name) const;

    const Strategy& defaultStrategy() const;

    // All names in insertion order.
    std::vector<std::string> list() const;

    bool contains(const std::string& name) const;
    std::size_t size() const { return entries.size(); }

private:
    std::vector<Strategy> entries;
};
