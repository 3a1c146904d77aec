#include "strategy/StrategyCatalog.h"
#include "core/Errors.h"

#include <algorithm>

namespace {

// Text columns are stored exactly as published; numbers are parsed from them
// once, here, so the two can never disagree.
struct Row {
    const char* name;
    const char* area;
    const char* kw;
    const char* kp;
    const char* h;
    const char* v;
    const char* totalDistance;
    const char* speed;
    const char* timeHours;
    const char* timeDays;
    const char* timeMinutes;
};

const Row PUBLISHED_TABLE[] = {
    { "1:1 Ratio",  "1,000,000", "100%", "100%", "1000", "1000", "1,000,000", "100", "10000", "416.7", "600000" },
    { "1:2 Ratio",  "750,000",   "75%",  "100%", "866",  "866",  "1,299,000", "100", "12990", "541.3", "779400" },
    { "1:3 Ratio",  "500,000",   "50%",  "75%",  "1732", "866",  "1,000,058", "100", "10000", "416.7", "600000" },
    { "1:5 Ratio",  "300,000",   "30%",  "38%",  "1732", "866",  "1,000,058", "100", "10000", "416.7", "600000" },
    { "1:10 Ratio", "150,000",   "15%",  "20%",  "1732", "866",  "1,000,058", "100", "10000", "416.7", "600000" },
    { "1:15 Ratio", "100,000",   "10%",  "13%",  "1732", "866",  "1,000,058", "100", "10000", "416.7", "600000" },
    { "1:20 Ratio", "75,000",    "8%",   "10%",  "1732", "866",  "1,000,058", "100", "10000", "416.7", "600000" },
};

// "1,000,058" -> 1000058, "38%" -> 38, "416.7" -> 416.7
double parsePublished(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (c != ',' && c != '%') digits.push_back(c);
    }
    return std::stod(digits);
}

Strategy makeStrategy(const Row& row) {
    Strategy s;
    s.name = row.name;
    s.fields = {
        { StrategyFields::AREA, row.area },
        { StrategyFields::KW, row.kw },
        { StrategyFields::KP, row.kp },
        { StrategyFields::H, row.h },
        { StrategyFields::V, row.v },
        { StrategyFields::TOTAL_DISTANCE, row.totalDistance },
        { StrategyFields::SPEED, row.speed },
        { StrategyFields::TIME_HOURS, row.timeHours },
        { StrategyFields::TIME_DAYS, row.timeDays },
        { StrategyFields::TIME_MINUTES, row.timeMinutes },
    };

    s.areaKm2 = parsePublished(row.area);
    s.kwPercent = parsePublished(row.kw);
    s.kpPercent = parsePublished(row.kp);
    s.hKm = parsePublished(row.h);
    s.vKm = parsePublished(row.v);
    s.totalDistanceKm = parsePublished(row.totalDistance);
    s.speedKmh = parsePublished(row.speed);
    s.timeHours = parsePublished(row.timeHours);
    s.timeDays = parsePublished(row.timeDays);
    s.timeMinutes = parsePublished(row.timeMinutes);
    return s;
}

} // namespace

std::string Strategy::field(const std::string& label) const {
    for (const auto& kv : fields) {
        if (kv.first == label) return kv.second;
    }
    return {};
}

StrategyCatalog::StrategyCatalog() {
    for (const auto& row : PUBLISHED_TABLE) {
        entries.push_back(makeStrategy(row));
    }
}

const Strategy& StrategyCatalog::lookup(const std::string& name) const {
    auto it = std::find_if(entries.begin(), entries.end(),
        [&](const Strategy& s) { return s.name == name; });
    if (it == entries.end()) {
        throw ConfigurationError("unknown strategy '" + name + "'");
    }
    return *it;
}

const Strategy& StrategyCatalog::defaultStrategy() const {
    return lookup(DEFAULT_NAME);
}

std::vector<std::string> StrategyCatalog::list() const {
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& s : entries) {
        names.push_back(s.name);
    }
    return names;
}

bool StrategyCatalog::contains(const std::string& name) const {
    return std::any_of(entries.begin(), entries.end(),
        [&](const Strategy& s) { return s.name == name; });
}
