#include "core/CatchingSystem.h"
#include "ocean/OceanField.h"

#include <algorithm>

CatchingSystem::CatchingSystem(const Vec2& start,
    double headingDeg,
    double speedKmh,
    double maxTurnDegPerHour,
    double spanKm)
    : maxTurnDegPerHour(maxTurnDegPerHour),
    spanKm(spanKm)
{
    actor.position = start;
    actor.headingDeg = normalizeDeg(headingDeg);
    actor.speedKmh = speedKmh;
}

std::optional<std::size_t> CatchingSystem::selectTarget(const std::vector<DensityReport>& reports,
    const Vec2& from)
{
    if (reports.empty()) return std::nullopt;

    std::size_t best = 0;
    double bestDist = glm::length(reports[0].position - from);

    // Strict comparisons keep the earliest report on a full tie.
    for (std::size_t i = 1; i < reports.size(); ++i) {
        const double dist = glm::length(reports[i].position - from);
        if (reports[i].density > reports[best].density ||
            (reports[i].density == reports[best].density && dist < bestDist)) {
            best = i;
            bestDist = dist;
        }
    }
    return best;
}

CatchOutcome CatchingSystem::step(double dtHours,
    const std::vector<DensityReport>& recentReports,
    OceanField& ocean,
    const MapBounds& bounds)
{
    CatchOutcome outcome;

    auto chosen = selectTarget(recentReports, actor.position);
    if (chosen) {
        outcome.hadTarget = true;
        outcome.target = recentReports[*chosen];
        lastTarget = outcome.target;

        // Turn toward the target, no more than the rate limit allows.
        const double maxTurn = maxTurnDegPerHour * dtHours;
        const double wanted = wrapDeg180(bearingDeg(actor.position, outcome.target.position) - actor.headingDeg);
        const double turn = std::clamp(wanted, -maxTurn, maxTurn);
        actor.headingDeg = normalizeDeg(actor.headingDeg + turn);
    }

    actor.moveWithin(actor.projected(dtHours), bounds, "catching system", 0);

    if (!outcome.hadTarget) {
        return outcome;
    }

    const double reach = spanKm * 0.5;
    if (glm::length(outcome.target.position - actor.position) <= reach) {
        outcome.inRange = true;
        outcome.requested = outcome.target.density;
        outcome.removed = ocean.removeDensity(actor.position, reach, outcome.target.density);
        totalProcessed += outcome.removed;
    }
    return outcome;
}
