#include "core/RunLog.h"

#include <algorithm>

double RunLog::efficiency() const {
    if (!(particlesDetected > 0.0)) return 0.0;
    return std::clamp(particlesProcessed / particlesDetected, 0.0, 1.0);
}

std::vector<TrajectoryEntry> RunLog::trajectoryFor(int actorId) const {
    std::vector<TrajectoryEntry> out;
    for (const auto& e : trajectory) {
        if (e.actorId == actorId) out.push_back(e);
    }
    return out;
}
