#include "Retention.hpp"
#include "Types.hpp"
#include <algorithm>
#include <cmath>

namespace Retention {

double retrievability(double stability, double days_elapsed) {
    if (stability <= 0.0 || days_elapsed < 0.0) return 0.0;
    return std::exp(-days_elapsed / stability);
}

double retrievabilityAt(const Progress& p, std::time_t now) {
    if (!p.last_review_at) return 1.0;
    double elapsed = static_cast<double>(now - *p.last_review_at) / static_cast<double>(SECONDS_PER_DAY);
    // Clock went backwards relative to the last review: treat as just reviewed
    if (elapsed < 0.0) elapsed = 0.0;
    return retrievability(p.stability, elapsed);
}

const char* retentionLabel(double r) {
    if (r >= 0.95) return "mastered";
    if (r >= 0.85) return "stable";
    if (r >= 0.70) return "review_soon";
    if (r >= 0.50) return "critical";
    return "forgotten";
}

int targetIntervalDays(double stability, double target_retention, int maximum_interval) {
    if (stability <= 0.0 || target_retention <= 0.0 || target_retention >= 1.0) return 1;
    double t = -stability * std::log(target_retention);
    int days = static_cast<int>(t);
    return std::max(1, std::min(days, maximum_interval));
}

std::vector<CurvePoint> decayCurve(double stability, int days) {
    std::vector<CurvePoint> points;
    if (days < 0) return points;
    points.reserve(static_cast<std::size_t>(days) + 1);
    for (int d = 0; d <= days; ++d) {
        points.push_back({ d, retrievability(stability, static_cast<double>(d)) });
    }
    return points;
}

} // namespace Retention
