#pragma once
#include <ctime>
#include <vector>
#include "Progress.hpp"

/*
  Forgetting curve R(t) = exp(-t / S), S = stability in days.
  Used for reporting only; due dates come from the scheduler.
*/
namespace Retention {

struct CurvePoint {
    int day = 0;
    double retention = 0.0;
};

double retrievability(double stability, double days_elapsed);

// 1.0 for a card that has never been reviewed
double retrievabilityAt(const Progress& p, std::time_t now);

// "mastered", "stable", "review_soon", "critical" or "forgotten"
const char* retentionLabel(double retrievability);

// t = -S * ln(R_target), clamped to [1, maximum_interval]
int targetIntervalDays(double stability, double target_retention, int maximum_interval);

std::vector<CurvePoint> decayCurve(double stability, int days);

} // namespace Retention
