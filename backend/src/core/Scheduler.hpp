#pragma once
#include <ctime>
#include <optional>
#include <spdlog/spdlog.h>
#include "Card.hpp"
#include "Progress.hpp"
#include "SchedulerConfig.hpp"

/*
  Scheduling engine:
   - multiplicative stability update per grade, floored and capped
   - bounded difficulty drift (penalty on Again/Hard, reward on Good/Easy)
   - next due date = review time + ceil(stability) days
   - forward-only status, except a lapse which always returns to LEARNING
   - leech detection from the lapse count

  update() is a pure function of its inputs. Persisting the result and
  serializing concurrent grades of the same key is the caller's job.
*/
class Scheduler {
public:
    explicit Scheduler(const SchedulerConfig& cfg = SchedulerConfig());

    // current == nullopt means first review of a new card
    Progress update(LearnerId learner,
                    const Card& card,
                    const std::optional<Progress>& current,
                    ReviewQuality quality,
                    std::time_t now) const;

    bool isLeech(const Progress& p) const;

    // True when p satisfies every data-model invariant
    static bool checkInvariants(const Progress& p);

    // Whole days until the next review; never less than 1, saturates at STABILITY_CEILING
    static long long intervalDays(double stability);

    const SchedulerConfig& config() const { return cfg; }

private:
    SchedulerConfig cfg;

    double updateStability(double stability, ReviewQuality q) const;
    double updateDifficulty(double difficulty, ReviewQuality q) const;
    ProgressStatus nextStatus(ProgressStatus prior, ReviewQuality q,
                              double stability, std::uint32_t repetitions) const;
};
