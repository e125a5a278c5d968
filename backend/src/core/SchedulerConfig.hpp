#pragma once
#include <cstddef>
#include <ctime>
#include <string>
#include "Types.hpp"

/*
  Tunables for the scheduling engine and due-set selector.
  Stored as "key:value" lines; '#' starts a comment.
*/
struct SchedulerConfig {
    // Upper bounds enforced by validate()
    static constexpr double STABILITY_CEILING = 36500.0 * 100;
    static constexpr std::time_t MAX_CLIENT_SKEW_SECONDS = SECONDS_PER_DAY;

    // Stability multiplier per grade
    double multiplier_again = 0.25;
    double multiplier_hard = 1.2;
    double multiplier_good = 1.5;
    double multiplier_easy = 2.2;

    double stability_floor = 0.25;     // Days; stability never drops below
    double initial_stability = 1.0;    // First review starts here
    double max_stability = 36500.0;

    double default_difficulty = 5.0;
    double min_difficulty = 1.0;
    double max_difficulty = 10.0;
    double difficulty_penalty = 0.5;   // Added on Again/Hard
    double difficulty_reward = 0.2;    // Subtracted on Good/Easy

    double mastery_threshold_days = 21.0;
    int leech_threshold = 8;

    // Due-set interleave: this many due reviews per new card
    int reviews_per_new = 4;

    // Retention model (informational)
    double target_retention = 0.9;
    int maximum_interval_days = 365;

    // 0 disables client timestamps entirely
    std::time_t client_skew_tolerance_seconds = 0;
    std::size_t idempotency_cache_size = 1024;

    double multiplierFor(ReviewQuality q) const;

    // Throws ConfigError when values break the scheduling invariants
    void validate() const;

    std::string serialize() const;
    // Throws ConfigError on unknown keys or bad values
    void deserialize(const std::string& data);

    // Missing file yields defaults
    static SchedulerConfig loadFromFile(const std::string& filename);
};
