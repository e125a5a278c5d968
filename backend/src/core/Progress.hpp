#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include "Types.hpp"

// Memory-model state for one (learner, card) pair. Created on the first
// graded review; an absent record means the card is new.
struct Progress {
    ProgressKey key;

    double stability = 1.0;                 // Days of retention, always > 0
    double difficulty = 5.0;                // [1.0, 10.0]

    std::optional<std::time_t> last_review_at;
    std::optional<std::time_t> next_due_at; // Unset means new, due immediately

    std::uint32_t repetitions = 0;
    std::uint32_t lapses = 0;
    ProgressStatus status = ProgressStatus::NEW;

    // Store version for compare-and-swap; 0 means never written
    std::uint64_t version = 0;

    bool isNew() const { return !next_due_at.has_value(); }
    bool isDue(std::time_t now) const { return !next_due_at || *next_due_at <= now; }
};

bool operator==(const Progress& a, const Progress& b);
inline bool operator!=(const Progress& a, const Progress& b) { return !(a == b); }
