#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <unordered_set>
#include <vector>
#include "../core/Progress.hpp"

// One consistent read of a learner's schedule.
struct DueSnapshot {
    std::vector<Progress> due;            // next_due_at <= now, ascending (next_due_at, card_id)
    std::unordered_set<CardId> reviewed;  // every card that has been reviewed at least once
};

/*
  Durable home of Progress records, one per (learner, card).
  Implementations must make writes atomic: a reader sees either the old
  or the new record, never a mix. Backend failures are reported as
  StoreUnavailableError.
*/
class ProgressStore {
public:
    virtual ~ProgressStore() = default;

    virtual std::optional<Progress> find(const ProgressKey& key) const = 0;

    virtual DueSnapshot dueFor(LearnerId learner, std::time_t now) const = 0;

    // Commits `next` iff the stored version equals expected_version (0 when
    // no record exists). Returns the stored record with its new version.
    // Throws ConcurrentGradeConflict on a version mismatch.
    virtual Progress compareAndSwap(const Progress& next, std::uint64_t expected_version) = 0;

    virtual std::vector<Progress> snapshot() const = 0;
};
