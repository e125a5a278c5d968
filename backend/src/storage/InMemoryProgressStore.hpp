#pragma once
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include "ProgressStore.hpp"

// Progress store held in memory, indexed per learner by card id and by
// (next_due_at, card_id) for range queries.
class InMemoryProgressStore : public ProgressStore {
public:
    InMemoryProgressStore() = default;

    std::optional<Progress> find(const ProgressKey& key) const override;
    DueSnapshot dueFor(LearnerId learner, std::time_t now) const override;
    Progress compareAndSwap(const Progress& next, std::uint64_t expected_version) override;
    std::vector<Progress> snapshot() const override;

    // Replaces all records, e.g. after loading from disk
    void restore(const std::vector<Progress>& records);

    std::size_t size() const;

private:
    struct LearnerShard {
        std::unordered_map<CardId, Progress> by_card;
        std::set<std::pair<std::time_t, CardId>> by_due;
    };

    mutable std::shared_mutex mtx;
    std::unordered_map<LearnerId, LearnerShard> shards;
    std::size_t count = 0;

    static void indexRecord(LearnerShard& shard, const Progress& p);
    static void unindexRecord(LearnerShard& shard, const Progress& p);
};
