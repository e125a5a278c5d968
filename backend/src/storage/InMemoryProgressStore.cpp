#include "InMemoryProgressStore.hpp"
#include "../core/Errors.hpp"
#include <limits>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

std::optional<Progress> InMemoryProgressStore::find(const ProgressKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    auto s = shards.find(key.learner_id);
    if (s == shards.end()) return std::nullopt;
    auto it = s->second.by_card.find(key.card_id);
    if (it == s->second.by_card.end()) return std::nullopt;
    return it->second;
}

DueSnapshot InMemoryProgressStore::dueFor(LearnerId learner, std::time_t now) const {
    DueSnapshot snap;
    std::shared_lock<std::shared_mutex> lock(mtx);

    auto s = shards.find(learner);
    if (s == shards.end()) return snap;
    const LearnerShard& shard = s->second;

    snap.reviewed.reserve(shard.by_card.size());
    for (const auto& p : shard.by_card) {
        if (p.second.next_due_at) snap.reviewed.insert(p.first);
    }

    auto end = shard.by_due.upper_bound({ now, std::numeric_limits<CardId>::max() });
    for (auto it = shard.by_due.begin(); it != end; ++it) {
        snap.due.push_back(shard.by_card.at(it->second));
    }
    return snap;
}

Progress InMemoryProgressStore::compareAndSwap(const Progress& next, std::uint64_t expected_version) {
    std::unique_lock<std::shared_mutex> lock(mtx);

    LearnerShard& shard = shards[next.key.learner_id];
    auto it = shard.by_card.find(next.key.card_id);
    std::uint64_t stored_version = (it == shard.by_card.end()) ? 0 : it->second.version;

    if (stored_version != expected_version) {
        spdlog::warn("CAS conflict learner={} card={}: expected v{}, stored v{}",
            next.key.learner_id, next.key.card_id, expected_version, stored_version);
        throw ConcurrentGradeConflict("progress for learner " + std::to_string(next.key.learner_id)
            + " card " + std::to_string(next.key.card_id) + " was modified concurrently");
    }

    Progress stored = next;
    stored.version = stored_version + 1;

    if (it != shard.by_card.end()) {
        unindexRecord(shard, it->second);
        it->second = stored;
    }
    else {
        shard.by_card.emplace(stored.key.card_id, stored);
        ++count;
    }
    indexRecord(shard, stored);

    return stored;
}

std::vector<Progress> InMemoryProgressStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    std::vector<Progress> out;
    out.reserve(count);
    for (const auto& s : shards) {
        for (const auto& p : s.second.by_card) out.push_back(p.second);
    }
    return out;
}

void InMemoryProgressStore::restore(const std::vector<Progress>& records) {
    std::unique_lock<std::shared_mutex> lock(mtx);
    shards.clear();
    count = 0;
    for (const auto& p : records) {
        LearnerShard& shard = shards[p.key.learner_id];
        auto existing = shard.by_card.find(p.key.card_id);
        if (existing != shard.by_card.end()) {
            spdlog::warn("Duplicate progress record learner={} card={}; keeping the later one",
                p.key.learner_id, p.key.card_id);
            unindexRecord(shard, existing->second);
            existing->second = p;
        }
        else {
            shard.by_card.emplace(p.key.card_id, p);
            ++count;
        }
        indexRecord(shard, p);
    }
    spdlog::info("Restored {} progress records", count);
}

std::size_t InMemoryProgressStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return count;
}

void InMemoryProgressStore::indexRecord(LearnerShard& shard, const Progress& p) {
    if (p.next_due_at) shard.by_due.insert({ *p.next_due_at, p.key.card_id });
}

void InMemoryProgressStore::unindexRecord(LearnerShard& shard, const Progress& p) {
    if (p.next_due_at) shard.by_due.erase({ *p.next_due_at, p.key.card_id });
}
