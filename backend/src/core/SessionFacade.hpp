#pragma once
#include <array>
#include <cstddef>
#include <ctime>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "DueSelector.hpp"
#include "Scheduler.hpp"
#include "../storage/CardRepository.hpp"
#include "../storage/ProgressStore.hpp"

struct GradeRequest {
    LearnerId learner_id = 0;
    CardId card_id = 0;
    int grade = 0;                                 // 1..4
    std::optional<std::time_t> client_timestamp;
    std::optional<std::string> idempotency_key;
};

struct GradeResult {
    ProgressKey key;
    std::time_t next_due_at = 0;
    double stability = 0.0;
    double difficulty = 0.0;
    ProgressStatus status = ProgressStatus::NEW;
    std::uint32_t repetitions = 0;
    std::uint32_t lapses = 0;
    bool replayed = false;   // answered from the idempotency cache
};

/*
  Boundary used by the serving layer.
   - getDue: read-only, delegates to DueSelector
   - grade: read progress, compute, compare-and-swap, as one unit.
     Grades of the same (learner, card) are serialized by a striped lock;
     a write from outside this process surfaces as ConcurrentGradeConflict.
  Errors propagate unchanged; a failed grade leaves the record untouched.
*/
class SessionFacade {
public:
    using Clock = std::function<std::time_t()>;

    SessionFacade(const CardRepository& cards,
                  ProgressStore& store,
                  const Scheduler& scheduler,
                  Clock clock = nullptr,
                  DueSelector::LearnerDirectory directory = nullptr);

    DueSequence getDue(LearnerId learner,
                       const std::optional<std::string>& scope = std::nullopt,
                       const std::optional<std::size_t>& limit = std::nullopt) const;

    DueSequence getDue(LearnerId learner,
                       std::time_t now,
                       const std::optional<std::string>& scope,
                       const std::optional<std::size_t>& limit) const;

    GradeResult grade(const GradeRequest& request);

    // Server time unless the client timestamp is within the configured skew
    std::time_t effectiveNow(const std::optional<std::time_t>& client_timestamp) const;

private:
    static constexpr std::size_t LOCK_STRIPES = 64;

    struct ReplayKey {
        ProgressKey key;
        std::string token;
        bool operator==(const ReplayKey& o) const { return key == o.key && token == o.token; }
    };
    struct ReplayKeyHash {
        std::size_t operator()(const ReplayKey& k) const {
            std::size_t h = ProgressKeyHash()(k.key);
            h ^= std::hash<std::string>()(k.token) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            return h;
        }
    };

    const CardRepository& cards;
    ProgressStore& store;
    const Scheduler& scheduler;
    Clock clock;
    DueSelector selector;

    std::array<std::mutex, LOCK_STRIPES> key_locks;

    std::mutex replay_mtx;
    std::unordered_map<ReplayKey, GradeResult, ReplayKeyHash> replayed;
    std::deque<ReplayKey> replay_order;

    std::mutex& lockFor(const ProgressKey& key);
    std::optional<GradeResult> findReplay(const ReplayKey& key);
    void rememberReplay(const ReplayKey& key, const GradeResult& result);
};
