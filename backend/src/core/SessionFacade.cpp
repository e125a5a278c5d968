#include "SessionFacade.hpp"
#include "Errors.hpp"
#include <utility>
#include <spdlog/spdlog.h>

SessionFacade::SessionFacade(const CardRepository& c,
                             ProgressStore& s,
                             const Scheduler& sched,
                             Clock clk,
                             DueSelector::LearnerDirectory directory)
    : cards(c),
    store(s),
    scheduler(sched),
    clock(clk ? std::move(clk) : Clock([] { return std::time(nullptr); })),
    selector(c, s, sched, std::move(directory))
{
}

DueSequence SessionFacade::getDue(LearnerId learner,
                                  const std::optional<std::string>& scope,
                                  const std::optional<std::size_t>& limit) const
{
    return getDue(learner, clock(), scope, limit);
}

DueSequence SessionFacade::getDue(LearnerId learner,
                                  std::time_t now,
                                  const std::optional<std::string>& scope,
                                  const std::optional<std::size_t>& limit) const
{
    return selector.dueCards(learner, now, scope, limit);
}

std::time_t SessionFacade::effectiveNow(const std::optional<std::time_t>& client_timestamp) const {
    const std::time_t server_now = clock();
    if (!client_timestamp) return server_now;

    const std::time_t tolerance = scheduler.config().client_skew_tolerance_seconds;
    if (tolerance <= 0) return server_now;

    // Compare against the window bounds; subtracting an arbitrary client value could overflow
    const std::time_t ts = *client_timestamp;
    const bool within = ts >= server_now - tolerance && ts <= server_now + tolerance;
    if (within) return ts;

    spdlog::warn("Ignoring client timestamp {} (server {}, tolerance {}s)", ts, server_now, tolerance);
    return server_now;
}

GradeResult SessionFacade::grade(const GradeRequest& req) {
    const ReviewQuality q = qualityFromInt(req.grade);

    std::optional<Card> card = cards.find(req.card_id);
    if (!card) {
        spdlog::warn("Grade rejected: unknown card {}", req.card_id);
        throw UnknownCardError("card " + std::to_string(req.card_id) + " does not exist");
    }

    const ProgressKey key{ req.learner_id, req.card_id };
    const std::time_t now = effectiveNow(req.client_timestamp);

    std::lock_guard<std::mutex> guard(lockFor(key));

    std::optional<ReplayKey> replay_key;
    if (req.idempotency_key) {
        replay_key = ReplayKey{ key, *req.idempotency_key };
        if (auto cached = findReplay(*replay_key)) {
            spdlog::info("Grade learner={} card={} replayed from idempotency key", key.learner_id, key.card_id);
            return *cached;
        }
    }

    std::optional<Progress> current = store.find(key);
    Progress next = scheduler.update(key.learner_id, *card, current, q, now);
    Progress stored = store.compareAndSwap(next, current ? current->version : 0);

    GradeResult result;
    result.key = key;
    result.next_due_at = *stored.next_due_at;
    result.stability = stored.stability;
    result.difficulty = stored.difficulty;
    result.status = stored.status;
    result.repetitions = stored.repetitions;
    result.lapses = stored.lapses;

    if (replay_key) rememberReplay(*replay_key, result);

    spdlog::info("Graded learner={} card={} q={} -> status={} next_due={} reps={}",
        key.learner_id, key.card_id, qualityName(q), statusName(result.status),
        result.next_due_at, result.repetitions);
    return result;
}

std::mutex& SessionFacade::lockFor(const ProgressKey& key) {
    return key_locks[ProgressKeyHash()(key) % LOCK_STRIPES];
}

std::optional<GradeResult> SessionFacade::findReplay(const ReplayKey& key) {
    std::lock_guard<std::mutex> guard(replay_mtx);
    auto it = replayed.find(key);
    if (it == replayed.end()) return std::nullopt;
    GradeResult r = it->second;
    r.replayed = true;
    return r;
}

void SessionFacade::rememberReplay(const ReplayKey& key, const GradeResult& result) {
    const std::size_t capacity = scheduler.config().idempotency_cache_size;
    if (capacity == 0) return;

    std::lock_guard<std::mutex> guard(replay_mtx);
    if (!replayed.emplace(key, result).second) return;
    replay_order.push_back(key);

    while (replay_order.size() > capacity) {
        replayed.erase(replay_order.front());
        replay_order.pop_front();
    }
}
