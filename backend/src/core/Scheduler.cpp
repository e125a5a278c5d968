#include "Scheduler.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

Scheduler::Scheduler(const SchedulerConfig& config)
    : cfg(config)
{
    cfg.validate();
    spdlog::info("Scheduler initialized: multipliers again={} hard={} good={} easy={}, floor={}, mastery={}d",
        cfg.multiplier_again, cfg.multiplier_hard, cfg.multiplier_good, cfg.multiplier_easy,
        cfg.stability_floor, cfg.mastery_threshold_days);
}

Progress Scheduler::update(LearnerId learner,
                           const Card& card,
                           const std::optional<Progress>& current,
                           ReviewQuality q,
                           std::time_t now) const
{
    const ProgressKey key{ learner, card.id };

    Progress next;
    if (current) {
        if (current->key != key)
            throw std::invalid_argument("progress record does not belong to this learner/card");
        next = *current;
    }
    else {
        // First review: seed from config and the card's own difficulty
        next.key = key;
        next.stability = cfg.initial_stability;
        next.difficulty = std::clamp(card.base_difficulty, cfg.min_difficulty, cfg.max_difficulty);
        next.status = ProgressStatus::NEW;
    }

    const double stability_before = next.stability;
    const double difficulty_before = next.difficulty;

    next.stability = updateStability(next.stability, q);
    next.difficulty = updateDifficulty(next.difficulty, q);

    next.last_review_at = now;
    next.next_due_at = now + static_cast<std::time_t>(intervalDays(next.stability)) * SECONDS_PER_DAY;

    next.repetitions += 1;
    if (q == ReviewQuality::AGAIN) next.lapses += 1;

    next.status = nextStatus(next.status, q, next.stability, next.repetitions);

    spdlog::debug("Update learner={} card={} q={} stab {:.3f}->{:.3f} diff {:.2f}->{:.2f} -> {} due={}",
        learner, card.id, qualityName(q), stability_before, next.stability,
        difficulty_before, next.difficulty, statusName(next.status), *next.next_due_at);

    if (q == ReviewQuality::AGAIN) {
        spdlog::warn("Card {} lapsed for learner {}. lapses={}, is_leech={}",
            card.id, learner, next.lapses, isLeech(next));
    }

    return next;
}

/* -------------------------
   Memory model
   -------------------------
   stability' = clamp(stability * multiplier[q], floor, max)
   The floor keeps the schedule finite; stored values below it are lifted
   before the multiplier is applied.
*/
double Scheduler::updateStability(double stability, ReviewQuality q) const {
    double s = std::max(cfg.stability_floor, stability);
    s *= cfg.multiplierFor(q);
    return std::clamp(s, cfg.stability_floor, cfg.max_stability);
}

double Scheduler::updateDifficulty(double difficulty, ReviewQuality q) const {
    double d = difficulty;
    if (q == ReviewQuality::AGAIN || q == ReviewQuality::HARD) d += cfg.difficulty_penalty;
    else d -= cfg.difficulty_reward;

    return std::clamp(d, cfg.min_difficulty, cfg.max_difficulty);
}

ProgressStatus Scheduler::nextStatus(ProgressStatus prior, ReviewQuality q,
                                     double stability, std::uint32_t repetitions) const
{
    if (q == ReviewQuality::AGAIN) return ProgressStatus::LEARNING;

    ProgressStatus computed = ProgressStatus::LEARNING;
    if (stability > cfg.mastery_threshold_days) computed = ProgressStatus::MASTERED;
    else if (repetitions >= 1) computed = ProgressStatus::REVIEWING;

    // Never move backwards without a lapse
    return std::max(prior, computed);
}

long long Scheduler::intervalDays(double stability) {
    // Tolerance absorbs representation error such as 30 * 2.2 = 66.00000000000001
    double days = std::ceil(stability - 1e-9);
    if (!(days >= 1.0)) return 1;
    if (days > SchedulerConfig::STABILITY_CEILING)
        return static_cast<long long>(SchedulerConfig::STABILITY_CEILING);
    return static_cast<long long>(days);
}

bool Scheduler::isLeech(const Progress& p) const {
    return p.lapses >= static_cast<std::uint32_t>(cfg.leech_threshold);
}

bool Scheduler::checkInvariants(const Progress& p) {
    if (!(p.stability > 0.0) || !(p.stability <= SchedulerConfig::STABILITY_CEILING)) return false;
    if (!(p.difficulty >= 1.0 && p.difficulty <= 10.0)) return false;
    if (p.lapses > p.repetitions) return false;

    if (!p.next_due_at) {
        return !p.last_review_at && p.repetitions == 0 && p.status == ProgressStatus::NEW;
    }

    if (!p.last_review_at || p.repetitions == 0 || p.status == ProgressStatus::NEW) return false;

    return *p.next_due_at
        == *p.last_review_at + static_cast<std::time_t>(intervalDays(p.stability)) * SECONDS_PER_DAY;
}
