#include "DueSelector.hpp"
#include "Retention.hpp"
#include <algorithm>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>

/* -------------------------
   DueSequence
   -------------------------
   Up to reviews_per_new due reviews, then one new card, repeating.
   When either list runs out the other fills the remaining slots.
*/
DueSequence::DueSequence(std::vector<DueEntry> reviews, std::vector<DueEntry> fresh,
                         int reviews_per_new, std::optional<std::size_t> limit)
{
    auto d = std::make_shared<Data>();
    d->reviews = std::move(reviews);
    d->fresh = std::move(fresh);
    d->reviews_per_new = std::max(1, reviews_per_new);
    d->limit = limit;
    data = std::move(d);
}

DueSequence::iterator::iterator(std::shared_ptr<const DueSequence::Data> owner)
    : seq(std::move(owner))
{
    advance();
}

void DueSequence::iterator::advance() {
    current = nullptr;
    if (!seq) return;
    const Data& d = *seq;

    if (d.limit && emitted >= *d.limit) return;

    const bool have_review = review_pos < d.reviews.size();
    const bool have_new = new_pos < d.fresh.size();

    if (have_review && (reviews_since_new < d.reviews_per_new || !have_new)) {
        current = &d.reviews[review_pos++];
        ++reviews_since_new;
    }
    else if (have_new) {
        current = &d.fresh[new_pos++];
        reviews_since_new = 0;
    }

    if (current) ++emitted;
}

std::size_t DueSequence::size() const {
    if (!data) return 0;
    std::size_t total = data->reviews.size() + data->fresh.size();
    return data->limit ? std::min(total, *data->limit) : total;
}

std::vector<DueEntry> DueSequence::toVector() const {
    std::vector<DueEntry> out;
    out.reserve(size());
    for (const auto& e : *this) out.push_back(e);
    return out;
}

/* -------------------------
   DueSelector
   ------------------------- */
DueSelector::DueSelector(const CardRepository& c, const ProgressStore& s, const Scheduler& sched,
                         LearnerDirectory dir)
    : cards(c), store(s), scheduler(sched), directory(std::move(dir))
{
}

ProgressSummary DueSelector::summarize(const std::optional<Progress>& progress, std::time_t now) const {
    ProgressSummary s;
    if (!progress) return s;

    s.status = progress->status;
    s.stability = progress->stability;
    s.difficulty = progress->difficulty;
    s.next_due_at = progress->next_due_at;
    s.retrievability = Retention::retrievabilityAt(*progress, now);
    s.leech = scheduler.isLeech(*progress);
    return s;
}

DueSequence DueSelector::dueCards(LearnerId learner,
                                  std::time_t now,
                                  const std::optional<std::string>& scope,
                                  const std::optional<std::size_t>& limit) const
{
    if (directory && !directory(learner)) {
        spdlog::debug("dueCards: unknown learner {}; nothing due", learner);
        return DueSequence();
    }

    // One read of the store; the card list below is matched against it
    DueSnapshot snap = store.dueFor(learner, now);
    std::vector<Card> candidates = cards.inScope(scope);

    std::unordered_map<CardId, const Card*> by_id;
    by_id.reserve(candidates.size());
    for (const auto& c : candidates) by_id[c.id] = &c;

    std::vector<DueEntry> reviews;
    reviews.reserve(snap.due.size());
    for (auto& p : snap.due) {
        auto it = by_id.find(p.key.card_id);
        if (it == by_id.end()) continue;   // out of scope or no longer in the catalogue
        DueEntry e{ *it->second, p, summarize(p, now) };
        reviews.push_back(std::move(e));
    }

    std::sort(reviews.begin(), reviews.end(),
        [](const DueEntry& a, const DueEntry& b) {
            if (*a.progress->next_due_at != *b.progress->next_due_at)
                return *a.progress->next_due_at < *b.progress->next_due_at;
            return a.card.id < b.card.id;
        });

    std::vector<DueEntry> fresh;
    for (const auto& c : candidates) {
        if (snap.reviewed.count(c.id)) continue;
        fresh.push_back(DueEntry{ c, std::nullopt, ProgressSummary{} });
    }

    std::sort(fresh.begin(), fresh.end(),
        [](const DueEntry& a, const DueEntry& b) {
            if (a.card.created_seq != b.card.created_seq)
                return a.card.created_seq < b.card.created_seq;
            return a.card.id < b.card.id;
        });

    spdlog::debug("dueCards learner={} scope='{}' -> {} due reviews, {} new",
        learner, scope.value_or("*"), reviews.size(), fresh.size());

    return DueSequence(std::move(reviews), std::move(fresh),
        scheduler.config().reviews_per_new, limit);
}
