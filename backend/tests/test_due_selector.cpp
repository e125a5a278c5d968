// Due-set selection: what is due, in which order, interleaved how.

#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include "core/DueSelector.hpp"
#include "storage/InMemoryProgressStore.hpp"

namespace {

constexpr std::time_t T = 1700000000;
constexpr std::time_t DAY = SECONDS_PER_DAY;

class DueSelectorTest : public ::testing::Test {
protected:
    CardRepository cards;
    InMemoryProgressStore store;
    Scheduler scheduler;
    DueSelector selector{ cards, store, scheduler };

    CardId AddCard(const std::string& scope) {
        return cards.createCard("prompt", "answer", std::nullopt, scope);
    }

    // GOOD on a new card schedules it two days after `reviewed_at`
    void ReviewAt(LearnerId learner, CardId card, std::time_t reviewed_at) {
        Progress p = scheduler.update(learner, *cards.find(card), std::nullopt, ReviewQuality::GOOD, reviewed_at);
        store.compareAndSwap(p, 0);
    }

    static std::vector<CardId> Ids(const DueSequence& seq) {
        std::vector<CardId> out;
        for (const auto& e : seq) out.push_back(e.card.id);
        return out;
    }
};

// -----------------------------------------------------------------------------
// 3 new and 10 overdue cards in scope, limit 5, one new per four reviews
// -----------------------------------------------------------------------------
TEST_F(DueSelectorTest, LimitedQueryCapsNewCardsAndPutsMostOverdueFirst) {
    std::vector<CardId> reviewed;
    for (int i = 0; i < 10; ++i) {
        CardId id = AddCard("GS1");
        reviewed.push_back(id);
        ReviewAt(2, id, T - (3 + i) * DAY);   // due T-1d .. T-10d
    }
    std::vector<CardId> fresh = { AddCard("GS1"), AddCard("GS1"), AddCard("GS1") };
    AddCard("GS2");   // outside the scope

    auto due = selector.dueCards(2, T, std::string("GS1"), 5);
    auto entries = due.toVector();
    ASSERT_EQ(entries.size(), 5u);

    int new_count = 0;
    std::time_t prev_due = 0;
    for (const auto& e : entries) {
        EXPECT_EQ(e.card.scope, "GS1");
        if (!e.progress) { ++new_count; continue; }
        EXPECT_GE(*e.progress->next_due_at, prev_due);
        prev_due = *e.progress->next_due_at;
    }
    EXPECT_LE(new_count, 1);

    // Most overdue first: reviewed last in the loop above
    EXPECT_EQ(entries[0].card.id, reviewed[9]);
    EXPECT_EQ(entries[1].card.id, reviewed[8]);
    EXPECT_EQ(entries[4].card.id, fresh[0]);
    EXPECT_EQ(due.reviewCount(), 10u);
    EXPECT_EQ(due.newCount(), 3u);
}

TEST_F(DueSelectorTest, InterleavesOneNewCardPerFourReviews) {
    std::vector<CardId> reviewed;
    for (int i = 0; i < 10; ++i) {
        CardId id = AddCard("GS1");
        reviewed.push_back(id);
        ReviewAt(1, id, T - (12 - i) * DAY);   // ascending due dates in creation order
    }
    std::vector<CardId> fresh = { AddCard("GS1"), AddCard("GS1"), AddCard("GS1") };

    std::vector<CardId> expected = {
        reviewed[0], reviewed[1], reviewed[2], reviewed[3], fresh[0],
        reviewed[4], reviewed[5], reviewed[6], reviewed[7], fresh[1],
        reviewed[8], reviewed[9], fresh[2]
    };
    EXPECT_EQ(Ids(selector.dueCards(1, T)), expected);
}

TEST_F(DueSelectorTest, NewCardsFillWhenFewReviewsAreDue) {
    CardId r = AddCard("GS1");
    ReviewAt(1, r, T - 5 * DAY);
    CardId n1 = AddCard("GS1");
    CardId n2 = AddCard("GS1");
    CardId n3 = AddCard("GS1");

    std::vector<CardId> expected = { r, n1, n2, n3 };
    EXPECT_EQ(Ids(selector.dueCards(1, T)), expected);
}

TEST_F(DueSelectorTest, ReviewsContinueAfterNewCardsRunOut) {
    std::vector<CardId> reviewed;
    for (int i = 0; i < 6; ++i) {
        CardId id = AddCard("GS1");
        reviewed.push_back(id);
        ReviewAt(1, id, T - (10 - i) * DAY);
    }
    CardId n = AddCard("GS1");

    std::vector<CardId> expected = {
        reviewed[0], reviewed[1], reviewed[2], reviewed[3], n, reviewed[4], reviewed[5]
    };
    EXPECT_EQ(Ids(selector.dueCards(1, T)), expected);
}

TEST_F(DueSelectorTest, CardsNotYetDueAreExcluded) {
    CardId later = AddCard("GS1");
    ReviewAt(1, later, T - DAY);   // due T+1d
    CardId now_due = AddCard("GS1");
    ReviewAt(1, now_due, T - 2 * DAY);   // due exactly T

    EXPECT_EQ(Ids(selector.dueCards(1, T)), std::vector<CardId>{ now_due });
    EXPECT_EQ(Ids(selector.dueCards(1, T + DAY)), (std::vector<CardId>{ now_due, later }));
}

TEST_F(DueSelectorTest, EqualDueDatesBreakTiesByCardId) {
    CardId a = AddCard("GS1");
    CardId b = AddCard("GS1");
    ReviewAt(1, b, T - 4 * DAY);
    ReviewAt(1, a, T - 4 * DAY);

    EXPECT_EQ(Ids(selector.dueCards(1, T)), (std::vector<CardId>{ a, b }));
}

TEST_F(DueSelectorTest, SameSnapshotGivesSameSequence) {
    for (int i = 0; i < 7; ++i) {
        CardId id = AddCard(i % 2 ? "GS1" : "GS2");
        if (i % 3) ReviewAt(1, id, T - (i + 2) * DAY);
    }

    EXPECT_EQ(Ids(selector.dueCards(1, T)), Ids(selector.dueCards(1, T)));
    EXPECT_EQ(Ids(selector.dueCards(1, T, std::string("GS1"), 3)),
              Ids(selector.dueCards(1, T, std::string("GS1"), 3)));
}

TEST_F(DueSelectorTest, SequenceIsRestartableAndDetachedFromLaterWrites) {
    CardId a = AddCard("GS1");
    CardId b = AddCard("GS1");

    DueSequence due = selector.dueCards(1, T);
    auto first = Ids(due);
    ReviewAt(1, a, T);   // not visible in the existing snapshot
    auto second = Ids(due);

    EXPECT_EQ(first, (std::vector<CardId>{ a, b }));
    EXPECT_EQ(first, second);
    EXPECT_EQ(Ids(selector.dueCards(1, T)), std::vector<CardId>{ b });
}

TEST_F(DueSelectorTest, IteratorOutlivesTemporarySequence) {
    CardId a = AddCard("GS1");
    CardId b = AddCard("GS1");

    auto it = selector.dueCards(1, T).begin();
    ASSERT_NE(it, DueSequence::iterator());
    EXPECT_EQ(it->card.id, a);
    ++it;
    ASSERT_NE(it, DueSequence::iterator());
    EXPECT_EQ(it->card.id, b);
    ++it;
    EXPECT_EQ(it, DueSequence::iterator());
}

TEST_F(DueSelectorTest, ScopeIsMatchedAfterTrimming) {
    CardId a = AddCard("GS1");
    AddCard("GS2");
    EXPECT_EQ(Ids(selector.dueCards(1, T, std::string("  GS1 "))), std::vector<CardId>{ a });
}

TEST_F(DueSelectorTest, ZeroLimitAndEmptyCatalogue) {
    EXPECT_TRUE(selector.dueCards(1, T).empty());
    AddCard("GS1");
    EXPECT_TRUE(selector.dueCards(1, T, std::nullopt, 0).empty());
    EXPECT_EQ(selector.dueCards(1, T, std::nullopt, 0).size(), 0u);
}

TEST_F(DueSelectorTest, UnknownLearnerGetsEmptySequence) {
    AddCard("GS1");
    DueSelector known_only(cards, store, scheduler, [](LearnerId id) { return id == 2; });

    EXPECT_TRUE(known_only.dueCards(99, T).empty());
    EXPECT_EQ(known_only.dueCards(2, T).size(), 1u);
}

TEST_F(DueSelectorTest, EntriesCarryProgressSummary) {
    CardId r = AddCard("GS1");
    ReviewAt(1, r, T - 2 * DAY);
    CardId n = AddCard("GS1");

    auto entries = selector.dueCards(1, T).toVector();
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].card.id, r);
    EXPECT_EQ(entries[0].summary.status, ProgressStatus::REVIEWING);
    EXPECT_DOUBLE_EQ(entries[0].summary.stability, 1.5);
    EXPECT_EQ(*entries[0].summary.next_due_at, T);
    EXPECT_LT(entries[0].summary.retrievability, 1.0);
    EXPECT_FALSE(entries[0].summary.leech);

    EXPECT_EQ(entries[1].card.id, n);
    EXPECT_FALSE(entries[1].progress.has_value());
    EXPECT_EQ(entries[1].summary.status, ProgressStatus::NEW);
}

}  // namespace
