#pragma once
#include <cstddef>
#include <ctime>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "Progress.hpp"
#include "Scheduler.hpp"
#include "../storage/CardRepository.hpp"
#include "../storage/ProgressStore.hpp"

struct ProgressSummary {
    ProgressStatus status = ProgressStatus::NEW;
    double stability = 0.0;
    double difficulty = 0.0;
    std::optional<std::time_t> next_due_at;
    double retrievability = 1.0;
    bool leech = false;
};

struct DueEntry {
    Card card;
    std::optional<Progress> progress;   // nullopt for a new card
    ProgressSummary summary;
};

/*
  Snapshot of due candidates. Iterating interleaves due reviews and new
  cards on the fly; every begin() starts over from the same snapshot.
*/
class DueSequence {
    struct Data {
        std::vector<DueEntry> reviews;   // ascending next_due_at, then card id
        std::vector<DueEntry> fresh;     // creation order, then card id
        int reviews_per_new = 4;
        std::optional<std::size_t> limit;
    };

public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = DueEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = const DueEntry*;
        using reference = const DueEntry&;

        iterator() = default;

        reference operator*() const { return *current; }
        pointer operator->() const { return current; }
        iterator& operator++() { advance(); return *this; }
        iterator operator++(int) { iterator tmp = *this; advance(); return tmp; }

        bool operator==(const iterator& o) const { return current == o.current; }
        bool operator!=(const iterator& o) const { return current != o.current; }

    private:
        friend class DueSequence;
        explicit iterator(std::shared_ptr<const DueSequence::Data> owner);
        void advance();

        std::shared_ptr<const DueSequence::Data> seq;   // keeps entries alive past the sequence
        const DueEntry* current = nullptr;
        std::size_t review_pos = 0;
        std::size_t new_pos = 0;
        std::size_t emitted = 0;
        int reviews_since_new = 0;
    };

    DueSequence() = default;
    DueSequence(std::vector<DueEntry> reviews, std::vector<DueEntry> fresh,
                int reviews_per_new, std::optional<std::size_t> limit);

    iterator begin() const { return iterator(data); }
    iterator end() const { return iterator(); }

    bool empty() const { return begin() == end(); }
    std::size_t size() const;
    std::vector<DueEntry> toVector() const;

    std::size_t reviewCount() const { return data ? data->reviews.size() : 0; }
    std::size_t newCount() const { return data ? data->fresh.size() : 0; }

private:
    std::shared_ptr<const Data> data;
};

// Read-only query: which cards a learner should study now.
class DueSelector {
public:
    // Answers whether a learner id exists; identity lives outside this subsystem
    using LearnerDirectory = std::function<bool(LearnerId)>;

    DueSelector(const CardRepository& cards, const ProgressStore& store, const Scheduler& scheduler,
                LearnerDirectory directory = nullptr);

    DueSequence dueCards(LearnerId learner,
                         std::time_t now,
                         const std::optional<std::string>& scope = std::nullopt,
                         const std::optional<std::size_t>& limit = std::nullopt) const;

    ProgressSummary summarize(const std::optional<Progress>& progress, std::time_t now) const;

private:
    const CardRepository& cards;
    const ProgressStore& store;
    const Scheduler& scheduler;
    LearnerDirectory directory;   // unset: every learner id is accepted
};
