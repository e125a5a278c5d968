#pragma once
#include <cstdint>
#include <ctime>
#include <functional>
#include <string>

using LearnerId = std::uint64_t;
using CardId = std::uint64_t;

constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

// Typed (learner, card) key; the only way progress records are addressed.
struct ProgressKey {
    LearnerId learner_id = 0;
    CardId card_id = 0;

    bool operator==(const ProgressKey& o) const {
        return learner_id == o.learner_id && card_id == o.card_id;
    }
    bool operator!=(const ProgressKey& o) const { return !(*this == o); }
};

struct ProgressKeyHash {
    std::size_t operator()(const ProgressKey& k) const {
        std::size_t h = std::hash<std::uint64_t>()(k.learner_id);
        // boost::hash_combine mix
        h ^= std::hash<std::uint64_t>()(k.card_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

enum class ReviewQuality {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

// Ordered: a record only moves forward, except a lapse which drops to LEARNING.
enum class ProgressStatus {
    NEW = 0,
    LEARNING = 1,
    REVIEWING = 2,
    MASTERED = 3
};

enum class CardSource {
    AUTHORED,
    GENERATED
};

// Throws InvalidGradeError for anything outside 1..4.
ReviewQuality qualityFromInt(int grade);

// Percentage score (0-1 or 0-100) to a grade.
ReviewQuality qualityFromScore(double score);

const char* qualityName(ReviewQuality q);

const char* statusName(ProgressStatus s);
bool parseStatus(const std::string& name, ProgressStatus& out);

const char* sourceName(CardSource s);
bool parseSource(const std::string& name, CardSource& out);
