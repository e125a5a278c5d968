#include "Types.hpp"
#include "Errors.hpp"
#include <cmath>
#include <string>

ReviewQuality qualityFromInt(int grade) {
    switch (grade) {
    case 1: return ReviewQuality::AGAIN;
    case 2: return ReviewQuality::HARD;
    case 3: return ReviewQuality::GOOD;
    case 4: return ReviewQuality::EASY;
    default:
        throw InvalidGradeError("grade must be 1..4, got " + std::to_string(grade));
    }
}

ReviewQuality qualityFromScore(double score) {
    if (std::isnan(score) || score < 0.0)
        throw InvalidGradeError("score must be a non-negative number");

    // Scores above 1 are percentages
    if (score > 1.0) score /= 100.0;

    if (score < 0.40) return ReviewQuality::AGAIN;
    if (score < 0.60) return ReviewQuality::HARD;
    if (score < 0.85) return ReviewQuality::GOOD;
    return ReviewQuality::EASY;
}

const char* qualityName(ReviewQuality q) {
    switch (q) {
    case ReviewQuality::AGAIN: return "again";
    case ReviewQuality::HARD: return "hard";
    case ReviewQuality::GOOD: return "good";
    case ReviewQuality::EASY: return "easy";
    }
    return "unknown";
}

const char* statusName(ProgressStatus s) {
    switch (s) {
    case ProgressStatus::NEW: return "new";
    case ProgressStatus::LEARNING: return "learning";
    case ProgressStatus::REVIEWING: return "reviewing";
    case ProgressStatus::MASTERED: return "mastered";
    }
    return "new";
}

bool parseStatus(const std::string& name, ProgressStatus& out) {
    if (name == "new") out = ProgressStatus::NEW;
    else if (name == "learning") out = ProgressStatus::LEARNING;
    else if (name == "reviewing") out = ProgressStatus::REVIEWING;
    else if (name == "mastered") out = ProgressStatus::MASTERED;
    else return false;
    return true;
}

const char* sourceName(CardSource s) {
    return s == CardSource::GENERATED ? "generated" : "authored";
}

bool parseSource(const std::string& name, CardSource& out) {
    if (name == "authored") out = CardSource::AUTHORED;
    else if (name == "generated") out = CardSource::GENERATED;
    else return false;
    return true;
}
