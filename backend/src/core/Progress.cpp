#include "Progress.hpp"

bool operator==(const Progress& a, const Progress& b) {
    return a.key == b.key
        && a.stability == b.stability
        && a.difficulty == b.difficulty
        && a.last_review_at == b.last_review_at
        && a.next_due_at == b.next_due_at
        && a.repetitions == b.repetitions
        && a.lapses == b.lapses
        && a.status == b.status
        && a.version == b.version;
}
