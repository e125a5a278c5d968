#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <optional>
#include <limits>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../core/Errors.hpp"
#include "../core/Retention.hpp"
#include "../core/Scheduler.hpp"
#include "../core/SchedulerConfig.hpp"
#include "../core/SessionFacade.hpp"
#include "../storage/CardRepository.hpp"
#include "../storage/InMemoryProgressStore.hpp"
#include "../storage/Storage.hpp"

static const char* CARD_FILE = "cards.txt";
static const char* PROGRESS_FILE = "progress.dat";
static const char* SALT_FILE = "progress.salt";

std::string loadOrCreateSalt() {
    std::ifstream in(SALT_FILE);
    std::string salt;
    if (in && std::getline(in, salt) && !salt.empty()) return salt;

    salt = Storage::generateSaltHex();
    std::ofstream out(SALT_FILE, std::ios::trunc);
    out << salt << "\n";
    spdlog::info("Created new salt file '{}'", SALT_FILE);
    return salt;
}

std::string formatTime(const std::optional<std::time_t>& t) {
    if (!t) return "(never)";
    std::tm tm{};
    localtime_r(&*t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return oss.str();
}

int askGrade() {
    while (true) {
        std::cout << "\nHow well did you recall it?\n"
            " 1 = AGAIN (Forgot)\n"
            " 2 = HARD\n"
            " 3 = GOOD\n"
            " 4 = EASY\n> ";
        int g;
        if (std::cin >> g && g >= 1 && g <= 4) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return g;
        }
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
}

std::optional<unsigned long long> askNumber(const std::string& prompt) {
    std::cout << prompt;
    std::string line;
    std::getline(std::cin, line);
    // stoull would wrap a leading '-'
    if (!line.empty() && line.find('-') == std::string::npos) {
        try {
            std::size_t used = 0;
            unsigned long long v = std::stoull(line, &used);
            if (used == line.size()) return v;
        }
        catch (const std::logic_error&) {
        }
    }
    std::cout << "Not a number.\n";
    return std::nullopt;
}

// Empty input keeps the default
std::optional<double> askDifficulty(const std::string& prompt) {
    std::cout << prompt;
    std::string line;
    std::getline(std::cin, line);
    if (line.empty()) return std::nullopt;
    if (auto v = Card::parseDifficulty(line)) return v;
    std::cout << "Difficulty must be a number from 1 to 10; using 5.\n";
    return std::nullopt;
}

void listAllCards(const CardRepository& cards, const ProgressStore& store,
                  const Scheduler& scheduler, LearnerId learner)
{
    std::cout << "\n===== ALL CARDS =====\n";
    auto all = cards.all();
    if (all.empty()) {
        std::cout << "No cards stored.\n";
        return;
    }

    std::time_t now = std::time(nullptr);
    for (const auto& c : all) {
        std::cout << c.id << ". " << c.prompt << "\n"
            << "   Scope: " << (c.scope.empty() ? "(none)" : c.scope)
            << " | Source: " << sourceName(c.source)
            << " | Base difficulty: " << c.base_difficulty << "\n";

        auto p = store.find({ learner, c.id });
        if (!p) {
            std::cout << "   Status: new\n";
        }
        else {
            double r = Retention::retrievabilityAt(*p, now);
            std::cout << "   Status: " << statusName(p->status)
                << " | Stability: " << std::fixed << std::setprecision(2) << p->stability << "d"
                << " | Difficulty: " << p->difficulty << std::defaultfloat << "\n"
                << "   Reps: " << p->repetitions << " | Lapses: " << p->lapses
                << (scheduler.isLeech(*p) ? " (leech)" : "") << "\n"
                << "   Last review: " << formatTime(p->last_review_at)
                << " | Next due: " << formatTime(p->next_due_at) << "\n"
                << "   Retention: " << std::fixed << std::setprecision(0) << r * 100 << "% ("
                << Retention::retentionLabel(r) << ")" << std::defaultfloat << "\n";
        }
        std::cout << "-----------------------------\n";
    }
}

void reviewDue(SessionFacade& session, LearnerId learner) {
    std::cout << "Scope (blank for all): ";
    std::string scope_line;
    std::getline(std::cin, scope_line);
    std::optional<std::string> scope;
    if (!Card::normalizeScope(scope_line).empty()) scope = scope_line;

    auto due = session.getDue(learner, scope);
    if (due.empty()) { std::cout << "No cards due.\n"; return; }

    std::cout << due.size() << " card(s) due (" << due.reviewCount() << " reviews, "
        << due.newCount() << " new).\n";

    for (const auto& entry : due) {
        std::cout << "\n[" << (entry.progress ? statusName(entry.summary.status) : "new") << "] "
            << entry.card.prompt << "\n(press Enter to reveal)";
        std::string dummy;
        std::getline(std::cin, dummy);

        std::cout << "Answer: " << entry.card.answer << "\n";
        if (entry.card.explanation) std::cout << "Why: " << *entry.card.explanation << "\n";

        GradeRequest req;
        req.learner_id = learner;
        req.card_id = entry.card.id;
        req.grade = askGrade();

        try {
            GradeResult res = session.grade(req);
            std::cout << "Next review: " << formatTime(res.next_due_at)
                << " (" << statusName(res.status) << ")\n";
        }
        catch (const ConcurrentGradeConflict& e) {
            std::cout << "Card was updated elsewhere, try again: " << e.what() << "\n";
        }
    }
}

void showCurve(const CardRepository& cards, const ProgressStore& store, LearnerId learner) {
    auto id = askNumber("Card id: ");
    if (!id) return;
    if (!cards.contains(*id)) { std::cout << "Unknown card.\n"; return; }

    auto p = store.find({ learner, *id });
    double stability = p ? p->stability : 1.0;

    std::cout << "Projected retention (stability " << stability << "d):\n";
    for (const auto& pt : Retention::decayCurve(stability, 10)) {
        int bars = static_cast<int>(pt.retention * 40);
        std::cout << std::setw(3) << pt.day << "d " << std::string(bars, '#') << " "
            << std::fixed << std::setprecision(0) << pt.retention * 100 << "%"
            << std::defaultfloat << "\n";
    }
}

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Log::init();

    SchedulerConfig config;
    try {
        if (argc > 1) config = SchedulerConfig::loadFromFile(argv[1]);
    }
    catch (const ConfigError& e) {
        std::cerr << "Invalid config: " << e.what() << "\n";
        return 1;
    }

    std::string passphrase;
    std::cout << "Passphrase: ";
    std::getline(std::cin, passphrase);

    std::vector<unsigned char> key;
    if (!Storage::deriveKey(passphrase, loadOrCreateSalt(), key)) {
        std::cerr << "Failed to derive storage key\n";
        return 1;
    }
    sodium_memzero(&passphrase[0], passphrase.size());

    CardRepository cards;
    InMemoryProgressStore store;

    std::vector<Card> loaded_cards;
    if (!Storage::loadCards(loaded_cards, CARD_FILE)) {
        std::cerr << "Card file is corrupted\n";
        return 1;
    }
    cards.restore(loaded_cards);

    std::vector<Progress> loaded_progress;
    if (!Storage::loadProgress(loaded_progress, PROGRESS_FILE, key)) {
        std::cerr << "Wrong passphrase or corrupted progress file\n";
        return 1;
    }
    store.restore(loaded_progress);

    Scheduler scheduler(config);
    SessionFacade session(cards, store, scheduler);

    LearnerId learner = 1;
    if (auto id = askNumber("Learner id: ")) learner = *id;

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Learner: " << learner << "\n"
            "1. Add Card\n"
            "2. Review Due Cards\n"
            "3. List All Cards\n"
            "4. Retention Curve\n"
            "5. Switch Learner\n"
            "6. Save & Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore();

        try {
            if (choice == 1) {
                std::string prompt, answer, explanation, scope;
                std::cout << "Prompt: "; std::getline(std::cin, prompt);
                std::cout << "Answer: "; std::getline(std::cin, answer);
                if (prompt.empty() || answer.empty()) { std::cout << "Prompt and answer required.\n"; continue; }
                std::cout << "Explanation (optional): "; std::getline(std::cin, explanation);
                std::cout << "Scope: "; std::getline(std::cin, scope);

                double difficulty = 5.0;
                if (auto d = askDifficulty("Base difficulty 1-10 [5]: ")) difficulty = *d;

                std::optional<std::string> expl;
                if (!explanation.empty()) expl = explanation;
                CardId id = cards.createCard(prompt, answer, expl, scope, difficulty);
                std::cout << "Card " << id << " added.\n";
            }
            else if (choice == 2) {
                reviewDue(session, learner);
            }
            else if (choice == 3) {
                listAllCards(cards, store, scheduler, learner);
            }
            else if (choice == 4) {
                showCurve(cards, store, learner);
            }
            else if (choice == 5) {
                if (auto id = askNumber("Learner id: ")) learner = *id;
            }
            else if (choice == 6) {
                break;
            }
            else {
                std::cout << "Invalid.\n";
            }
        }
        catch (const SchedulingError& e) {
            spdlog::error("Operation failed: {}", e.what());
            std::cout << "Error: " << e.what() << "\n";
        }
    }

    int rc = 0;
    if (!Storage::saveCards(cards.all(), CARD_FILE)) {
        std::cout << "Error saving cards.\n";
        rc = 1;
    }
    if (!Storage::saveProgress(store.snapshot(), PROGRESS_FILE, key)) {
        std::cout << "Error saving progress.\n";
        rc = 1;
    }
    sodium_memzero(key.data(), key.size());

    std::cout << "Goodbye!\n";
    return rc;
}
