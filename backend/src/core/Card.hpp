#pragma once
#include <optional>
#include <string>
#include "Types.hpp"

// A study item as produced by the content pipeline. The scheduler only
// ever reads scope and base_difficulty.
class Card {
public:
    Card() = default;
    Card(CardId id, const std::string& prompt, const std::string& answer);

    CardId id = 0;
    std::uint64_t created_seq = 0;   // Creation order, used to order new cards

    std::string prompt;
    std::string answer;
    std::optional<std::string> explanation;

    std::string scope;               // e.g. a lesson or segment key
    double base_difficulty = 5.0;    // 1..10
    CardSource source = CardSource::AUTHORED;

    bool matchesScope(const std::optional<std::string>& wanted) const;

    // Trims surrounding whitespace; used for scope tags
    static std::string normalizeScope(const std::string& raw);

    // Decimal in [1, 10]; nullopt for anything else
    static std::optional<double> parseDifficulty(const std::string& text);
};
