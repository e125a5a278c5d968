#include "CardRepository.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

CardId CardRepository::createCard(const std::string& prompt,
                                  const std::string& answer,
                                  const std::optional<std::string>& explanation,
                                  const std::string& scope,
                                  double base_difficulty,
                                  CardSource source)
{
    if (prompt.empty() || answer.empty())
        throw std::invalid_argument("card prompt and answer are required");

    std::unique_lock<std::shared_mutex> lock(mtx);

    Card card(next_id++, prompt, answer);
    card.created_seq = next_seq++;
    card.explanation = explanation;
    card.scope = Card::normalizeScope(scope);
    card.base_difficulty = std::clamp(base_difficulty, 1.0, 10.0);
    card.source = source;

    index[card.id] = cards.size();
    cards.push_back(card);

    spdlog::info("Created Card: ID={}, scope='{}', source={}", card.id, card.scope, sourceName(source));
    return card.id;
}

std::optional<Card> CardRepository::find(CardId id) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    auto it = index.find(id);
    if (it == index.end()) return std::nullopt;
    return cards[it->second];
}

bool CardRepository::contains(CardId id) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return index.count(id) != 0;
}

std::vector<Card> CardRepository::inScope(const std::optional<std::string>& scope) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    std::vector<Card> out;
    for (const auto& c : cards) {
        if (c.matchesScope(scope)) out.push_back(c);
    }
    return out;
}

std::vector<Card> CardRepository::all() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return cards;
}

std::size_t CardRepository::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return cards.size();
}

void CardRepository::editMetadata(CardId id,
                                  const std::optional<std::string>& explanation,
                                  const std::optional<std::string>& scope)
{
    std::unique_lock<std::shared_mutex> lock(mtx);
    auto it = index.find(id);
    if (it == index.end())
        throw UnknownCardError("card " + std::to_string(id) + " does not exist");

    Card& card = cards[it->second];
    if (explanation) card.explanation = *explanation;
    if (scope) card.scope = Card::normalizeScope(*scope);

    spdlog::debug("Card ID={} metadata edited", id);
}

void CardRepository::restore(std::vector<Card> loaded) {
    std::sort(loaded.begin(), loaded.end(),
        [](const Card& a, const Card& b) {
            if (a.created_seq != b.created_seq) return a.created_seq < b.created_seq;
            return a.id < b.id;
        });

    std::unordered_map<CardId, std::size_t> restored_index;
    CardId restored_next_id = 1;
    std::uint64_t restored_next_seq = 1;
    for (std::size_t i = 0; i < loaded.size(); ++i) {
        if (!restored_index.emplace(loaded[i].id, i).second)
            throw std::invalid_argument("duplicate card id " + std::to_string(loaded[i].id));
        restored_next_id = std::max(restored_next_id, loaded[i].id + 1);
        restored_next_seq = std::max(restored_next_seq, loaded[i].created_seq + 1);
    }

    std::unique_lock<std::shared_mutex> lock(mtx);
    cards = std::move(loaded);
    index = std::move(restored_index);
    next_id = restored_next_id;
    next_seq = restored_next_seq;

    spdlog::info("Restored {} cards", cards.size());
}
