#pragma once
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "../core/Card.hpp"

// In-process catalogue of cards, standing in for the content pipeline.
// Cards are kept in creation order.
class CardRepository {
public:
    CardRepository() = default;

    // Throws std::invalid_argument for an empty prompt or answer
    CardId createCard(const std::string& prompt,
                      const std::string& answer,
                      const std::optional<std::string>& explanation,
                      const std::string& scope,
                      double base_difficulty = 5.0,
                      CardSource source = CardSource::AUTHORED);

    std::optional<Card> find(CardId id) const;
    bool contains(CardId id) const;

    // All cards in scope (or every card when scope is unset), creation order
    std::vector<Card> inScope(const std::optional<std::string>& scope) const;
    std::vector<Card> all() const;
    std::size_t size() const;

    // Metadata is the only mutable part of a card; throws UnknownCardError
    void editMetadata(CardId id,
                      const std::optional<std::string>& explanation,
                      const std::optional<std::string>& scope);

    // Replaces the catalogue with previously persisted cards; throws std::invalid_argument on duplicate ids
    void restore(std::vector<Card> cards);

private:
    mutable std::shared_mutex mtx;
    std::vector<Card> cards;                         // creation order
    std::unordered_map<CardId, std::size_t> index;   // id -> position
    CardId next_id = 1;
    std::uint64_t next_seq = 1;
};
