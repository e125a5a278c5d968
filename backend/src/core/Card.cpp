#include "Card.hpp"
#include <cctype>
#include <stdexcept>

Card::Card(CardId card_id, const std::string& p, const std::string& a)
    : id(card_id), prompt(p), answer(a)
{
}

bool Card::matchesScope(const std::optional<std::string>& wanted) const {
    if (!wanted) return true;
    return scope == normalizeScope(*wanted);
}

std::string Card::normalizeScope(const std::string& raw) {
    std::string t = raw;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

std::optional<double> Card::parseDifficulty(const std::string& text) {
    const std::string t = normalizeScope(text);
    if (t.empty()) return std::nullopt;
    try {
        std::size_t used = 0;
        double v = std::stod(t, &used);
        if (used == t.size() && v >= 1.0 && v <= 10.0) return v;
    }
    catch (const std::logic_error&) {
    }
    return std::nullopt;
}
