#include "domain/cards/Combo.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace phh::domain::cards {

namespace {

inline void setError(std::string* errorOut, std::string msg) {
    if (errorOut) *errorOut = std::move(msg);
}

} // namespace

std::optional<std::vector<Card>> parseCardList(std::string_view text) {
    std::vector<Card> out;
    size_t i = 0;
    while (i < text.size()) {
        if (std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        if (i + 2 > text.size()) return std::nullopt;
        const auto card = Card::fromString(text.substr(i, 2));
        if (!card) return std::nullopt;
        out.push_back(*card);
        i += 2;
    }
    return out;
}

Combo::Combo(std::vector<Card> cards)
    : cards_(std::move(cards)), sorted_(cards_) {
    std::sort(sorted_.begin(), sorted_.end());
}

std::optional<Combo> Combo::fromCards(std::vector<Card> cards, std::string* errorOut) {
    if (cards.size() != 2 && cards.size() != 4) {
        setError(errorOut, "combo must hold 2 or 4 cards, got " + std::to_string(cards.size()));
        return std::nullopt;
    }

    std::unordered_set<Card> seen;
    for (const auto& c : cards) {
        if (!seen.insert(c).second) {
            setError(errorOut, "duplicate card in combo: " + c.toString());
            return std::nullopt;
        }
    }

    return Combo(std::move(cards));
}

std::optional<Combo> Combo::fromString(std::string_view text, std::string* errorOut) {
    auto cards = parseCardList(text);
    if (!cards) {
        setError(errorOut, "invalid card notation: " + std::string(text));
        return std::nullopt;
    }
    return fromCards(std::move(*cards), errorOut);
}

bool Combo::contains(const Card& c) const {
    return std::find(cards_.begin(), cards_.end(), c) != cards_.end();
}

std::string Combo::toString() const {
    std::string out;
    out.reserve(cards_.size() * 2);
    for (const auto& c : cards_) {
        out += c.toString();
    }
    return out;
}

} // namespace phh::domain::cards
