#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/cards/Card.hpp"

namespace phh::domain::cards {

// Hole (or shown) cards held by one player: 2 cards for Hold'em, 4 for Omaha.
//
// The input order is kept for display; equality ignores it ("AcKd" == "KdAc").
// A combo never contains the same card twice.
class Combo {
public:
    // Fails (nullopt, reason in errorOut) on duplicates or a card count other than 2 or 4.
    static std::optional<Combo> fromCards(std::vector<Card> cards, std::string* errorOut = nullptr);

    // Accepts "AcKd", "Ac Kd" and "Ac Kd 8s 8c".
    static std::optional<Combo> fromString(std::string_view text, std::string* errorOut = nullptr);

    const std::vector<Card>& cards() const noexcept { return cards_; }
    std::size_t size() const noexcept { return cards_.size(); }

    bool contains(const Card& c) const;

    // Cards concatenated in input order, e.g. "AcKd".
    std::string toString() const;

    friend bool operator==(const Combo& a, const Combo& b) { return a.sorted_ == b.sorted_; }
    friend bool operator!=(const Combo& a, const Combo& b) { return !(a == b); }

private:
    explicit Combo(std::vector<Card> cards);

    std::vector<Card> cards_;
    std::vector<Card> sorted_;
};

// Splits whitespace separated or concatenated card notation into cards.
// Returns nullopt if any token is not a valid card.
std::optional<std::vector<Card>> parseCardList(std::string_view text);

} // namespace phh::domain::cards
