#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace phh::domain::cards {

enum class Rank {
    Two   = 2,
    Three = 3,
    Four  = 4,
    Five  = 5,
    Six   = 6,
    Seven = 7,
    Eight = 8,
    Nine  = 9,
    Ten   = 10,
    Jack  = 11,
    Queen = 12,
    King  = 13,
    Ace   = 14
};

enum class Suit {
    Clubs    = 0,
    Diamonds = 1,
    Hearts   = 2,
    Spades   = 3
};

std::optional<Rank> rankFromChar(char c);
std::optional<Suit> suitFromChar(char c);
char toChar(Rank r);
char toChar(Suit s);

// Numeric rank value, 2 (deuce) .. 14 (ace).
inline int rankValue(Rank r) {
    return static_cast<int>(r);
}

// A single playing card. Immutable value type.
class Card {
public:
    Card(Rank rank, Suit suit) : rank_(rank), suit_(suit) {}

    // Parses two-character notation: "As", "Td", "2c". Suit letters are
    // accepted in either case; rank letters must be upper-case ("t" is not a rank).
    static std::optional<Card> fromString(std::string_view text);

    Rank rank() const noexcept { return rank_; }
    Suit suit() const noexcept { return suit_; }

    std::string toString() const;

    friend bool operator==(const Card& a, const Card& b) {
        return a.rank_ == b.rank_ && a.suit_ == b.suit_;
    }
    friend bool operator!=(const Card& a, const Card& b) { return !(a == b); }

    // Orders by rank first, then suit.
    friend bool operator<(const Card& a, const Card& b) {
        if (a.rank_ != b.rank_) return a.rank_ < b.rank_;
        return a.suit_ < b.suit_;
    }

private:
    Rank rank_;
    Suit suit_;
};

} // namespace phh::domain::cards

namespace std {

template <>
struct hash<phh::domain::cards::Card> {
    size_t operator()(const phh::domain::cards::Card& c) const noexcept {
        return static_cast<size_t>(phh::domain::cards::rankValue(c.rank()) * 4 +
                                   static_cast<int>(c.suit()));
    }
};

} // namespace std
