#include "domain/cards/Card.hpp"

namespace phh::domain::cards {

std::optional<Rank> rankFromChar(char c) {
    switch (c) {
        case '2': return Rank::Two;
        case '3': return Rank::Three;
        case '4': return Rank::Four;
        case '5': return Rank::Five;
        case '6': return Rank::Six;
        case '7': return Rank::Seven;
        case '8': return Rank::Eight;
        case '9': return Rank::Nine;
        case 'T': return Rank::Ten;
        case 'J': return Rank::Jack;
        case 'Q': return Rank::Queen;
        case 'K': return Rank::King;
        case 'A': return Rank::Ace;
        default: return std::nullopt;
    }
}

std::optional<Suit> suitFromChar(char c) {
    switch (c) {
        case 'c': case 'C': return Suit::Clubs;
        case 'd': case 'D': return Suit::Diamonds;
        case 'h': case 'H': return Suit::Hearts;
        case 's': case 'S': return Suit::Spades;
        default: return std::nullopt;
    }
}

char toChar(Rank r) {
    switch (r) {
        case Rank::Two:   return '2';
        case Rank::Three: return '3';
        case Rank::Four:  return '4';
        case Rank::Five:  return '5';
        case Rank::Six:   return '6';
        case Rank::Seven: return '7';
        case Rank::Eight: return '8';
        case Rank::Nine:  return '9';
        case Rank::Ten:   return 'T';
        case Rank::Jack:  return 'J';
        case Rank::Queen: return 'Q';
        case Rank::King:  return 'K';
        case Rank::Ace:   return 'A';
    }
    return '?';
}

char toChar(Suit s) {
    switch (s) {
        case Suit::Clubs:    return 'c';
        case Suit::Diamonds: return 'd';
        case Suit::Hearts:   return 'h';
        case Suit::Spades:   return 's';
    }
    return '?';
}

std::optional<Card> Card::fromString(std::string_view text) {
    if (text.size() != 2) return std::nullopt;
    const auto r = rankFromChar(text[0]);
    const auto s = suitFromChar(text[1]);
    if (!r || !s) return std::nullopt;
    return Card(*r, *s);
}

std::string Card::toString() const {
    std::string s;
    s.push_back(toChar(rank_));
    s.push_back(toChar(suit_));
    return s;
}

} // namespace phh::domain::cards
