#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"
#include "domain/hand/Street.hpp"

namespace phh::domain {

using ActionList = std::vector<PlayerAction>;

// A fully parsed hand. Produced once by the parser, read-only afterwards.
struct Hand {
    HandHeader header;

    std::string tableName;
    int         maxPlayers{0};
    int         buttonSeat{0};

    // Index = seat number - 1; empty seats stay std::nullopt.
    std::vector<std::optional<Player>> players;
    std::optional<int>                 heroSeat;

    std::optional<ActionList> preflopActions;
    std::optional<Street>     flop;
    std::optional<Street>     turn;
    std::optional<Street>     river;

    bool                      showDown{false};
    std::optional<ActionList> showDownActions; // present iff showDown

    std::optional<Money>                    totalPot;
    std::optional<Money>                    rake;
    std::optional<std::vector<cards::Card>> board;
    std::set<std::string>                   winners;

    const Player* seatAt(int seat) const {
        if (seat < 1 || seat > static_cast<int>(players.size())) return nullptr;
        const auto& slot = players[static_cast<size_t>(seat - 1)];
        return slot ? &*slot : nullptr;
    }

    const Player* button() const { return seatAt(buttonSeat); }
    const Player* hero() const { return heroSeat ? seatAt(*heroSeat) : nullptr; }

    std::optional<cards::Card> turnCard() const {
        if (!turn || turn->cards().empty()) return std::nullopt;
        return turn->cards().front();
    }
    std::optional<cards::Card> riverCard() const {
        if (!river || river->cards().empty()) return std::nullopt;
        return river->cards().front();
    }

    std::optional<ActionList> flopActions() const { return flop ? flop->actions() : std::optional<ActionList>{}; }
    std::optional<ActionList> turnActions() const { return turn ? turn->actions() : std::optional<ActionList>{}; }
    std::optional<ActionList> riverActions() const { return river ? river->actions() : std::optional<ActionList>{}; }
};

inline bool operator==(const Hand& a, const Hand& b) {
    return a.header == b.header && a.tableName == b.tableName &&
           a.maxPlayers == b.maxPlayers && a.buttonSeat == b.buttonSeat &&
           a.players == b.players && a.heroSeat == b.heroSeat &&
           a.preflopActions == b.preflopActions && a.flop == b.flop &&
           a.turn == b.turn && a.river == b.river && a.showDown == b.showDown &&
           a.showDownActions == b.showDownActions && a.totalPot == b.totalPot &&
           a.rake == b.rake && a.board == b.board && a.winners == b.winners;
}
inline bool operator!=(const Hand& a, const Hand& b) { return !(a == b); }

} // namespace phh::domain
