#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>

#include "domain/Money.hpp"
#include "domain/cards/Combo.hpp"

namespace phh::domain {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// --- Game description -------------------------------------------------------

enum class GameType {
    Cash       = 0,
    Tournament = 1
};

enum class Game {
    Holdem    = 0,
    Omaha     = 1,
    OmahaHiLo = 2
};

enum class Limit {
    NoLimit    = 0,
    PotLimit   = 1,
    FixedLimit = 2
};

enum class Currency {
    USD       = 0,
    EUR       = 1,
    GBP       = 2,
    StarsCoin = 3
};

enum class MoneyType {
    Real = 0,
    Play = 1
};

// Number of hole cards dealt to each player in the variant.
inline int holeCardCount(Game g) {
    return g == Game::Holdem ? 2 : 4;
}

// --- Actions -----------------------------------------------------------------

enum class ActionKind {
    Bet          = 0,
    Raise        = 1,
    Check        = 2,
    Fold         = 3,
    Call         = 4,
    Return       = 5,  // uncalled bet returned
    Win          = 6,  // collected from (side) pot
    Muck         = 7,
    Show         = 8,
    Join         = 9,
    Leave        = 10,
    TimedOut     = 11,
    Connected    = 12,
    Disconnected = 13,
    Removed      = 14,
    Think        = 15  // time bank warning
};

struct PlayerAction {
    std::string                  name;
    ActionKind                   kind{ActionKind::Fold};
    std::optional<Money>         amount;
    std::optional<cards::Combo>  combo;   // Show only
    std::optional<int>           seat;    // Join only
    bool                         allIn{false};
};

inline bool operator==(const PlayerAction& a, const PlayerAction& b) {
    return a.name == b.name && a.kind == b.kind && a.amount == b.amount &&
           a.combo == b.combo && a.seat == b.seat && a.allIn == b.allIn;
}
inline bool operator!=(const PlayerAction& a, const PlayerAction& b) { return !(a == b); }

// --- Seats -------------------------------------------------------------------

struct Player {
    std::string                 name;
    Money                       stack;
    int                         seat{0}; // 1..maxPlayers
    std::optional<cards::Combo> combo;
    bool                        sittingOut{false};
};

inline bool operator==(const Player& a, const Player& b) {
    return a.name == b.name && a.stack == b.stack && a.seat == b.seat &&
           a.combo == b.combo && a.sittingOut == b.sittingOut;
}
inline bool operator!=(const Player& a, const Player& b) { return !(a == b); }

// --- Header ------------------------------------------------------------------

struct TournamentInfo {
    std::string                id;
    std::optional<std::string> level;   // roman numeral as printed, e.g. "XI"
    bool                       freeroll{false};
    Money                      buyin;
    Money                      rake;
    std::optional<Money>       bounty;  // knockout tournaments
};

inline bool operator==(const TournamentInfo& a, const TournamentInfo& b) {
    return a.id == b.id && a.level == b.level && a.freeroll == b.freeroll &&
           a.buyin == b.buyin && a.rake == b.rake && a.bounty == b.bounty;
}

struct CashGameInfo {};

inline bool operator==(const CashGameInfo&, const CashGameInfo&) { return true; }

using GameContext = std::variant<CashGameInfo, TournamentInfo>;

struct HandHeader {
    std::string             ident;
    GameContext             context;
    std::optional<Currency> currency;   // unset for play money
    MoneyType               moneyType{MoneyType::Play};
    Money                   smallBlind;
    Money                   bigBlind;
    Limit                   limit{Limit::NoLimit};
    Game                    game{Game::Holdem};
    TimePoint               date;       // UTC instant of the room's canonical (ET) stamp

    GameType gameType() const {
        return std::holds_alternative<TournamentInfo>(context) ? GameType::Tournament
                                                               : GameType::Cash;
    }

    const TournamentInfo* tournament() const {
        return std::get_if<TournamentInfo>(&context);
    }
};

inline bool operator==(const HandHeader& a, const HandHeader& b) {
    return a.ident == b.ident && a.context == b.context && a.currency == b.currency &&
           a.moneyType == b.moneyType && a.smallBlind == b.smallBlind &&
           a.bigBlind == b.bigBlind && a.limit == b.limit && a.game == b.game &&
           a.date == b.date;
}
inline bool operator!=(const HandHeader& a, const HandHeader& b) { return !(a == b); }

// --- Helpers -----------------------------------------------------------------

inline std::string to_string(GameType t) {
    switch (t) {
        case GameType::Cash:       return "Cash";
        case GameType::Tournament: return "Tournament";
    }
    return "Unknown";
}

inline std::string to_string(Game g) {
    switch (g) {
        case Game::Holdem:    return "Hold'em";
        case Game::Omaha:     return "Omaha";
        case Game::OmahaHiLo: return "Omaha Hi/Lo";
    }
    return "Unknown";
}

inline std::string to_string(Limit l) {
    switch (l) {
        case Limit::NoLimit:    return "No Limit";
        case Limit::PotLimit:   return "Pot Limit";
        case Limit::FixedLimit: return "Limit";
    }
    return "Unknown";
}

inline std::string to_string(Currency c) {
    switch (c) {
        case Currency::USD:       return "USD";
        case Currency::EUR:       return "EUR";
        case Currency::GBP:       return "GBP";
        case Currency::StarsCoin: return "SC";
    }
    return "Unknown";
}

inline std::string to_string(MoneyType m) {
    switch (m) {
        case MoneyType::Real: return "Real";
        case MoneyType::Play: return "Play";
    }
    return "Unknown";
}

inline std::string to_string(ActionKind k) {
    switch (k) {
        case ActionKind::Bet:          return "bet";
        case ActionKind::Raise:        return "raise";
        case ActionKind::Check:        return "check";
        case ActionKind::Fold:         return "fold";
        case ActionKind::Call:         return "call";
        case ActionKind::Return:       return "return";
        case ActionKind::Win:          return "win";
        case ActionKind::Muck:         return "muck";
        case ActionKind::Show:         return "show";
        case ActionKind::Join:         return "join";
        case ActionKind::Leave:        return "leave";
        case ActionKind::TimedOut:     return "timed out";
        case ActionKind::Connected:    return "connected";
        case ActionKind::Disconnected: return "disconnected";
        case ActionKind::Removed:      return "removed";
        case ActionKind::Think:        return "think";
    }
    return "unknown";
}

// Currency codes as printed in hand histories ("USD", "SC", ...).
inline std::optional<Currency> currencyFromCode(const std::string& code) {
    if (code == "USD") return Currency::USD;
    if (code == "EUR") return Currency::EUR;
    if (code == "GBP") return Currency::GBP;
    if (code == "SC")  return Currency::StarsCoin;
    return std::nullopt;
}

} // namespace phh::domain
