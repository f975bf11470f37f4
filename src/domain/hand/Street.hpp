#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"
#include "domain/hand/BoardTexture.hpp"

namespace phh::domain {

enum class StreetKind {
    Flop  = 0,
    Turn  = 1,
    River = 2
};

inline std::string to_string(StreetKind k) {
    switch (k) {
        case StreetKind::Flop:  return "Flop";
        case StreetKind::Turn:  return "Turn";
        case StreetKind::River: return "River";
    }
    return "Unknown";
}

// One post-flop betting round: the board cards it dealt (3 on the flop,
// 1 on turn and river) and the actions taken during it, in log order.
class Street {
public:
    Street(StreetKind kind, std::vector<cards::Card> cards, std::vector<PlayerAction> actions);

    StreetKind kind() const noexcept { return kind_; }
    const std::vector<cards::Card>& cards() const noexcept { return cards_; }

    // nullopt when nobody acted on this street (e.g. everyone all-in).
    const std::optional<std::vector<PlayerAction>>& actions() const noexcept { return actions_; }

    // Distinct actor names in order of first appearance.
    std::vector<std::string> players() const;

    // Only the flop has a texture.
    const std::optional<BoardTexture>& texture() const noexcept { return texture_; }

    friend bool operator==(const Street& a, const Street& b) {
        return a.kind_ == b.kind_ && a.cards_ == b.cards_ && a.actions_ == b.actions_;
    }
    friend bool operator!=(const Street& a, const Street& b) { return !(a == b); }

private:
    StreetKind                               kind_;
    std::vector<cards::Card>                 cards_;
    std::optional<std::vector<PlayerAction>> actions_;
    std::optional<BoardTexture>              texture_;
};

} // namespace phh::domain
