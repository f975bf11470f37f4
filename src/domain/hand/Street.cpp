#include "domain/hand/Street.hpp"

#include <algorithm>
#include <utility>

namespace phh::domain {

Street::Street(StreetKind kind, std::vector<cards::Card> cards, std::vector<PlayerAction> actions)
    : kind_(kind), cards_(std::move(cards)) {
    if (!actions.empty()) {
        actions_ = std::move(actions);
    }
    if (kind_ == StreetKind::Flop && cards_.size() == 3) {
        texture_ = BoardTexture::analyze({cards_[0], cards_[1], cards_[2]});
    }
}

std::vector<std::string> Street::players() const {
    std::vector<std::string> names;
    if (!actions_) return names;

    for (const auto& a : *actions_) {
        if (std::find(names.begin(), names.end(), a.name) == names.end()) {
            names.push_back(a.name);
        }
    }
    return names;
}

} // namespace phh::domain
