#pragma once

#include <array>

#include "domain/cards/Card.hpp"

namespace phh::domain {

// Light texture predicates of a flop. Turn and river never change them.
struct BoardTexture {
    bool rainbow{false};       // three different suits
    bool monotone{false};      // one suit
    bool triplet{false};       // three cards of one rank
    bool paired{false};        // at least two cards of one rank
    bool flushDraw{false};     // at least two cards share a suit
    bool straightDraw{false};  // two ranks at most 3 apart (and distinct)
    bool gutshot{false};       // two ranks at most 4 apart (and distinct)

    static BoardTexture analyze(const std::array<cards::Card, 3>& flop);
};

inline bool operator==(const BoardTexture& a, const BoardTexture& b) {
    return a.rainbow == b.rainbow && a.monotone == b.monotone && a.triplet == b.triplet &&
           a.paired == b.paired && a.flushDraw == b.flushDraw &&
           a.straightDraw == b.straightDraw && a.gutshot == b.gutshot;
}

} // namespace phh::domain
