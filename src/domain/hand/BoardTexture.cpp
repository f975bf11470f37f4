#include "domain/hand/BoardTexture.hpp"

#include <cstdlib>

namespace phh::domain {

using cards::Card;

BoardTexture BoardTexture::analyze(const std::array<Card, 3>& flop) {
    BoardTexture t;

    int sameSuitPairs = 0;
    int sameRankPairs = 0;
    bool closeWithin3 = false;
    bool closeWithin4 = false;

    // Pairwise over (0,1), (0,2), (1,2).
    for (size_t i = 0; i < flop.size(); ++i) {
        for (size_t j = i + 1; j < flop.size(); ++j) {
            const Card& a = flop[i];
            const Card& b = flop[j];

            if (a.suit() == b.suit()) ++sameSuitPairs;
            if (a.rank() == b.rank()) ++sameRankPairs;

            const int gap = std::abs(rankValue(a.rank()) - rankValue(b.rank()));
            if (gap >= 1 && gap <= 3) closeWithin3 = true;
            if (gap >= 1 && gap <= 4) closeWithin4 = true;
        }
    }

    t.rainbow      = (sameSuitPairs == 0);
    t.monotone     = (sameSuitPairs == 3);
    t.flushDraw    = (sameSuitPairs > 0);
    t.triplet      = (sameRankPairs == 3);
    t.paired       = (sameRankPairs > 0);
    t.straightDraw = closeWithin3;
    t.gutshot      = closeWithin4;
    return t;
}

} // namespace phh::domain
