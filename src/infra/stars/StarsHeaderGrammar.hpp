#pragma once

#include <string>

#include <QString>

#include "domain/domain_model.hpp"
#include "infra/stars/StarsParserSettings.hpp"

namespace phh::infra::stars {

struct HeaderParseResult {
    bool ok{false};
    std::string error;
    std::string handId; // filled whenever "Hand #N:" could be read, even on failure
    phh::domain::HandHeader header;
};

// Parses the first line of a PokerStars hand, e.g.
//
//   PokerStars Hand #105024000105: Tournament #797469411, $3.19+$0.31 USD Hold'em No Limit
//       - Level I (10/20) - 2013/10/04 19:53:27 CET [2013/10/04 13:53:27 ET]
//   PokerStars Hand #107030112846: Omaha Pot Limit ($0.01/$0.02 USD) - 2013/11/15 9:03:10 AWST
//       [2013/11/14 20:03:10 ET]
//
// The line is matched structurally once, then the buy-in segment and the
// blinds are each checked against their mutually exclusive sub-grammars;
// zero or several matching branches reject the line. Whether the hand is a
// tournament is decided only by the "Tournament #" id, never by how the
// blinds look: play-money cash blinds "10/20" read exactly like tournament blinds.
HeaderParseResult parseHeaderLine(const QString& line, const ParserSettings& settings = {});

} // namespace phh::infra::stars
