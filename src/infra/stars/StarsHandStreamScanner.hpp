#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace phh::infra::stars {

struct HandChunk {
    std::uint64_t offsetStart{0}; // byte offset of the "PokerStars ..." header line
    std::uint64_t offsetEnd{0};   // byte offset (exclusive) where the hand ends

    std::string text; // the hand's lines joined with '\n', trailing blank lines removed
};

struct HandStreamScanResult {
    bool ok{false};
    std::string error;

    int hands{0};
    std::uint64_t bytesProcessed{0};
};

// Streaming scanner for a PokerStars history file holding many hands.
//
// A hand starts at every line beginning with "PokerStars " and runs up to the
// next such line or EOF; text before the first header is ignored. Hands are
// only sliced here, not parsed. For each hand it calls
// onHand(chunk, bytesProcessed, errorOut).
//
// onHand should return true to continue scanning, or false to stop early (treated as ok=true).
HandStreamScanResult scanHandFile(const std::string& filePath,
                                  const std::function<bool(const HandChunk&,
                                                           std::uint64_t bytesProcessed,
                                                           std::string* errorOut)>& onHand,
                                  int maxHands = -1);

// Same slicing over text already in memory; offsets are relative to `text`.
HandStreamScanResult scanHandText(const std::string& text,
                                  const std::function<bool(const HandChunk&,
                                                           std::uint64_t bytesProcessed,
                                                           std::string* errorOut)>& onHand,
                                  int maxHands = -1);

} // namespace phh::infra::stars
