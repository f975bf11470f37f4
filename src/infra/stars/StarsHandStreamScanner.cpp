#include "infra/stars/StarsHandStreamScanner.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace phh::infra::stars {

namespace {

static inline bool isBlankLine(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

static inline void rstripCr(std::string& s) {
    if (!s.empty() && s.back() == '\r') s.pop_back();
}

static inline void stripBom(std::string& s) {
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

static inline bool isHandStart(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    return line.compare(i, 11, "PokerStars ") == 0;
}

static inline void finalizeHand(HandChunk& h) {
    while (!h.text.empty() && std::isspace(static_cast<unsigned char>(h.text.back()))) {
        h.text.pop_back();
    }
}

HandStreamScanResult scanStream(std::istream& in,
                                std::uint64_t streamSize,
                                const std::function<bool(const HandChunk&, std::uint64_t, std::string*)>& onHand,
                                int maxHands) {
    HandStreamScanResult res;

    HandChunk cur;
    bool inHand = false;

    std::string line;
    bool firstLine = true;

    std::uint64_t lineStart = 0;

    // Emits `cur`; sets stop when scanning must end (res is then final).
    auto emit = [&](std::uint64_t endOffset, bool& stop) {
        cur.offsetEnd = endOffset;
        finalizeHand(cur);

        std::string cbErr;
        const bool cont = onHand(cur, res.bytesProcessed, &cbErr);
        if (!cbErr.empty()) {
            res.ok = false;
            res.error = cbErr;
            stop = true;
            return;
        }
        ++res.hands;
        if (!cont || (maxHands > 0 && res.hands >= maxHands)) {
            res.ok = true;
            stop = true;
        }
    };

    while (std::getline(in, line)) {
        const std::uint64_t lineLen = static_cast<std::uint64_t>(line.size()) + (in.eof() ? 0 : 1);
        const std::uint64_t after = lineStart + lineLen;

        if (firstLine) {
            firstLine = false;
            stripBom(line);
        }
        rstripCr(line);

        if (isHandStart(line)) {
            if (inHand) {
                bool stop = false;
                emit(lineStart, stop);
                if (stop) return res;
            }
            inHand = true;
            cur = HandChunk{};
            cur.offsetStart = lineStart;
        }

        if (inHand) {
            if (!cur.text.empty() || !isBlankLine(line)) {
                cur.text += line;
                cur.text.push_back('\n');
            }
        }
        // Preamble noise before the first header is skipped.

        lineStart = after;
        res.bytesProcessed = after;
    }

    // EOF: flush last hand if any.
    if (inHand) {
        bool stop = false;
        emit(streamSize, stop);
        if (!res.error.empty()) return res;
    }

    res.ok = (res.hands > 0);
    if (!res.ok) res.error = "No PokerStars hands found";
    return res;
}

} // namespace

HandStreamScanResult scanHandFile(
    const std::string& filePath,
    const std::function<bool(const HandChunk&, std::uint64_t, std::string*)>& onHand,
    int maxHands) {

    std::ifstream in(filePath, std::ios::binary);
    if (!in.is_open()) {
        HandStreamScanResult res;
        res.ok = false;
        res.error = "Cannot open hand history file";
        return res;
    }

    in.seekg(0, std::ios::end);
    const auto endPos = in.tellg();
    const std::uint64_t fileSize = endPos < 0 ? 0 : static_cast<std::uint64_t>(endPos);
    in.seekg(0, std::ios::beg);

    return scanStream(in, fileSize, onHand, maxHands);
}

HandStreamScanResult scanHandText(
    const std::string& text,
    const std::function<bool(const HandChunk&, std::uint64_t, std::string*)>& onHand,
    int maxHands) {

    std::istringstream in(text);
    return scanStream(in, static_cast<std::uint64_t>(text.size()), onHand, maxHands);
}

} // namespace phh::infra::stars
