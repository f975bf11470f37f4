#pragma once

#include <optional>
#include <string>
#include <vector>

#include "app/IParseDiagnostics.hpp"
#include "domain/hand/Hand.hpp"
#include "infra/stars/ParseError.hpp"
#include "infra/stars/StarsParserSettings.hpp"
#include "infra/stars/StarsSectionSplitter.hpp"

namespace phh::infra::stars {

enum class ParseState {
    Unparsed     = 0,
    HeaderParsed = 1,
    FullyParsed  = 2,
    Failed       = 3
};

inline std::string to_string(ParseState s) {
    switch (s) {
        case ParseState::Unparsed:     return "Unparsed";
        case ParseState::HeaderParsed: return "HeaderParsed";
        case ParseState::FullyParsed:  return "FullyParsed";
        case ParseState::Failed:       return "Failed";
    }
    return "Unknown";
}

// One PokerStars hand history, parsed in two phases.
//
// parseHeader() reads only the first line (cheap, enough for filtering by
// stakes/date); parse() reads the rest and runs parseHeader() first if needed.
// Both calls are idempotent. A fatal error moves the hand to Failed and is
// available through error(); nothing else is thrown.
//
// Non-fatal events (unknown action lines, absent optional data) go to the
// diagnostics sink passed to the call, or to Qt logging when none is given.
class StarsHandHistory {
public:
    explicit StarsHandHistory(std::string rawText, ParserSettings settings = {});

    ParseState state() const noexcept { return state_; }

    bool parseHeader(phh::app::IParseDiagnostics* diagnostics = nullptr);
    bool parse(phh::app::IParseDiagnostics* diagnostics = nullptr);

    // Non-null once the header is parsed (also after a later body failure).
    const phh::domain::HandHeader* header() const noexcept {
        return headerParsed_ ? &hand_.header : nullptr;
    }

    // Non-null only in FullyParsed.
    const phh::domain::Hand* hand() const noexcept {
        return state_ == ParseState::FullyParsed ? &hand_ : nullptr;
    }

    const std::optional<ParseError>& error() const noexcept { return error_; }

    const std::string& raw() const noexcept { return raw_; }

    // "<StarsHandHistory: #105024000105>"
    std::string describe() const;

private:
    bool parseBody(phh::domain::Hand& h, phh::app::IParseDiagnostics& sink);

    bool parseTable(phh::domain::Hand& h, const Section& headerSection);
    void parseSeats(phh::domain::Hand& h, const Section& headerSection, phh::app::IParseDiagnostics& sink);
    bool parseHero(phh::domain::Hand& h, const Section& holeCards, phh::app::IParseDiagnostics& sink);
    bool parseStreets(phh::domain::Hand& h, phh::app::IParseDiagnostics& sink);
    bool parseSummary(phh::domain::Hand& h, const Section& summary, phh::app::IParseDiagnostics& sink);
    void parseWinners(phh::domain::Hand& h, const Section& summary, phh::app::IParseDiagnostics& sink);

    // Classifies lines into out; unknown lines are reported and dropped.
    // Returns false (error_ set) on a fatal card error.
    bool classifyLines(const QStringList& lines, std::vector<phh::domain::PlayerAction>& out,
                       phh::app::IParseDiagnostics& sink);

    bool fail(ParseErrorKind kind, const QString& offendingText, std::string message);
    void note(phh::app::IParseDiagnostics& sink, phh::app::DiagnosticKind kind, const QString& text,
              std::string message) const;

    std::string    raw_;
    ParserSettings settings_;
    ParseState     state_{ParseState::Unparsed};
    bool           headerParsed_{false};

    SplitHand                 split_; // kept between the two phases only
    phh::domain::Hand         hand_;
    std::optional<ParseError> error_;
};

} // namespace phh::infra::stars
