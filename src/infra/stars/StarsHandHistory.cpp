#include "infra/stars/StarsHandHistory.hpp"

#include <unordered_set>
#include <utility>

#include <QRegularExpression>

#include "infra/LoggingDiagnostics.hpp"
#include "infra/stars/StarsActionClassifier.hpp"
#include "infra/stars/StarsHeaderGrammar.hpp"

namespace phh::infra::stars {

using phh::app::DiagnosticKind;
using phh::app::IParseDiagnostics;
using phh::domain::Hand;
using phh::domain::Money;
using phh::domain::Player;
using phh::domain::PlayerAction;
using phh::domain::Street;
using phh::domain::StreetKind;
using phh::domain::cards::Card;

namespace {

// --------------------------- Line grammars ----------------------------------

const QRegularExpression& tableRe() {
    static const QRegularExpression re(QStringLiteral(
        R"(^Table '(?<name>.*)' (?<max>\d+)-max(?: \(Play Money\))? Seat #(?<button>\d+) is the button)"));
    return re;
}

const QRegularExpression& seatRe() {
    static const QRegularExpression re(QStringLiteral(
        R"(^Seat (?<seat>\d+): (?<name>.+?) \([$\x{20AC}\x{00A3}]?(?<stack>\d+(?:\.\d+)?) in chips)"
        R"((?:, [$\x{20AC}\x{00A3}]?\d+(?:\.\d+)? bounty)?\)(?<rest>.*)$)"));
    return re;
}

const QRegularExpression& heroRe() {
    static const QRegularExpression re(QStringLiteral(R"(^Dealt to (?<name>.+?) \[(?<cards>[^\]]+)\])"));
    return re;
}

const QRegularExpression& potRe() {
    static const QRegularExpression re(QStringLiteral(
        R"(^Total pot \D*?(?<pot>\d+(?:\.\d+)?)\b.*?\| Rake \D*?(?<rake>\d+(?:\.\d+)?))"));
    return re;
}

const QRegularExpression& bracketRe() {
    static const QRegularExpression re(QStringLiteral(R"(\[([^\]]*)\])"));
    return re;
}

// Summary recap: "Seat 5: W2lkm2n (button) collected (150)".
const QRegularExpression& collectedWinnerRe() {
    static const QRegularExpression re(QStringLiteral(
        R"(^Seat \d+: (?<name>.+?)(?: \((?:button|small blind|big blind)\))* collected \()"));
    return re;
}

// Summary recap: "Seat 9: costamar showed [Ac Qc] and won (26310) with ...".
const QRegularExpression& showdownWinnerRe() {
    static const QRegularExpression re(QStringLiteral(
        R"(^Seat \d+: (?<name>.+?)(?: \((?:button|small blind|big blind)\))* showed \[[^\]]*\] and won)"));
    return re;
}

// --------------------------- Helpers ----------------------------------------

QStringList bracketGroups(const QString& text) {
    QStringList out;
    auto it = bracketRe().globalMatch(text);
    while (it.hasNext()) {
        out.push_back(it.next().captured(1));
    }
    return out;
}

std::optional<std::vector<Card>> cardsOf(const QString& text) {
    return phh::domain::cards::parseCardList(text.toStdString());
}

bool allDistinct(const std::vector<Card>& cards) {
    std::unordered_set<Card> seen;
    for (const auto& c : cards) {
        if (!seen.insert(c).second) return false;
    }
    return true;
}

} // namespace

// --------------------------- StarsHandHistory --------------------------------

StarsHandHistory::StarsHandHistory(std::string rawText, ParserSettings settings)
    : raw_(std::move(rawText)), settings_(std::move(settings)) {
}

std::string StarsHandHistory::describe() const {
    const std::string id = headerParsed_ ? hand_.header.ident : std::string("?");
    return "<StarsHandHistory: #" + id + ">";
}

bool StarsHandHistory::fail(ParseErrorKind kind, const QString& offendingText, std::string message) {
    ParseError e;
    e.kind = kind;
    e.handId = hand_.header.ident;
    e.offendingText = offendingText.toStdString();
    e.message = std::move(message);
    error_ = std::move(e);
    state_ = ParseState::Failed;
    split_ = SplitHand{};
    return false;
}

void StarsHandHistory::note(IParseDiagnostics& sink, DiagnosticKind kind, const QString& text,
                            std::string message) const {
    if (kind == DiagnosticKind::UnrecognizedAction && !settings_.reportUnrecognizedLines) return;

    phh::app::Diagnostic d;
    d.kind = kind;
    d.handId = hand_.header.ident;
    d.text = text.toStdString();
    d.message = std::move(message);
    sink.report(d);
}

bool StarsHandHistory::parseHeader(IParseDiagnostics* diagnostics) {
    if (state_ == ParseState::Failed) return false;
    if (headerParsed_) return true;

    split_ = splitHandText(raw_);
    const Section* headerSection = split_.find(SectionKind::Header);
    if (!headerSection || headerSection->lines.isEmpty()) {
        return fail(ParseErrorKind::HeaderFormat, QString(), "hand text has no header line");
    }

    const QString& line = headerSection->lines.front();
    auto res = parseHeaderLine(line, settings_);
    if (!res.ok) {
        hand_.header.ident = res.handId;
        return fail(ParseErrorKind::HeaderFormat, line, res.error);
    }

    hand_.header = std::move(res.header);
    headerParsed_ = true;
    state_ = ParseState::HeaderParsed;

    if (diagnostics && split_.find(SectionKind::Summary) == nullptr) {
        // Early warning for callers that stop after the header.
        note(*diagnostics, DiagnosticKind::MissingSection, QString(), "no SUMMARY section");
    }
    return true;
}

bool StarsHandHistory::parse(IParseDiagnostics* diagnostics) {
    if (state_ == ParseState::FullyParsed) return true;
    if (state_ == ParseState::Failed) return false;
    if (!headerParsed_ && !parseHeader(diagnostics)) return false;

    IParseDiagnostics& sink = diagnostics ? *diagnostics : LoggingDiagnostics::instance();

    // Build into a copy so a failure never leaves a half-filled record behind.
    Hand h;
    h.header = hand_.header;
    if (!parseBody(h, sink)) return false;

    hand_ = std::move(h);
    split_ = SplitHand{};
    state_ = ParseState::FullyParsed;
    return true;
}

bool StarsHandHistory::parseBody(Hand& h, IParseDiagnostics& sink) {
    const Section* headerSection = split_.find(SectionKind::Header);
    if (!parseTable(h, *headerSection)) return false;
    parseSeats(h, *headerSection, sink);

    if (!h.button()) {
        note(sink, DiagnosticKind::MissingSection, QString(),
             "button seat #" + std::to_string(h.buttonSeat) + " is empty");
    }

    const Section* holeCards = split_.find(SectionKind::HoleCards);
    if (holeCards) {
        if (!parseHero(h, *holeCards, sink)) return false;

        std::vector<PlayerAction> preflop;
        QStringList lines;
        for (const auto& line : holeCards->lines) {
            if (!line.startsWith(QStringLiteral("Dealt to "))) lines.push_back(line);
        }
        if (!classifyLines(lines, preflop, sink)) return false;
        if (!preflop.empty()) h.preflopActions = std::move(preflop);
    } else {
        note(sink, DiagnosticKind::MissingSection, QString(), "no HOLE CARDS section");
    }

    if (!parseStreets(h, sink)) return false;

    if (const Section* showDown = split_.find(SectionKind::ShowDown)) {
        std::vector<PlayerAction> actions;
        if (!classifyLines(showDown->lines, actions, sink)) return false;
        h.showDown = true;
        h.showDownActions = std::move(actions);
    }

    const Section* summary = split_.find(SectionKind::Summary);
    if (!summary) {
        note(sink, DiagnosticKind::MissingSection, QString(), "no SUMMARY section");
        return true;
    }
    if (!parseSummary(h, *summary, sink)) return false;
    parseWinners(h, *summary, sink);
    return true;
}

bool StarsHandHistory::parseTable(Hand& h, const Section& headerSection) {
    const QString line = headerSection.lines.size() > 1 ? headerSection.lines.at(1) : QString();
    const auto m = tableRe().match(line);
    if (!m.hasMatch()) {
        return fail(ParseErrorKind::TableFormat, line, "missing or malformed table line");
    }

    const int maxPlayers = m.captured(QStringLiteral("max")).toInt();
    if (maxPlayers <= 0) {
        return fail(ParseErrorKind::TableFormat, line, "table has no seats");
    }

    h.tableName = m.captured(QStringLiteral("name")).toStdString();
    h.maxPlayers = maxPlayers;
    h.buttonSeat = m.captured(QStringLiteral("button")).toInt();
    h.players.assign(static_cast<size_t>(maxPlayers), std::nullopt);
    return true;
}

void StarsHandHistory::parseSeats(Hand& h, const Section& headerSection, IParseDiagnostics& sink) {
    for (int i = 2; i < headerSection.lines.size(); ++i) {
        const QString& line = headerSection.lines.at(i);
        const auto m = seatRe().match(line);
        // Seats are listed first; the posting lines that follow end the block.
        if (!m.hasMatch()) break;

        const int seat = m.captured(QStringLiteral("seat")).toInt();
        if (seat < 1 || seat > h.maxPlayers) {
            note(sink, DiagnosticKind::SkippedLine, line, "seat outside the table");
            continue;
        }

        Player p;
        p.name = m.captured(QStringLiteral("name")).toStdString();
        p.stack = Money::parse(m.captured(QStringLiteral("stack")).toStdString()).value_or(Money{});
        p.seat = seat;
        p.sittingOut = m.captured(QStringLiteral("rest")).contains(QStringLiteral("sitting out"));
        h.players[static_cast<size_t>(seat - 1)] = std::move(p);
    }
}

bool StarsHandHistory::parseHero(Hand& h, const Section& holeCards, IParseDiagnostics& sink) {
    QRegularExpressionMatch m;
    for (const auto& line : holeCards.lines) {
        m = heroRe().match(line);
        if (m.hasMatch()) break;
    }
    if (!m.hasMatch()) return true; // observer / tournament replay without hole cards

    const std::string name = m.captured(QStringLiteral("name")).toStdString();
    Player* hero = nullptr;
    for (auto& slot : h.players) {
        if (slot && slot->name == name) {
            hero = &*slot;
            break;
        }
    }
    if (!hero) {
        note(sink, DiagnosticKind::SkippedLine, m.captured(0), "dealt-to player is not seated");
        return true;
    }

    auto cards = cardsOf(m.captured(QStringLiteral("cards")));
    const auto expected = static_cast<size_t>(phh::domain::holeCardCount(h.header.game));
    if (!cards || cards->size() != expected) {
        return fail(ParseErrorKind::InvalidCombo, m.captured(0),
                    "expected " + std::to_string(expected) + " hole cards for " +
                        phh::domain::to_string(h.header.game));
    }

    std::string err;
    auto combo = phh::domain::cards::Combo::fromCards(std::move(*cards), &err);
    if (!combo) {
        return fail(ParseErrorKind::InvalidCombo, m.captured(0), err);
    }

    hero->combo = std::move(combo);
    h.heroSeat = hero->seat;
    return true;
}

bool StarsHandHistory::parseStreets(Hand& h, IParseDiagnostics& sink) {
    const Section* flop = split_.find(SectionKind::Flop);
    if (!flop) {
        note(sink, DiagnosticKind::MissingSection, QString(), "no FLOP section");
        return true;
    }

    std::vector<Card> board;

    // Flop: "[2s 6d 6h]". Turn / river: "[6s 4d 3s] [8c]" -- the new card is the last group.
    auto dealt = [&](const Section& s, size_t count, std::vector<Card>& out) -> bool {
        const QStringList groups = bracketGroups(s.boardText);
        auto cards = groups.isEmpty() ? std::nullopt : cardsOf(groups.back());
        if (!cards || cards->size() != count) {
            return fail(ParseErrorKind::InvalidCombo, s.boardText,
                        "expected " + std::to_string(count) + " new board card(s) on " + s.marker.toStdString());
        }
        board.insert(board.end(), cards->begin(), cards->end());
        if (!allDistinct(board)) {
            return fail(ParseErrorKind::InvalidCombo, s.boardText, "board repeats a card");
        }
        out = std::move(*cards);
        return true;
    };

    std::vector<Card> flopCards;
    std::vector<PlayerAction> flopActions;
    if (!dealt(*flop, 3, flopCards)) return false;
    if (!classifyLines(flop->lines, flopActions, sink)) return false;
    h.flop = Street(StreetKind::Flop, std::move(flopCards), std::move(flopActions));

    const Section* turn = split_.find(SectionKind::Turn);
    if (!turn) return true;

    std::vector<Card> turnCards;
    std::vector<PlayerAction> turnActions;
    if (!dealt(*turn, 1, turnCards)) return false;
    if (!classifyLines(turn->lines, turnActions, sink)) return false;
    h.turn = Street(StreetKind::Turn, std::move(turnCards), std::move(turnActions));

    const Section* river = split_.find(SectionKind::River);
    if (!river) return true;

    std::vector<Card> riverCards;
    std::vector<PlayerAction> riverActions;
    if (!dealt(*river, 1, riverCards)) return false;
    if (!classifyLines(river->lines, riverActions, sink)) return false;
    h.river = Street(StreetKind::River, std::move(riverCards), std::move(riverActions));
    return true;
}

bool StarsHandHistory::parseSummary(Hand& h, const Section& summary, IParseDiagnostics& sink) {
    bool potSeen = false;
    for (const auto& line : summary.lines) {
        if (!potSeen) {
            const auto m = potRe().match(line);
            if (m.hasMatch()) {
                h.totalPot = Money::parse(m.captured(QStringLiteral("pot")).toStdString());
                h.rake = Money::parse(m.captured(QStringLiteral("rake")).toStdString());
                potSeen = true;
                continue;
            }
        }

        if (line.startsWith(QStringLiteral("Board "))) {
            const QStringList groups = bracketGroups(line);
            auto cards = groups.isEmpty() ? std::nullopt : cardsOf(groups.front());
            if (!cards || cards->size() < 3 || cards->size() > 5 || !allDistinct(*cards)) {
                return fail(ParseErrorKind::InvalidCombo, line, "invalid board recap");
            }
            h.board = std::move(*cards);
        }
    }

    if (!potSeen) {
        note(sink, DiagnosticKind::MissingSection, QString(), "no total pot line in SUMMARY");
    }
    return true;
}

void StarsHandHistory::parseWinners(Hand& h, const Section& summary, IParseDiagnostics& sink) {
    for (const auto& line : summary.lines) {
        if (!line.startsWith(QStringLiteral("Seat "))) continue;

        QRegularExpressionMatch m;
        if (!h.showDown && line.contains(QStringLiteral(" collected "))) {
            m = collectedWinnerRe().match(line);
        } else if (h.showDown && line.contains(QStringLiteral(" and won"))) {
            m = showdownWinnerRe().match(line);
        } else {
            continue;
        }

        if (!m.hasMatch()) {
            note(sink, DiagnosticKind::SkippedLine, line, "unreadable winner line");
            continue;
        }
        h.winners.insert(m.captured(QStringLiteral("name")).toStdString());
    }
}

bool StarsHandHistory::classifyLines(const QStringList& lines, std::vector<PlayerAction>& out,
                                     IParseDiagnostics& sink) {
    for (const auto& line : lines) {
        auto res = classifyActionLine(line);
        switch (res.status) {
            case ClassifyStatus::Ok:
                out.push_back(std::move(*res.action));
                break;
            case ClassifyStatus::Unrecognized:
                note(sink, DiagnosticKind::UnrecognizedAction, line, res.error);
                break;
            case ClassifyStatus::InvalidCards:
                return fail(ParseErrorKind::InvalidCombo, line, res.error);
        }
    }
    return true;
}

} // namespace phh::infra::stars
