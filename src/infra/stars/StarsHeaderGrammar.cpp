#include "infra/stars/StarsHeaderGrammar.hpp"

#include <chrono>
#include <optional>

#include <QDate>
#include <QDateTime>
#include <QRegularExpression>
#include <QTime>
#include <QTimeZone>

namespace phh::infra::stars {

using phh::domain::CashGameInfo;
using phh::domain::Currency;
using phh::domain::Game;
using phh::domain::Limit;
using phh::domain::Money;
using phh::domain::MoneyType;
using phh::domain::TournamentInfo;

namespace {

// ------------------------------ Grammars ------------------------------------

// Currency symbols: $ € £
#define PHH_CUR R"([$\x{20AC}\x{00A3}])"
#define PHH_NUM R"(\d+(?:\.\d+)?)"

const QRegularExpression& headerRe() {
    static const QRegularExpression re(QStringLiteral(
        R"(^PokerStars\s+(?:Zoom\s+)?(?:Hand|Game)\s+#(?<ident>\d+):\s+)"
        R"((?:Tournament\s+#(?<tid>\d+),\s+(?<tour>.+?)\s+)?)"
        R"((?<game>Hold'em|Omaha\s+Hi/Lo|Omaha)\s+)"
        R"((?<limit>No\s+Limit|Pot\s+Limit|Limit)\s+)"
        R"((?:-\s+Level\s+(?<level>\S+)\s+)?)"
        R"(\((?<blinds>[^)]*)\)\s+)"
        R"(-\s+(?<stamps>.+?)\s*$)"));
    return re;
}

const QRegularExpression& handIdRe() {
    static const QRegularExpression re(QStringLiteral(R"(^PokerStars\b.*?#(\d+):)"));
    return re;
}

// Tournament segment, branch 1.
const QRegularExpression& freerollRe() {
    static const QRegularExpression re(QStringLiteral(R"(^Freeroll$)"));
    return re;
}

// Tournament segment, branch 2: buy-in[+rake] or buy-in+bounty+rake, optional code.
const QRegularExpression& buyinRe() {
    static const QRegularExpression re(QStringLiteral(
        R"(^(?<sym>)" PHH_CUR R"()?(?<a>)" PHH_NUM R"())"
        R"((?:\+)" PHH_CUR R"(?(?<b>)" PHH_NUM R"())?)"
        R"((?:\+)" PHH_CUR R"(?(?<c>)" PHH_NUM R"())?)"
        R"((?:\s+(?<code>[A-Z]+))?$)"));
    return re;
}

// Blinds, branch 1: bare chip amounts (tournaments, play-money cash).
const QRegularExpression& chipBlindsRe() {
    static const QRegularExpression re(QStringLiteral(R"(^(?<sb>)" PHH_NUM R"()/(?<bb>)" PHH_NUM R"()$)"));
    return re;
}

// Blinds, branch 2: currency amounts with optional code (real-money cash).
const QRegularExpression& cashBlindsRe() {
    static const QRegularExpression re(QStringLiteral(
        R"(^(?<sym>)" PHH_CUR R"()(?<sb>)" PHH_NUM R"()/)" PHH_CUR R"((?<bb>)" PHH_NUM R"())"
        R"((?:\s+(?<code>[A-Z]+))?$)"));
    return re;
}

const QRegularExpression& bracketStampRe() {
    static const QRegularExpression re(QStringLiteral(
        R"(\[(\d{4})/(\d{1,2})/(\d{1,2})\s+(\d{1,2}):(\d{2}):(\d{2})(?:\s+[A-Z]+)?\])"));
    return re;
}

const QRegularExpression& plainEtStampRe() {
    static const QRegularExpression re(QStringLiteral(
        R"(^(\d{4})/(\d{1,2})/(\d{1,2})\s+(\d{1,2}):(\d{2}):(\d{2})\s+ET$)"));
    return re;
}

#undef PHH_CUR
#undef PHH_NUM

// ------------------------------ Helpers -------------------------------------

inline HeaderParseResult fail(HeaderParseResult& res, std::string msg) {
    res.ok = false;
    res.error = std::move(msg);
    return res;
}

inline Money money(const QString& digits) {
    // Captures come from the numeric sub-pattern, so parse() cannot fail here.
    return Money::parse(digits.toStdString()).value_or(Money{});
}

std::optional<Currency> currencyFromSymbol(const QString& sym) {
    if (sym == QStringLiteral("$")) return Currency::USD;
    if (sym == QString(QChar(0x20AC))) return Currency::EUR;
    if (sym == QString(QChar(0x00A3))) return Currency::GBP;
    return std::nullopt;
}

std::optional<Game> gameFromText(const QString& text) {
    const QString t = text.simplified();
    if (t == QStringLiteral("Hold'em")) return Game::Holdem;
    if (t == QStringLiteral("Omaha")) return Game::Omaha;
    if (t == QStringLiteral("Omaha Hi/Lo")) return Game::OmahaHiLo;
    return std::nullopt;
}

std::optional<Limit> limitFromText(const QString& text) {
    const QString t = text.simplified();
    if (t == QStringLiteral("No Limit")) return Limit::NoLimit;
    if (t == QStringLiteral("Pot Limit")) return Limit::PotLimit;
    if (t == QStringLiteral("Limit")) return Limit::FixedLimit;
    return std::nullopt;
}

// Resolves an explicit code first, then the symbol. Unknown code is an error.
bool resolveCurrency(const QString& code, const QString& sym, std::optional<Currency>& out, std::string& err) {
    if (!code.isEmpty()) {
        out = phh::domain::currencyFromCode(code.toStdString());
        if (!out) {
            err = "unknown currency code: " + code.toStdString();
            return false;
        }
        return true;
    }
    if (!sym.isEmpty()) {
        out = currencyFromSymbol(sym);
    }
    return true;
}

bool parseStamp(const QString& stamps, const ParserSettings& settings, phh::domain::TimePoint& out,
                std::string& err) {
    auto m = bracketStampRe().match(stamps);
    if (!m.hasMatch()) {
        // Hands played with the client set to ET print a single, unbracketed stamp.
        m = plainEtStampRe().match(stamps);
    }
    if (!m.hasMatch()) {
        err = "no ET timestamp on header line";
        return false;
    }

    const QDate date(m.captured(1).toInt(), m.captured(2).toInt(), m.captured(3).toInt());
    const QTime time(m.captured(4).toInt(), m.captured(5).toInt(), m.captured(6).toInt());
    if (!date.isValid() || !time.isValid()) {
        err = "invalid timestamp: " + m.captured(0).toStdString();
        return false;
    }

    const QTimeZone tz(QByteArray::fromStdString(settings.referenceTimeZone));
    if (!tz.isValid()) {
        err = "unknown reference time zone: " + settings.referenceTimeZone;
        return false;
    }

    const QDateTime dt(date, time, tz);
    if (!dt.isValid()) {
        err = "timestamp does not exist in reference zone: " + m.captured(0).toStdString();
        return false;
    }

    out = phh::domain::TimePoint(std::chrono::duration_cast<phh::domain::Clock::duration>(
        std::chrono::milliseconds(dt.toMSecsSinceEpoch())));
    return true;
}

// Tournament segment -> TournamentInfo (+ currency). Exactly one branch must match.
bool parseTournament(const QRegularExpressionMatch& hm, const ParserSettings& settings, TournamentInfo& info,
                     std::optional<Currency>& currency, std::string& err) {
    const QString segment = hm.captured(QStringLiteral("tour")).trimmed();

    const auto free = freerollRe().match(segment);
    const auto paid = buyinRe().match(segment);
    const int branches = (free.hasMatch() ? 1 : 0) + (paid.hasMatch() ? 1 : 0);
    if (branches != 1) {
        err = branches == 0 ? "unrecognized tournament buy-in: " + segment.toStdString()
                            : "ambiguous tournament buy-in: " + segment.toStdString();
        return false;
    }

    info.id = hm.captured(QStringLiteral("tid")).toStdString();
    const QString level = hm.captured(QStringLiteral("level"));
    if (!level.isEmpty()) info.level = level.toStdString();

    if (free.hasMatch()) {
        info.freeroll = true;
        info.buyin = Money{};
        info.rake = Money{};
        currency = settings.freerollCurrency;
        return true;
    }

    const QString a = paid.captured(QStringLiteral("a"));
    const QString b = paid.captured(QStringLiteral("b"));
    const QString c = paid.captured(QStringLiteral("c"));
    info.buyin = money(a);
    if (!c.isEmpty()) {
        // Knockout: buy-in + bounty + rake.
        info.bounty = money(b);
        info.rake = money(c);
    } else {
        info.rake = b.isEmpty() ? Money{} : money(b);
    }

    return resolveCurrency(paid.captured(QStringLiteral("code")), paid.captured(QStringLiteral("sym")), currency,
                           err);
}

} // namespace

HeaderParseResult parseHeaderLine(const QString& line, const ParserSettings& settings) {
    HeaderParseResult res;
    const QString text = line.trimmed();

    const auto idMatch = handIdRe().match(text);
    if (idMatch.hasMatch()) {
        res.handId = idMatch.captured(1).toStdString();
    }

    const auto hm = headerRe().match(text);
    if (!hm.hasMatch()) {
        return fail(res, "header line matches no known format");
    }

    auto& h = res.header;
    h.ident = hm.captured(QStringLiteral("ident")).toStdString();

    const auto game = gameFromText(hm.captured(QStringLiteral("game")));
    const auto limit = limitFromText(hm.captured(QStringLiteral("limit")));
    if (!game || !limit) {
        return fail(res, "unsupported game or limit");
    }
    h.game = *game;
    h.limit = *limit;

    // Blinds: exactly one of the two sub-grammars.
    const QString blindsText = hm.captured(QStringLiteral("blinds")).trimmed();
    const auto chip = chipBlindsRe().match(blindsText);
    const auto cash = cashBlindsRe().match(blindsText);
    const int blindBranches = (chip.hasMatch() ? 1 : 0) + (cash.hasMatch() ? 1 : 0);
    if (blindBranches != 1) {
        return fail(res, blindBranches == 0 ? "unrecognized blinds: " + blindsText.toStdString()
                                            : "ambiguous blinds: " + blindsText.toStdString());
    }
    const auto& blinds = chip.hasMatch() ? chip : cash;
    h.smallBlind = money(blinds.captured(QStringLiteral("sb")));
    h.bigBlind = money(blinds.captured(QStringLiteral("bb")));

    std::optional<Currency> currency;
    std::string err;

    // Game type comes from the tournament id only.
    if (!hm.captured(QStringLiteral("tid")).isEmpty()) {
        TournamentInfo info;
        if (!parseTournament(hm, settings, info, currency, err)) {
            return fail(res, err);
        }
        h.context = std::move(info);
    } else {
        if (!hm.captured(QStringLiteral("level")).isEmpty()) {
            return fail(res, "level given for a cash game");
        }
        if (cash.hasMatch() &&
            !resolveCurrency(cash.captured(QStringLiteral("code")), cash.captured(QStringLiteral("sym")), currency,
                             err)) {
            return fail(res, err);
        }
        h.context = CashGameInfo{};
    }

    h.currency = currency;
    h.moneyType = currency ? MoneyType::Real : MoneyType::Play;

    if (!parseStamp(hm.captured(QStringLiteral("stamps")), settings, h.date, err)) {
        return fail(res, err);
    }

    res.ok = true;
    return res;
}

} // namespace phh::infra::stars
