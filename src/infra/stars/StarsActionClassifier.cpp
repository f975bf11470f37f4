#include "infra/stars/StarsActionClassifier.hpp"

#include <array>

#include <QRegularExpression>

namespace phh::infra::stars {

using phh::domain::ActionKind;
using phh::domain::Money;
using phh::domain::PlayerAction;

namespace {

// Outcome of a single rule. NoMatch lets the next rule try.
enum class RuleOutcome {
    Matched,
    NoMatch,
    InvalidCards
};

struct RuleResult {
    RuleOutcome  outcome{RuleOutcome::NoMatch};
    PlayerAction action;
    std::string  error;
};

struct Rule {
    const char* anchor; // substring that selects the rule
    RuleResult (*handle)(const QString& line);
};

// --------------------------- Helpers -----------------------------------------

inline RuleResult noMatch() {
    return RuleResult{};
}

inline RuleResult matched(const QString& name, ActionKind kind) {
    RuleResult r;
    r.outcome = RuleOutcome::Matched;
    r.action.name = name.trimmed().toStdString();
    r.action.kind = kind;
    return r;
}

inline std::optional<Money> toMoney(const QString& digits) {
    if (digits.isEmpty()) return std::nullopt;
    return Money::parse(digits.toStdString());
}

// Single-capture rule: the whole line must match and group 1 is the actor.
RuleResult nameOnly(const QRegularExpression& re, const QString& line, ActionKind kind) {
    const auto m = re.match(line);
    if (!m.hasMatch()) return noMatch();
    return matched(m.captured(1), kind);
}

// --------------------------- Rules -------------------------------------------

RuleResult parseUncalled(const QString& line) {
    static const QRegularExpression re(
        QStringLiteral(R"(^Uncalled bet \(\D*?(\d+(?:\.\d+)?)\) returned to\s+(.+)$)"));
    const auto m = re.match(line);
    if (!m.hasMatch()) return noMatch();

    auto r = matched(m.captured(2), ActionKind::Return);
    r.action.amount = toMoney(m.captured(1));
    return r;
}

RuleResult parseCollected(const QString& line) {
    static const QRegularExpression re(
        QStringLiteral(R"(^(.+?) collected \D*?(\d+(?:\.\d+)?) from (?:the )?(?:(?:main|side) )?pot)"));
    const auto m = re.match(line);
    if (!m.hasMatch()) return noMatch();

    auto r = matched(m.captured(1), ActionKind::Win);
    r.action.amount = toMoney(m.captured(2));
    return r;
}

RuleResult parseMuck(const QString& line) {
    static const QRegularExpression re(QStringLiteral(R"(^(.+?): (?:doesn't show hand|mucks hand))"));
    return nameOnly(re, line, ActionKind::Muck);
}

RuleResult parseJoin(const QString& line) {
    static const QRegularExpression re(QStringLiteral(R"(^(.+?) joins the table at seat #(\d+)$)"));
    const auto m = re.match(line);
    if (!m.hasMatch()) return noMatch();

    auto r = matched(m.captured(1), ActionKind::Join);
    r.action.seat = m.captured(2).toInt();
    return r;
}

RuleResult parseLeave(const QString& line) {
    static const QRegularExpression re(QStringLiteral(R"(^(.+?) leaves the table$)"));
    return nameOnly(re, line, ActionKind::Leave);
}

RuleResult parseTimedOut(const QString& line) {
    // Also "has timed out while disconnected" / "while being disconnected".
    static const QRegularExpression re(QStringLiteral(R"(^(.+?) has timed out\b)"));
    return nameOnly(re, line, ActionKind::TimedOut);
}

RuleResult parseConnected(const QString& line) {
    static const QRegularExpression re(QStringLiteral(R"(^(.+?) is connected$)"));
    return nameOnly(re, line, ActionKind::Connected);
}

RuleResult parseDisconnected(const QString& line) {
    static const QRegularExpression re(QStringLiteral(R"(^(.+?) is disconnected$)"));
    return nameOnly(re, line, ActionKind::Disconnected);
}

RuleResult parseRemoved(const QString& line) {
    static const QRegularExpression re(QStringLiteral(R"(^(.+?) was removed\b)"));
    return nameOnly(re, line, ActionKind::Removed);
}

RuleResult parseShow(const QString& line) {
    static const QRegularExpression re(QStringLiteral(R"(^(.+?): shows \[([^\]]*)\])"));
    const auto m = re.match(line);
    if (!m.hasMatch()) return noMatch();

    auto cards = phh::domain::cards::parseCardList(m.captured(2).toStdString());
    // Showing a single card is legal after winning uncontested; that is not a combo.
    if (!cards || (cards->size() != 2 && cards->size() != 4)) return noMatch();

    std::string err;
    auto combo = phh::domain::cards::Combo::fromCards(std::move(*cards), &err);
    if (!combo) {
        RuleResult r;
        r.outcome = RuleOutcome::InvalidCards;
        r.error = err;
        return r;
    }

    auto r = matched(m.captured(1), ActionKind::Show);
    r.action.combo = std::move(combo);
    return r;
}

RuleResult parseThink(const QString& line) {
    static const QRegularExpression re(QStringLiteral(R"(^(.+?) has \d+ seconds left to act$)"));
    return nameOnly(re, line, ActionKind::Think);
}

std::optional<ActionKind> kindForVerb(const QString& verb) {
    const QString v = verb.toLower();
    if (v == QStringLiteral("bets") || v == QStringLiteral("bet")) return ActionKind::Bet;
    if (v == QStringLiteral("raises") || v == QStringLiteral("raise")) return ActionKind::Raise;
    if (v == QStringLiteral("checks") || v == QStringLiteral("check")) return ActionKind::Check;
    if (v == QStringLiteral("folds") || v == QStringLiteral("fold") || v == QStringLiteral("folded"))
        return ActionKind::Fold;
    if (v == QStringLiteral("calls") || v == QStringLiteral("call")) return ActionKind::Call;
    if (v == QStringLiteral("mucks")) return ActionKind::Muck;
    return std::nullopt;
}

RuleResult parsePlayerAction(const QString& line) {
    static const QRegularExpression re(QStringLiteral(R"(^(.+?):\s+(\S+)(.*)$)"));
    static const QRegularExpression amountRe(QStringLiteral(R"((\d+(?:\.\d+)?))"));

    const auto m = re.match(line);
    if (!m.hasMatch()) return noMatch();

    const auto kind = kindForVerb(m.captured(2));
    if (!kind) return noMatch();

    auto r = matched(m.captured(1), *kind);

    const QString rest = m.captured(3);
    const auto am = amountRe.match(rest);
    if (am.hasMatch()) {
        r.action.amount = toMoney(am.captured(1));
    }
    r.action.allIn = rest.contains(QStringLiteral("all-in"));
    return r;
}

// Most specific first.
const std::array<Rule, 13>& rules() {
    static const std::array<Rule, 13> table{{
        {"Uncalled bet",         &parseUncalled},
        {" collected ",          &parseCollected},
        {" doesn't show hand",   &parseMuck},
        {"mucks hand",           &parseMuck},
        {"joins the table",      &parseJoin},
        {"leaves the table",     &parseLeave},
        {"has timed out",        &parseTimedOut},
        {"is connected",         &parseConnected},
        {"is disconnected",      &parseDisconnected},
        {"was removed",          &parseRemoved},
        {" shows ",              &parseShow},
        {"seconds left to act",  &parseThink},
        {": ",                   &parsePlayerAction},
    }};
    return table;
}

} // namespace

ClassifyResult classifyActionLine(const QString& line) {
    ClassifyResult res;
    const QString trimmed = line.trimmed();

    for (const auto& rule : rules()) {
        if (!trimmed.contains(QLatin1String(rule.anchor))) continue;

        RuleResult r = rule.handle(trimmed);
        if (r.outcome == RuleOutcome::NoMatch) continue;

        if (r.outcome == RuleOutcome::InvalidCards) {
            res.status = ClassifyStatus::InvalidCards;
            res.error = r.error;
            return res;
        }

        res.status = ClassifyStatus::Ok;
        res.action = std::move(r.action);
        return res;
    }

    res.status = ClassifyStatus::Unrecognized;
    res.error = "unrecognized action line";
    return res;
}

} // namespace phh::infra::stars
