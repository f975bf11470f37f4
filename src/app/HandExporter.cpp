#include "app/HandExporter.hpp"

#include <chrono>

#include <QDateTime>
#include <QJsonArray>
#include <QString>
#include <QTimeZone>

namespace phh::app {

using phh::domain::Hand;
using phh::domain::HandHeader;
using phh::domain::Money;
using phh::domain::PlayerAction;
using phh::domain::Street;

namespace {

inline QString str(const std::string& s) {
    return QString::fromStdString(s);
}

inline QString money(const Money& m) {
    return QString::fromStdString(m.toString());
}

inline qint64 toUnixMs(phh::domain::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

QJsonArray cardsToJson(const std::vector<phh::domain::cards::Card>& cards) {
    QJsonArray arr;
    for (const auto& c : cards) {
        arr.append(str(c.toString()));
    }
    return arr;
}

QJsonObject actionToJson(const PlayerAction& a) {
    QJsonObject o;
    o.insert(QStringLiteral("name"), str(a.name));
    o.insert(QStringLiteral("kind"), str(phh::domain::to_string(a.kind)));
    if (a.amount) o.insert(QStringLiteral("amount"), money(*a.amount));
    if (a.combo)  o.insert(QStringLiteral("combo"), str(a.combo->toString()));
    if (a.seat)   o.insert(QStringLiteral("seat"), *a.seat);
    if (a.allIn)  o.insert(QStringLiteral("all_in"), true);
    return o;
}

QJsonArray actionsToJson(const std::vector<PlayerAction>& actions) {
    QJsonArray arr;
    for (const auto& a : actions) {
        arr.append(actionToJson(a));
    }
    return arr;
}

QJsonObject streetToJson(const Street& s) {
    QJsonObject o;
    o.insert(QStringLiteral("cards"), cardsToJson(s.cards()));
    if (s.actions()) {
        o.insert(QStringLiteral("actions"), actionsToJson(*s.actions()));
    }

    if (const auto& t = s.texture()) {
        QJsonObject tex;
        tex.insert(QStringLiteral("rainbow"),       t->rainbow);
        tex.insert(QStringLiteral("monotone"),      t->monotone);
        tex.insert(QStringLiteral("triplet"),       t->triplet);
        tex.insert(QStringLiteral("paired"),        t->paired);
        tex.insert(QStringLiteral("flush_draw"),    t->flushDraw);
        tex.insert(QStringLiteral("straight_draw"), t->straightDraw);
        tex.insert(QStringLiteral("gutshot"),       t->gutshot);
        o.insert(QStringLiteral("texture"), tex);
    }
    return o;
}

} // namespace

QJsonObject HandExporter::headerToJson(const HandHeader& h) {
    QJsonObject o;
    o.insert(QStringLiteral("ident"), str(h.ident));
    o.insert(QStringLiteral("game_type"), str(phh::domain::to_string(h.gameType())));
    o.insert(QStringLiteral("game"), str(phh::domain::to_string(h.game)));
    o.insert(QStringLiteral("limit"), str(phh::domain::to_string(h.limit)));
    o.insert(QStringLiteral("money_type"), str(phh::domain::to_string(h.moneyType)));
    if (h.currency) {
        o.insert(QStringLiteral("currency"), str(phh::domain::to_string(*h.currency)));
    }
    o.insert(QStringLiteral("small_blind"), money(h.smallBlind));
    o.insert(QStringLiteral("big_blind"), money(h.bigBlind));

    const qint64 ms = toUnixMs(h.date);
    o.insert(QStringLiteral("date_ms"), ms);
    o.insert(QStringLiteral("date"),
             QDateTime::fromMSecsSinceEpoch(ms, QTimeZone::utc()).toString(Qt::ISODate));

    if (const auto* t = h.tournament()) {
        QJsonObject tour;
        tour.insert(QStringLiteral("id"), str(t->id));
        if (t->level) tour.insert(QStringLiteral("level"), str(*t->level));
        tour.insert(QStringLiteral("freeroll"), t->freeroll);
        tour.insert(QStringLiteral("buyin"), money(t->buyin));
        tour.insert(QStringLiteral("rake"), money(t->rake));
        if (t->bounty) tour.insert(QStringLiteral("bounty"), money(*t->bounty));
        o.insert(QStringLiteral("tournament"), tour);
    }
    return o;
}

QJsonObject HandExporter::handToJson(const Hand& hand) {
    QJsonObject o;
    o.insert(QStringLiteral("header"), headerToJson(hand.header));
    o.insert(QStringLiteral("table"), str(hand.tableName));
    o.insert(QStringLiteral("max_players"), hand.maxPlayers);
    o.insert(QStringLiteral("button_seat"), hand.buttonSeat);

    // seats (null for empty ones, so the array index stays seat - 1)
    QJsonArray seats;
    for (const auto& slot : hand.players) {
        if (!slot) {
            seats.append(QJsonValue());
            continue;
        }
        QJsonObject p;
        p.insert(QStringLiteral("name"), str(slot->name));
        p.insert(QStringLiteral("seat"), slot->seat);
        p.insert(QStringLiteral("stack"), money(slot->stack));
        if (slot->combo) p.insert(QStringLiteral("combo"), str(slot->combo->toString()));
        if (slot->sittingOut) p.insert(QStringLiteral("sitting_out"), true);
        seats.append(p);
    }
    o.insert(QStringLiteral("seats"), seats);

    if (const auto* hero = hand.hero()) {
        o.insert(QStringLiteral("hero"), str(hero->name));
    }

    if (hand.preflopActions) {
        o.insert(QStringLiteral("preflop"), actionsToJson(*hand.preflopActions));
    }
    if (hand.flop)  o.insert(QStringLiteral("flop"), streetToJson(*hand.flop));
    if (hand.turn)  o.insert(QStringLiteral("turn"), streetToJson(*hand.turn));
    if (hand.river) o.insert(QStringLiteral("river"), streetToJson(*hand.river));

    o.insert(QStringLiteral("show_down"), hand.showDown);
    if (hand.showDownActions) {
        o.insert(QStringLiteral("show_down_actions"), actionsToJson(*hand.showDownActions));
    }

    if (hand.totalPot) o.insert(QStringLiteral("total_pot"), money(*hand.totalPot));
    if (hand.rake)     o.insert(QStringLiteral("rake"), money(*hand.rake));
    if (hand.board)    o.insert(QStringLiteral("board"), cardsToJson(*hand.board));

    QJsonArray winners;
    for (const auto& w : hand.winners) {
        winners.append(str(w));
    }
    o.insert(QStringLiteral("winners"), winners);

    return o;
}

QJsonDocument HandExporter::toJson(const std::vector<phh::infra::stars::StarsHandHistory>& hands) {
    QJsonArray arr;
    for (const auto& hh : hands) {
        if (const auto* hand = hh.hand()) {
            arr.append(handToJson(*hand));
        } else if (const auto* header = hh.header()) {
            QJsonObject o;
            o.insert(QStringLiteral("header"), headerToJson(*header));
            arr.append(o);
        }
    }
    return QJsonDocument(arr);
}

} // namespace phh::app
