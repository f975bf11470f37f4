#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "app/CollectingDiagnostics.hpp"
#include "infra/stars/StarsHandHistory.hpp"
#include "StarsHands.hpp"

using phh::app::CollectingDiagnostics;
using phh::app::DiagnosticKind;
using phh::domain::ActionKind;
using phh::domain::Currency;
using phh::domain::GameType;
using phh::domain::Hand;
using phh::domain::Money;
using phh::domain::PlayerAction;
using phh::domain::cards::Card;
using phh::domain::cards::Combo;
using phh::infra::stars::ParseErrorKind;
using phh::infra::stars::ParseState;
using phh::infra::stars::StarsHandHistory;

namespace {

PlayerAction act(const std::string& name, ActionKind kind, const char* amount = nullptr) {
    PlayerAction a;
    a.name = name;
    a.kind = kind;
    if (amount) a.amount = Money::parse(amount);
    return a;
}

PlayerAction allIn(PlayerAction a) {
    a.allIn = true;
    return a;
}

std::vector<Card> cards(std::initializer_list<const char*> text) {
    std::vector<Card> out;
    for (const char* t : text) out.push_back(*Card::fromString(t));
    return out;
}

class ParsedHand : public ::testing::Test {
protected:
    const Hand& parse(const std::string& text) {
        hh_ = std::make_unique<StarsHandHistory>(text);
        EXPECT_TRUE(hh_->parse(&diag_)) << (hh_->error() ? hh_->error()->describe() : std::string());
        EXPECT_EQ(hh_->state(), ParseState::FullyParsed);
        static const Hand kEmpty;
        return hh_->hand() ? *hh_->hand() : kEmpty;
    }

    std::unique_ptr<StarsHandHistory> hh_;
    CollectingDiagnostics             diag_;
};

} // namespace

// ---------------------------------------------------------------------------

TEST_F(ParsedHand, FlopOnlyHand) {
    const Hand& h = parse(phh::test::kHandFlopOnly);

    EXPECT_EQ(h.header.ident, "105024000105");
    EXPECT_EQ(h.tableName, "797469411 15");
    EXPECT_EQ(h.maxPlayers, 9);
    ASSERT_EQ(h.players.size(), 9u);

    ASSERT_NE(h.button(), nullptr);
    EXPECT_EQ(h.button()->name, "flettl2");
    EXPECT_EQ(h.button()->stack, Money::whole(1500));

    ASSERT_NE(h.hero(), nullptr);
    EXPECT_EQ(h.hero()->name, "W2lkm2n");
    EXPECT_EQ(h.hero()->seat, 5);
    EXPECT_EQ(h.hero()->combo, Combo::fromString("AcJh"));

    const std::vector<std::string> names{"flettl2", "santy312", "flavio766", "strongi82", "W2lkm2n",
                                         "MISTRPerfect", "blak_douglas", "sinus91", "STBIJUJA"};
    for (size_t i = 0; i < names.size(); ++i) {
        ASSERT_TRUE(h.players[i].has_value());
        EXPECT_EQ(h.players[i]->name, names[i]);
        EXPECT_EQ(h.players[i]->seat, static_cast<int>(i + 1));
    }
    EXPECT_FALSE(h.players[0]->combo.has_value());

    const std::vector<PlayerAction> preflop{
        act("strongi82", ActionKind::Fold),      act("W2lkm2n", ActionKind::Raise, "40"),
        act("MISTRPerfect", ActionKind::Call, "60"), act("blak_douglas", ActionKind::Fold),
        act("sinus91", ActionKind::Fold),        act("STBIJUJA", ActionKind::Fold),
        act("flettl2", ActionKind::Fold),        act("santy312", ActionKind::Fold),
        act("flavio766", ActionKind::Fold),
    };
    EXPECT_EQ(h.preflopActions, preflop);

    ASSERT_TRUE(h.flop.has_value());
    EXPECT_EQ(h.flop->cards(), cards({"2s", "6d", "6h"}));
    const std::vector<PlayerAction> flop{
        act("W2lkm2n", ActionKind::Bet, "80"),    act("MISTRPerfect", ActionKind::Fold),
        act("W2lkm2n", ActionKind::Return, "80"), act("W2lkm2n", ActionKind::Win, "150"),
        act("W2lkm2n", ActionKind::Muck),
    };
    EXPECT_EQ(h.flopActions(), flop);
    EXPECT_EQ(h.flop->players(), (std::vector<std::string>{"W2lkm2n", "MISTRPerfect"}));

    ASSERT_TRUE(h.flop->texture().has_value());
    EXPECT_TRUE(h.flop->texture()->rainbow);
    EXPECT_TRUE(h.flop->texture()->paired);
    EXPECT_FALSE(h.flop->texture()->straightDraw);
    EXPECT_TRUE(h.flop->texture()->gutshot);

    EXPECT_FALSE(h.turn.has_value());
    EXPECT_FALSE(h.river.has_value());
    EXPECT_FALSE(h.turnCard().has_value());
    EXPECT_FALSE(h.turnActions().has_value());
    EXPECT_FALSE(h.riverActions().has_value());

    EXPECT_EQ(h.board, cards({"2s", "6d", "6h"}));
    EXPECT_EQ(h.totalPot, Money::whole(150));
    EXPECT_EQ(h.rake, Money{});
    EXPECT_FALSE(h.showDown);
    EXPECT_FALSE(h.showDownActions.has_value());
    EXPECT_EQ(h.winners, (std::set<std::string>{"W2lkm2n"}));

    EXPECT_EQ(diag_.count(DiagnosticKind::UnrecognizedAction), 0u);
}

TEST_F(ParsedHand, AllInPreflopWithShowdown) {
    const Hand& h = parse(phh::test::kHandAllInPreflop);

    EXPECT_EQ(h.header.tournament()->level, std::string("XI"));
    EXPECT_EQ(h.header.bigBlind, Money::whole(800));
    EXPECT_EQ(h.tableName, "797536898 9");

    ASSERT_NE(h.button(), nullptr);
    EXPECT_EQ(h.button()->name, "W2lkm2n");
    ASSERT_NE(h.hero(), nullptr);
    EXPECT_EQ(h.hero()->combo, Combo::fromString("JdJs"));
    EXPECT_EQ(h.seatAt(4)->name, "Lean Abadia");

    const std::vector<PlayerAction> preflop{
        act("lkenny44", ActionKind::Fold),
        allIn(act("Newfie_187", ActionKind::Raise, "155")),
        act("Hokolix", ActionKind::Fold),
        act("pmmr", ActionKind::Fold),
        allIn(act("costamar", ActionKind::Raise, "12040")),
        act("RichFatWhale", ActionKind::Fold),
        allIn(act("W2lkm2n", ActionKind::Call, "11740")),
        act("Labahra", ActionKind::Fold),
        act("Lean Abadia", ActionKind::Fold),
        act("costamar", ActionKind::Return, "1255"),
    };
    EXPECT_EQ(h.preflopActions, preflop);

    ASSERT_TRUE(h.flop.has_value());
    EXPECT_FALSE(h.flop->actions().has_value());
    EXPECT_TRUE(h.flop->players().empty());
    EXPECT_TRUE(h.flop->texture()->straightDraw);
    EXPECT_EQ(h.turnCard(), Card::fromString("8d"));
    EXPECT_EQ(h.riverCard(), Card::fromString("Ks"));
    EXPECT_FALSE(h.turnActions().has_value());
    EXPECT_FALSE(h.riverActions().has_value());
    EXPECT_EQ(h.board, cards({"3c", "6s", "9d", "8d", "Ks"}));

    EXPECT_TRUE(h.showDown);
    ASSERT_TRUE(h.showDownActions.has_value());
    ASSERT_EQ(h.showDownActions->size(), 5u);
    EXPECT_EQ(h.showDownActions->at(1).combo, Combo::fromString("AhKh"));
    EXPECT_EQ(h.showDownActions->at(2), act("costamar", ActionKind::Win, "21570"));

    EXPECT_EQ(h.totalPot, Money::whole(26310));
    EXPECT_EQ(h.winners, (std::set<std::string>{"costamar"}));
}

TEST_F(ParsedHand, EmptySeatAndNoFlop) {
    const Hand& h = parse(phh::test::kHandNoFlop);

    ASSERT_EQ(h.players.size(), 9u);
    EXPECT_FALSE(h.players[0].has_value());
    EXPECT_EQ(h.seatAt(1), nullptr);
    EXPECT_EQ(h.seatAt(2)->name, "snelle_jel");
    EXPECT_EQ(h.seatAt(9)->stack, Money::whole(8724));

    EXPECT_EQ(h.button()->name, "W2lkm2n");
    EXPECT_EQ(h.hero()->combo, Combo::fromString("6d8d"));

    ASSERT_TRUE(h.preflopActions.has_value());
    ASSERT_EQ(h.preflopActions->size(), 11u);
    EXPECT_EQ(h.preflopActions->at(3), act("Theralion", ActionKind::Raise, "600"));
    EXPECT_EQ(h.preflopActions->at(8), act("Theralion", ActionKind::Return, "600"));
    EXPECT_EQ(h.preflopActions->at(9), act("Theralion", ActionKind::Win, "1900"));
    EXPECT_EQ(h.preflopActions->at(10), act("Theralion", ActionKind::Muck));

    EXPECT_FALSE(h.flop.has_value());
    EXPECT_FALSE(h.turn.has_value());
    EXPECT_FALSE(h.river.has_value());
    EXPECT_FALSE(h.flopActions().has_value());
    EXPECT_FALSE(h.board.has_value());
    EXPECT_EQ(h.totalPot, Money::whole(1900));
    EXPECT_EQ(h.winners, (std::set<std::string>{"Theralion"}));

    EXPECT_GE(diag_.count(DiagnosticKind::MissingSection), 1u);
}

TEST_F(ParsedHand, EveryStreet) {
    const Hand& h = parse(phh::test::kHandEveryStreet);

    EXPECT_EQ(h.header.tournament()->level, std::string("IV"));
    EXPECT_EQ(h.button()->name, "W2lkm2n");
    EXPECT_EQ(h.hero()->combo, Combo::fromString("Jc5c"));

    EXPECT_EQ(h.flop->cards(), cards({"6s", "4d", "3s"}));
    const std::vector<PlayerAction> flop{
        act("blak_douglas", ActionKind::Check),
        act("flettl2", ActionKind::Bet, "150"),
        act("blak_douglas", ActionKind::Call, "150"),
    };
    EXPECT_EQ(h.flopActions(), flop);
    EXPECT_EQ(h.flop->players(), (std::vector<std::string>{"blak_douglas", "flettl2"}));
    EXPECT_FALSE(h.flop->texture()->rainbow);
    EXPECT_TRUE(h.flop->texture()->flushDraw);

    EXPECT_EQ(h.turnCard(), Card::fromString("8c"));
    const std::vector<PlayerAction> turn{
        act("blak_douglas", ActionKind::Check),
        act("flettl2", ActionKind::Bet, "250"),
        act("blak_douglas", ActionKind::Call, "250"),
    };
    EXPECT_EQ(h.turnActions(), turn);
    EXPECT_FALSE(h.turn->texture().has_value());

    EXPECT_EQ(h.riverCard(), Card::fromString("Kd"));
    const std::vector<PlayerAction> river{
        act("blak_douglas", ActionKind::Check),   act("flettl2", ActionKind::Bet, "1300"),
        act("blak_douglas", ActionKind::Fold),    act("flettl2", ActionKind::Return, "1300"),
        act("flettl2", ActionKind::Win, "1300"),  act("flettl2", ActionKind::Muck),
    };
    EXPECT_EQ(h.riverActions(), river);

    EXPECT_EQ(h.board, cards({"6s", "4d", "3s", "8c", "Kd"}));
    EXPECT_EQ(h.totalPot, Money::whole(1300));
    EXPECT_FALSE(h.showDown);
    EXPECT_EQ(h.winners, (std::set<std::string>{"flettl2"}));
}

TEST_F(ParsedHand, PlayerNameWithDots) {
    const Hand& h = parse(phh::test::kHandDottedName);
    ASSERT_NE(h.seatAt(2), nullptr);
    EXPECT_EQ(h.seatAt(2)->name, ".prestige.U$");
    EXPECT_EQ(h.seatAt(2)->stack, Money::whole(3000));
    EXPECT_EQ(h.preflopActions->at(1), act(".prestige.U$", ActionKind::Raise, "60"));
    EXPECT_EQ(h.winners, (std::set<std::string>{".prestige.U$"}));
}

TEST_F(ParsedHand, HeroMissingAndPlayerRemoved) {
    const Hand& h = parse(phh::test::kHandHeroMissing);

    EXPECT_EQ(h.header.gameType(), GameType::Cash);
    EXPECT_EQ(h.header.currency, Currency::USD);
    EXPECT_EQ(h.hero(), nullptr);
    EXPECT_FALSE(h.heroSeat.has_value());
    EXPECT_EQ(h.maxPlayers, 6);
    EXPECT_EQ(h.seatAt(1)->stack, *Money::parse("2.12"));
    EXPECT_TRUE(h.seatAt(2)->sittingOut);
    EXPECT_FALSE(h.seatAt(3)->sittingOut);
    EXPECT_EQ(h.seatAt(4), nullptr);

    ASSERT_TRUE(h.preflopActions.has_value());
    EXPECT_EQ(h.preflopActions->back(), act("GenGen", ActionKind::Removed));
    EXPECT_EQ(h.preflopActions->front(), act(".prestige.U$", ActionKind::Raise, "0.04"));

    EXPECT_EQ(h.totalPot, *Money::parse("0.05"));
    EXPECT_EQ(h.winners, (std::set<std::string>{".prestige.U$"}));
}

TEST_F(ParsedHand, NamesWithSpacesAndTableEvents) {
    const Hand& h = parse(phh::test::kHandTableEvents);

    EXPECT_EQ(h.players[0]->name, "flett l2");
    EXPECT_EQ(h.seatAt(3)->name, "gara za2");

    ASSERT_TRUE(h.flopActions().has_value());
    const auto actions = *h.flopActions();
    ASSERT_GE(actions.size(), 5u);

    PlayerAction join = act("Sin Richest", ActionKind::Join);
    join.seat = 5;
    const std::vector<PlayerAction> events{
        act("flett l2", ActionKind::Leave), join, act("gara za2", ActionKind::TimedOut),
        act("ge na", ActionKind::Disconnected), act("ge na", ActionKind::Connected),
    };
    EXPECT_EQ(std::vector<PlayerAction>(actions.begin(), actions.begin() + 5), events);

    EXPECT_EQ(actions.at(9), act("ge na", ActionKind::Think));
    EXPECT_EQ(h.winners, (std::set<std::string>{"W2lkm2n"}));
    EXPECT_EQ(diag_.count(DiagnosticKind::UnrecognizedAction), 0u);
}

TEST_F(ParsedHand, OmahaShowdown) {
    const Hand& h = parse(phh::test::kHandOmahaShowdown);

    EXPECT_EQ(h.header.game, phh::domain::Game::Omaha);
    EXPECT_EQ(h.hero()->name, "IKermit");
    EXPECT_EQ(h.hero()->combo, Combo::fromString("AcKd8s8c"));
    EXPECT_EQ(h.seatAt(5)->name, "Glamour Puss");

    PlayerAction ikermit = act("IKermit", ActionKind::Show);
    ikermit.combo = Combo::fromString("AcKd8s8c");
    PlayerAction krissu = act("krissu23", ActionKind::Show);
    krissu.combo = Combo::fromString("5s7s7cAs");
    const std::vector<PlayerAction> showDown{
        ikermit, krissu, act("Maytscha1", ActionKind::Muck), act("krissu23", ActionKind::Win, "104.02"),
    };
    EXPECT_TRUE(h.showDown);
    EXPECT_EQ(h.showDownActions, showDown);

    EXPECT_EQ(h.totalPot, Money::whole(107));
    EXPECT_EQ(h.rake, *Money::parse("2.98"));
    EXPECT_EQ(h.winners, (std::set<std::string>{"krissu23"}));
}

// ---------------------------------------------------------------------------
// State machine
// ---------------------------------------------------------------------------

TEST(StarsHandHistory, HeaderOnlyThenFull) {
    StarsHandHistory hh(phh::test::kHandFlopOnly);
    EXPECT_EQ(hh.state(), ParseState::Unparsed);
    EXPECT_EQ(hh.header(), nullptr);
    EXPECT_EQ(hh.describe(), "<StarsHandHistory: #?>");

    CollectingDiagnostics diag;
    ASSERT_TRUE(hh.parseHeader(&diag));
    EXPECT_EQ(hh.state(), ParseState::HeaderParsed);
    ASSERT_NE(hh.header(), nullptr);
    EXPECT_EQ(hh.header()->ident, "105024000105");
    EXPECT_EQ(hh.hand(), nullptr);
    EXPECT_EQ(hh.describe(), "<StarsHandHistory: #105024000105>");

    ASSERT_TRUE(hh.parse(&diag));
    EXPECT_EQ(hh.state(), ParseState::FullyParsed);
    ASSERT_NE(hh.hand(), nullptr);
    EXPECT_EQ(hh.hand()->header, *hh.header());
}

TEST(StarsHandHistory, RepeatedCallsAreIdempotent) {
    CollectingDiagnostics diag;
    StarsHandHistory hh(phh::test::kHandEveryStreet);
    ASSERT_TRUE(hh.parse(&diag));
    const Hand first = *hh.hand();
    const auto reported = diag.items().size();

    EXPECT_TRUE(hh.parse(&diag));
    EXPECT_TRUE(hh.parseHeader(&diag));
    EXPECT_EQ(*hh.hand(), first);
    EXPECT_EQ(diag.items().size(), reported);

    StarsHandHistory again(phh::test::kHandEveryStreet);
    ASSERT_TRUE(again.parse(&diag));
    EXPECT_EQ(*again.hand(), first);
}

TEST(StarsHandHistory, ParseRunsHeaderPhaseImplicitly) {
    StarsHandHistory hh(phh::test::kHandOmahaShowdown);
    CollectingDiagnostics diag;
    ASSERT_TRUE(hh.parse(&diag));
    ASSERT_NE(hh.header(), nullptr);
    EXPECT_EQ(hh.header()->ident, "107030112846");
}

TEST(StarsHandHistory, BadHeaderFails) {
    StarsHandHistory hh("PokerStars Hand #999: Razz Limit ($0.10/$0.20 USD) - 2015/07/12 17:45:30 ET\n"
                        "Table 'X' 8-max Seat #1 is the button\n");
    CollectingDiagnostics diag;
    EXPECT_FALSE(hh.parse(&diag));
    EXPECT_EQ(hh.state(), ParseState::Failed);
    EXPECT_EQ(hh.header(), nullptr);
    EXPECT_EQ(hh.hand(), nullptr);
    ASSERT_TRUE(hh.error().has_value());
    EXPECT_EQ(hh.error()->kind, ParseErrorKind::HeaderFormat);
    EXPECT_EQ(hh.error()->handId, "999");
    EXPECT_NE(hh.error()->describe().find("HeaderFormatError"), std::string::npos);

    // A failed hand stays failed.
    EXPECT_FALSE(hh.parseHeader(&diag));
    EXPECT_FALSE(hh.parse(&diag));
}

TEST(StarsHandHistory, EmptyTextFails) {
    StarsHandHistory hh("");
    CollectingDiagnostics diag;
    EXPECT_FALSE(hh.parseHeader(&diag));
    ASSERT_TRUE(hh.error().has_value());
    EXPECT_EQ(hh.error()->kind, ParseErrorKind::HeaderFormat);
}

TEST(StarsHandHistory, MalformedTableLineFails) {
    std::string text = phh::test::kHandFlopOnly;
    const std::string table = "Table '797469411 15' 9-max Seat #1 is the button";
    text.replace(text.find(table), table.size(), "Table '797469411 15' Seat #1 is the button");

    StarsHandHistory hh(text);
    CollectingDiagnostics diag;
    EXPECT_FALSE(hh.parse(&diag));
    EXPECT_EQ(hh.error()->kind, ParseErrorKind::TableFormat);
    EXPECT_EQ(hh.error()->handId, "105024000105");
    // The header survives a body failure.
    ASSERT_NE(hh.header(), nullptr);
    EXPECT_EQ(hh.hand(), nullptr);
}

TEST(StarsHandHistory, DuplicateHoleCardsFail) {
    std::string text = phh::test::kHandFlopOnly;
    const std::string dealt = "Dealt to W2lkm2n [Ac Jh]";
    text.replace(text.find(dealt), dealt.size(), "Dealt to W2lkm2n [Ac Ac]");

    StarsHandHistory hh(text);
    CollectingDiagnostics diag;
    EXPECT_FALSE(hh.parse(&diag));
    EXPECT_EQ(hh.error()->kind, ParseErrorKind::InvalidCombo);
    EXPECT_EQ(hh.error()->offendingText, "Dealt to W2lkm2n [Ac Ac]");
}

TEST(StarsHandHistory, HoldemHeroWithFourCardsFails) {
    std::string text = phh::test::kHandFlopOnly;
    const std::string dealt = "Dealt to W2lkm2n [Ac Jh]";
    text.replace(text.find(dealt), dealt.size(), "Dealt to W2lkm2n [Ac Jh 2c 3c]");

    StarsHandHistory hh(text);
    CollectingDiagnostics diag;
    EXPECT_FALSE(hh.parse(&diag));
    EXPECT_EQ(hh.error()->kind, ParseErrorKind::InvalidCombo);
}

TEST(StarsHandHistory, RepeatedBoardCardFails) {
    std::string text = phh::test::kHandEveryStreet;
    const std::string turn = "*** TURN *** [6s 4d 3s] [8c]";
    text.replace(text.find(turn), turn.size(), "*** TURN *** [6s 4d 3s] [4d]");

    StarsHandHistory hh(text);
    CollectingDiagnostics diag;
    EXPECT_FALSE(hh.parse(&diag));
    EXPECT_EQ(hh.error()->kind, ParseErrorKind::InvalidCombo);
}

TEST(StarsHandHistory, DuplicateShownCardFails) {
    std::string text = phh::test::kHandOmahaShowdown;
    const std::string shows = "krissu23: shows [5s 7s 7c As]";
    text.replace(text.find(shows), shows.size(), "krissu23: shows [5s 7s 7s As]");

    StarsHandHistory hh(text);
    CollectingDiagnostics diag;
    EXPECT_FALSE(hh.parse(&diag));
    EXPECT_EQ(hh.error()->kind, ParseErrorKind::InvalidCombo);
}

TEST(StarsHandHistory, UnknownLinesAreSkippedAndReported) {
    std::string text = phh::test::kHandFlopOnly;
    const std::string anchor = "MISTRPerfect: calls 60\n";
    text.insert(text.find(anchor) + anchor.size(), "W2lkm2n said, \"gl\"\n");

    StarsHandHistory hh(text);
    CollectingDiagnostics diag;
    ASSERT_TRUE(hh.parse(&diag));
    EXPECT_EQ(hh.hand()->preflopActions->size(), 9u);
    ASSERT_EQ(diag.count(DiagnosticKind::UnrecognizedAction), 1u);

    const auto it = std::find_if(diag.items().begin(), diag.items().end(), [](const auto& d) {
        return d.kind == DiagnosticKind::UnrecognizedAction;
    });
    EXPECT_EQ(it->handId, "105024000105");
    EXPECT_EQ(it->text, "W2lkm2n said, \"gl\"");

    phh::infra::stars::ParserSettings quiet;
    quiet.reportUnrecognizedLines = false;
    StarsHandHistory silent(text, quiet);
    CollectingDiagnostics none;
    ASSERT_TRUE(silent.parse(&none));
    EXPECT_EQ(none.count(DiagnosticKind::UnrecognizedAction), 0u);
    EXPECT_EQ(*silent.hand(), *hh.hand());
}

TEST(StarsHandHistory, SeatOutsideTableIsSkipped) {
    std::string text = phh::test::kHandHeroMissing;
    const std::string seat = "Seat 6: Pandrilla ($1.95 in chips)";
    text.replace(text.find(seat), seat.size(), seat + "\nSeat 7: Ghost ($1 in chips)");

    StarsHandHistory hh(text);
    CollectingDiagnostics diag;
    ASSERT_TRUE(hh.parse(&diag));
    EXPECT_EQ(hh.hand()->players.size(), 6u);
    EXPECT_EQ(diag.count(DiagnosticKind::SkippedLine), 1u);
}
