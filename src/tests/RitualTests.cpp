#include <gtest/gtest.h>
#include <algorithm>
#include <iterator>

#include "TestState.hpp"

using namespace ltcg::core;
using namespace ltcg::test;
using RVC = error::RuleViolationCode;

namespace
{
    struct RitualTable
    {
        GameState s = MakeState();
        CardId rite = AddToHand(s, Seat::Host, "graduation_rite");
        CardId star = AddToHand(s, Seat::Host, "valedictorian");
        CardId monitor = AddMonster(s, Seat::Host, "hall_monitor");
        CardId captain = AddMonster(s, Seat::Host, "varsity_captain");
        CardId hidden = AddMonster(s, Seat::Host, "library_sentinel", Position::Defense, true);
    };
}

TEST(Ritual, TributesLeaveAndTheMonsterArrivesFaceUp)
{
    RitualTable t;
    CardIds const targets{t.star, t.monitor, t.captain};

    Settled const r = Play(t.s, Seat::Host, ActivateSpellCmd{t.rite, targets});
    ASSERT_EQ(r.events.size(), 7u);
    EXPECT_EQ(std::get<SpellActivated>(r.events[0]), (SpellActivated{Seat::Host, t.rite, targets}));
    EXPECT_EQ(std::get<CardDestroyed>(r.events[1]), (CardDestroyed{t.monitor, DestroyReason::Effect}));
    EXPECT_EQ(std::get<CardSentToGraveyard>(r.events[2]),
              (CardSentToGraveyard{t.monitor, ZoneKind::Board, Seat::Host}));
    EXPECT_EQ(std::get<CardDestroyed>(r.events[3]), (CardDestroyed{t.captain, DestroyReason::Effect}));
    EXPECT_EQ(std::get<RitualSummoned>(r.events[5]),
              (RitualSummoned{Seat::Host, t.star, t.rite, {t.monitor, t.captain}}));
    EXPECT_EQ(std::get<CardSentToGraveyard>(r.events[6]),
              (CardSentToGraveyard{t.rite, ZoneKind::SpellTrapZone, Seat::Host}));

    SeatState const& host = r.state.Of(Seat::Host);
    EXPECT_TRUE(host.hand.empty());
    EXPECT_TRUE(host.spell_trap_zone.empty());
    EXPECT_EQ(host.graveyard, (CardIds{t.monitor, t.captain, t.rite}));
    ASSERT_EQ(host.board.size(), 2u);
    EXPECT_EQ(host.board[0].card_id, t.hidden);

    BoardCard const& star = host.board[1];
    EXPECT_EQ(star.card_id, t.star);
    EXPECT_EQ(star.position, Position::Attack);
    EXPECT_FALSE(star.face_down);
    EXPECT_FALSE(host.normal_summoned_this_turn);
}

TEST(Ritual, RejectsBadMonsterTributesAndLevels)
{
    RitualTable t;
    CardId const cram = AddToHand(t.s, Seat::Host, "cram_session");
    auto const reject = [&](CardIds targets)
    {
        return RejectionOf(t.s, Seat::Host, ActivateSpellCmd{t.rite, std::move(targets)});
    };

    EXPECT_EQ(reject({}), RVC::Ritual_MonsterInvalid);
    EXPECT_EQ(reject({t.monitor, t.captain}), RVC::Ritual_MonsterInvalid);
    EXPECT_EQ(reject({cram, t.monitor, t.captain}), RVC::Ritual_MonsterInvalid);
    EXPECT_EQ(reject({t.star}), RVC::Ritual_TributesInvalid);
    EXPECT_EQ(reject({t.star, t.captain, t.monitor}), RVC::Ritual_TributesInvalid);
    EXPECT_EQ(reject({t.star, t.monitor, t.monitor}), RVC::Ritual_TributesInvalid);
    EXPECT_EQ(reject({t.star, t.monitor, t.hidden}), RVC::Ritual_TributesInvalid);
    EXPECT_EQ(reject({t.star, t.monitor}), RVC::Ritual_LevelTooLow);
    EXPECT_FALSE(reject({t.star, t.monitor, t.captain}).has_value());

    EXPECT_EQ(RejectionOf(t.s, Seat::Host, ActivateSpellCmd{t.rite, {t.star, t.monitor, t.captain}, 1}),
              RVC::Activate_NoSuchEffect);
}

TEST(Ritual, TributeSetsMeetingTheLevelAreListed)
{
    RitualTable t;
    std::vector<Command> const legal = LegalMoves(t.s, Seat::Host);

    std::vector<Command> rituals;
    std::ranges::copy_if(legal, std::back_inserter(rituals), [&](Command const& c)
    {
        auto const* a = std::get_if<ActivateSpellCmd>(&c);
        return a != nullptr && a->card_id == t.rite;
    });
    EXPECT_EQ(rituals, (std::vector<Command>{ActivateSpellCmd{t.rite, {t.star, t.monitor, t.captain}}}));

    GameState thin = t.s;
    std::erase_if(thin.Of(Seat::Host).board, [&](BoardCard const& c) { return c.card_id == t.captain; });
    std::vector<Command> const none = LegalMoves(thin, Seat::Host);
    EXPECT_FALSE(std::ranges::any_of(none, [&](Command const& c)
    {
        auto const* a = std::get_if<ActivateSpellCmd>(&c);
        return a != nullptr && a->card_id == t.rite;
    }));
}
