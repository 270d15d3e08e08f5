#include <gtest/gtest.h>

#include "../core/Evolve.hpp"
#include "TestState.hpp"

using namespace ltcg::core;
using namespace ltcg::test;
using RVC = error::RuleViolationCode;

TEST(Summon, NormalSummonPlacesFaceUpAndUsesTheTurnSummon)
{
    GameState s = MakeState();
    CardId const id = AddToHand(s, Seat::Host, "varsity_captain");
    CardId const other = AddToHand(s, Seat::Host, "hall_monitor");

    Settled const r = Play(s, Seat::Host, SummonCmd{id, Position::Attack, {}});
    ASSERT_EQ(r.events.size(), 1u);
    EXPECT_EQ(std::get<MonsterSummoned>(r.events[0]), (MonsterSummoned{Seat::Host, id, Position::Attack, {}}));

    BoardCard const* c = Board(r.state, Seat::Host, id);
    ASSERT_NE(c, nullptr);
    EXPECT_FALSE(c->face_down);
    EXPECT_EQ(c->turn_summoned, s.turn_number);
    EXPECT_TRUE(r.state.Of(Seat::Host).normal_summoned_this_turn);

    EXPECT_EQ(RejectionOf(r.state, Seat::Host, SummonCmd{other, Position::Attack, {}}),
              RVC::Summon_AlreadyNormalSummoned);
    EXPECT_EQ(RejectionOf(r.state, Seat::Host, SetMonsterCmd{other}), RVC::Summon_AlreadyNormalSummoned);
}

TEST(Summon, SetMonsterIsFaceDownDefense)
{
    GameState s = MakeState();
    CardId const id = AddToHand(s, Seat::Host, "library_sentinel");

    Settled const r = Play(s, Seat::Host, SetMonsterCmd{id});
    BoardCard const* c = Board(r.state, Seat::Host, id);
    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c->face_down);
    EXPECT_EQ(c->position, Position::Defense);
    EXPECT_TRUE(r.state.Of(Seat::Host).normal_summoned_this_turn);
}

TEST(Summon, RequiresMainPhaseHandAndMonster)
{
    GameState s = MakeState(Phase::Combat);
    CardId const id = AddToHand(s, Seat::Host, "hall_monitor");
    CardId const spell = AddToHand(s, Seat::Host, "cram_session");

    EXPECT_EQ(RejectionOf(s, Seat::Host, SummonCmd{id, Position::Attack, {}}), RVC::WrongPhase_MainRequired);

    s.current_phase = Phase::Main2;
    EXPECT_FALSE(RejectionOf(s, Seat::Host, SummonCmd{id, Position::Attack, {}}).has_value());
    EXPECT_EQ(RejectionOf(s, Seat::Host, SummonCmd{spell, Position::Attack, {}}), RVC::Card_WrongType);
    EXPECT_EQ(RejectionOf(s, Seat::Host, SummonCmd{"h:99:ghost", Position::Attack, {}}), RVC::Card_NotInHand);
    EXPECT_EQ(RejectionOf(s, Seat::Away, SummonCmd{id, Position::Attack, {}}), RVC::WrongActor_TurnPlayerRequired);
}

TEST(Summon, HighLevelNeedsExactlyOneTribute)
{
    GameState s = MakeState();
    CardId const tyrant = AddToHand(s, Seat::Host, "prom_tyrant");
    CardId const fodder = AddMonster(s, Seat::Host, "hall_monitor");
    CardId const hidden = AddMonster(s, Seat::Host, "class_clown", Position::Defense, true);

    EXPECT_EQ(RejectionOf(s, Seat::Host, SummonCmd{tyrant, Position::Attack, {}}), RVC::Summon_TributeCountMismatch);
    EXPECT_EQ(RejectionOf(s, Seat::Host, SummonCmd{tyrant, Position::Attack, {fodder, hidden}}),
              RVC::Summon_TributeCountMismatch);
    EXPECT_EQ(RejectionOf(s, Seat::Host, SummonCmd{tyrant, Position::Attack, {hidden}}), RVC::Summon_TributeInvalid);

    Settled const r = Play(s, Seat::Host, SummonCmd{tyrant, Position::Attack, {fodder}});
    ASSERT_EQ(r.events.size(), 2u);
    EXPECT_EQ(std::get<CardSentToGraveyard>(r.events[0]), (CardSentToGraveyard{fodder, ZoneKind::Board, Seat::Host}));
    EXPECT_TRUE(Holds<MonsterSummoned>(r.events[1]));
    EXPECT_EQ(r.state.Of(Seat::Host).graveyard, (CardIds{fodder}));
    EXPECT_NE(Board(r.state, Seat::Host, tyrant), nullptr);
}

TEST(Summon, TributeFreesASlotOnAFullBoard)
{
    GameState s = MakeState();
    CardId const tyrant = AddToHand(s, Seat::Host, "prom_tyrant");
    CardId const small = AddToHand(s, Seat::Host, "hall_monitor");
    CardId const a = AddMonster(s, Seat::Host, "hall_monitor");
    AddMonster(s, Seat::Host, "hall_monitor");
    AddMonster(s, Seat::Host, "hall_monitor");

    EXPECT_EQ(RejectionOf(s, Seat::Host, SummonCmd{small, Position::Attack, {}}), RVC::Zone_BoardFull);
    EXPECT_EQ(RejectionOf(s, Seat::Host, SetMonsterCmd{small}), RVC::Zone_BoardFull);
    EXPECT_FALSE(RejectionOf(s, Seat::Host, SummonCmd{tyrant, Position::Attack, {a}}).has_value());
}

TEST(Summon, FlipSummonWaitsATurn)
{
    GameState s = MakeState();
    CardId const fresh = AddToHand(s, Seat::Host, "class_clown");
    Settled const set = Play(s, Seat::Host, SetMonsterCmd{fresh});
    EXPECT_EQ(RejectionOf(set.state, Seat::Host, FlipSummonCmd{fresh}), RVC::Summon_SameTurn);

    GameState old = MakeState();
    CardId const up = AddMonster(old, Seat::Host, "hall_monitor");
    EXPECT_EQ(RejectionOf(old, Seat::Host, FlipSummonCmd{up}), RVC::Summon_FaceDownRequired);
    EXPECT_EQ(RejectionOf(old, Seat::Host, FlipSummonCmd{"nope"}), RVC::Card_NotOnBoard);
}

TEST(Summon, FlipSummonFiresFlipEffect)
{
    GameState s = MakeState();
    CardId const clown = AddMonster(s, Seat::Host, "class_clown", Position::Defense, true);

    Settled const r = Play(s, Seat::Host, FlipSummonCmd{clown});
    ASSERT_FALSE(r.events.empty());
    EXPECT_TRUE(Holds<FlipSummoned>(r.events[0]));
    EXPECT_EQ(CountOf<EffectActivated>(r.events), 1u);
    EXPECT_EQ(r.state.Of(Seat::Away).life_points, constants::StartingLp - 500);

    BoardCard const* c = Board(r.state, Seat::Host, clown);
    ASSERT_NE(c, nullptr);
    EXPECT_FALSE(c->face_down);
    EXPECT_EQ(c->position, Position::Attack);
    EXPECT_EQ(RejectionOf(r.state, Seat::Host, ChangePositionCmd{clown}), RVC::Position_AlreadyChanged);
}

TEST(Summon, OnSummonTriggerDrawsOncePerTurn)
{
    GameState s = MakeState();
    CardId const gossip = AddToHand(s, Seat::Host, "gossip_queen");
    CardId const top = AddToDeck(s, Seat::Host, "hall_monitor");

    Settled const r = Play(s, Seat::Host, SummonCmd{gossip, Position::Attack, {}});
    EXPECT_EQ(CountOf<EffectActivated>(r.events), 1u);
    EXPECT_EQ(CountOf<CardDrawn>(r.events), 1u);
    EXPECT_EQ(r.state.Of(Seat::Host).hand, (CardIds{top}));
    EXPECT_EQ(r.state.opt_used_this_turn.size(), 1u);
}

TEST(Summon, ChangePositionRules)
{
    GameState s = MakeState();
    CardId const vet = AddMonster(s, Seat::Host, "hall_monitor");
    CardId const hidden = AddMonster(s, Seat::Host, "library_sentinel", Position::Defense, true);

    EXPECT_EQ(RejectionOf(s, Seat::Host, ChangePositionCmd{hidden}), RVC::Position_FaceUpRequired);

    Settled const r = Play(s, Seat::Host, ChangePositionCmd{vet});
    ASSERT_EQ(r.events.size(), 1u);
    EXPECT_EQ(std::get<PositionChanged>(r.events[0]), (PositionChanged{vet, Position::Attack, Position::Defense}));
    EXPECT_EQ(RejectionOf(r.state, Seat::Host, ChangePositionCmd{vet}), RVC::Position_AlreadyChanged);

    // a new turn for this seat clears the flag
    GameState const next = Evolve(r.state, {TurnStarted{Seat::Host, s.turn_number + 2}, PhaseChanged{Phase::Draw, Phase::Main}});
    EXPECT_FALSE(RejectionOf(next, Seat::Host, ChangePositionCmd{vet}).has_value());
}
