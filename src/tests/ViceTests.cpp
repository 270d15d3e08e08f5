#include <gtest/gtest.h>

#include "../core/RuleModules.hpp"
#include "TestState.hpp"

using namespace ltcg::core;
using namespace ltcg::test;
using RVC = error::RuleViolationCode;

namespace
{
    // Three away monsters already at the breakdown threshold, host in main2.
    auto make_overloaded(std::uint32_t const breakdowns_to_win) -> GameState
    {
        GameState s = MakeState(Phase::Main2, 4);
        s.config.max_breakdowns_to_win = breakdowns_to_win;
        for (char const* def : {"hall_monitor", "varsity_captain", "library_sentinel"})
        {
            AddMonster(s, Seat::Away, def);
            s.Of(Seat::Away).board.back().vice_counters = s.config.breakdown_threshold;
        }
        return s;
    }
}

TEST(Vice, SimultaneousBreakdownsEmitThreeEventsEach)
{
    GameState const s = make_overloaded(10);
    CardIds ids;
    for (BoardCard const& c : s.Of(Seat::Away).board)
    {
        ids.push_back(c.card_id);
    }

    EventList const events = rules::BreakdownEvents(s);
    ASSERT_EQ(events.size(), 9u);
    for (std::size_t i{}; i < ids.size(); ++i)
    {
        EXPECT_EQ(std::get<BreakdownTriggered>(events[3 * i]), (BreakdownTriggered{Seat::Away, ids[i]}));
        EXPECT_EQ(std::get<CardDestroyed>(events[3 * i + 1]), (CardDestroyed{ids[i], DestroyReason::Breakdown}));
        EXPECT_EQ(std::get<CardSentToGraveyard>(events[3 * i + 2]),
                  (CardSentToGraveyard{ids[i], ZoneKind::Board, Seat::Away}));
    }

    Settled const r = Settle(s, events);
    EXPECT_EQ(r.state.Of(Seat::Host).breakdowns_caused, 3u);
    EXPECT_EQ(r.state.Of(Seat::Away).breakdowns_caused, 0u);
    EXPECT_EQ(r.state.Of(Seat::Away).graveyard, ids);
    EXPECT_FALSE(r.state.game_over);
}

TEST(Vice, BelowThresholdIsLeftAlone)
{
    GameState s = MakeState();
    AddMonster(s, Seat::Host, "hall_monitor");
    s.Of(Seat::Host).board.back().vice_counters = s.config.breakdown_threshold - 1;
    EXPECT_TRUE(rules::BreakdownEvents(s).empty());
}

TEST(Vice, EndTurnRunsTheBreakdownCheckAndCanWin)
{
    Settled const r = Play(make_overloaded(3), Seat::Host, EndTurnCmd{});
    ASSERT_EQ(r.events.size(), 10u);
    EXPECT_EQ(std::get<PhaseChanged>(r.events.front()), (PhaseChanged{Phase::Main2, Phase::BreakdownCheck}));
    EXPECT_TRUE(r.state.game_over);
    EXPECT_EQ(r.state.winner, Seat::Host);
    EXPECT_EQ(r.state.win_reason, WinReason::Breakdown);
    EXPECT_EQ(RejectionOf(r.state, Seat::Away, AdvancePhaseCmd{}), RVC::GameOver);
}

TEST(Vice, EndTurnContinuesWhenNobodyHasWon)
{
    Settled const r = Play(make_overloaded(10), Seat::Host, EndTurnCmd{});
    EXPECT_EQ(CountOf<BreakdownTriggered>(r.events), 3u);
    EXPECT_FALSE(r.state.game_over);
    EXPECT_EQ(r.state.current_turn_player, Seat::Away);
    EXPECT_EQ(r.state.turn_number, 5u);
    EXPECT_EQ(r.state.current_phase, Phase::Draw);
}

TEST(Vice, IgnitionEffectPaysLpAndBreaksDownItsTarget)
{
    GameState s = MakeState();
    CardId const dealer = AddMonster(s, Seat::Host, "detention_dealer");
    CardId const mark = AddMonster(s, Seat::Away, "hall_monitor");
    s.Of(Seat::Away).board.back().vice_counters = 2;

    EXPECT_EQ(RejectionOf(s, Seat::Host, ActivateEffectCmd{dealer, 0, {}}), RVC::Activate_TargetsInvalid);
    EXPECT_EQ(RejectionOf(s, Seat::Host, ActivateEffectCmd{dealer, 1, {mark}}), RVC::Activate_NoSuchEffect);

    Settled const r = Play(s, Seat::Host, ActivateEffectCmd{dealer, 0, {mark}});
    EXPECT_EQ(r.events, (EventList{
        CostPaid{Seat::Host, dealer, CostType::PayLp, 500},
        DamageDealt{Seat::Host, 500, false},
        EffectActivated{Seat::Host, dealer, 0, {mark}},
        ViceCounterAdded{mark, 3},
        BreakdownTriggered{Seat::Away, mark},
        CardDestroyed{mark, DestroyReason::Breakdown},
        CardSentToGraveyard{mark, ZoneKind::Board, Seat::Away},
    }));
    EXPECT_EQ(r.state.Of(Seat::Host).life_points, constants::StartingLp - 500);
    EXPECT_EQ(r.state.Of(Seat::Host).breakdowns_caused, 1u);

    GameState again = r.state;
    CardId const next = AddMonster(again, Seat::Away, "hall_monitor");
    EXPECT_EQ(RejectionOf(again, Seat::Host, ActivateEffectCmd{dealer, 0, {next}}), RVC::Activate_OncePerTurnUsed);
}

TEST(Vice, LpCostMustLeaveLifeRemaining)
{
    GameState s = MakeState();
    CardId const dealer = AddMonster(s, Seat::Host, "detention_dealer");
    CardId const mark = AddMonster(s, Seat::Away, "hall_monitor");

    s.Of(Seat::Host).life_points = 500;
    EXPECT_EQ(RejectionOf(s, Seat::Host, ActivateEffectCmd{dealer, 0, {mark}}), RVC::Activate_CostUnpayable);
    s.Of(Seat::Host).life_points = 501;
    EXPECT_FALSE(RejectionOf(s, Seat::Host, ActivateEffectCmd{dealer, 0, {mark}}).has_value());
}
