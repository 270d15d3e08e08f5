#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <tuple>

#include "../core/Duel.hpp"
#include "../core/RandomAi.hpp"
#include "../core/Setup.hpp"
#include "../debug/Invariants.hpp"
#include "TestState.hpp"

using namespace ltcg::core;
using namespace ltcg::test;
using RVC = error::RuleViolationCode;

namespace
{
    auto make_duel(std::uint64_t const seed) -> Duel
    {
        EngineConfig cfg;
        cfg.seed = seed;
        GameState initial = CreateInitialState(cfg, demo::Registry(), demo::Deck(20), demo::Deck(20));
        return Duel(std::move(initial), std::make_unique<DuelRules>(), false);
    }

    auto no_duplicates(std::vector<Command> const& moves) -> bool
    {
        for (std::size_t i{}; i < moves.size(); ++i)
        {
            for (std::size_t j{i + 1}; j < moves.size(); ++j)
            {
                if (moves[i] == moves[j])
                    return false;
            }
        }
        return true;
    }

    // Everything a command can change; registry and config never move.
    auto same_signature(GameState const& a, GameState const& b) -> bool
    {
        return std::tie(a.seats, a.current_turn_player, a.turn_number, a.current_phase, a.current_chain,
                        a.negated_links, a.current_priority_player, a.current_chain_passer,
                        a.temporary_modifiers, a.lingering_effects, a.cost_modifiers, a.turn_restrictions,
                        a.opt_used_this_turn, a.hopt_used_effects, a.game_over, a.winner)
            == std::tie(b.seats, b.current_turn_player, b.turn_number, b.current_phase, b.current_chain,
                        b.negated_links, b.current_priority_player, b.current_chain_passer,
                        b.temporary_modifiers, b.lingering_effects, b.cost_modifiers, b.turn_restrictions,
                        b.opt_used_this_turn, b.hopt_used_effects, b.game_over, b.winner);
    }
}

TEST(LegalMoves, EveryListedMoveIsAcceptedAndNothingElse)
{
    DuelRules const rules;
    for (std::uint64_t const seed : {7ull, 1234ull, 0xC0FFEEull})
    {
        Duel duel = make_duel(seed);
        RandomAI host_ai{seed + 1};
        RandomAI away_ai{seed + 2};

        for (int step{}; step < 600 && !duel.Over(); ++step)
        {
            GameState const& s = duel.State();
            for (Seat const seat : {Seat::Host, Seat::Away})
            {
                std::vector<Command> const legal = duel.LegalMoves(seat);
                ASSERT_TRUE(no_duplicates(legal)) << "seed " << seed << " step " << step;
                for (Command const& c : legal)
                {
                    ASSERT_FALSE(Decide(s, seat, c, false).empty()) << Describe(c);
                }
                for (Command const& c : rules.Candidates(s, seat))
                {
                    bool const listed = std::ranges::find(legal, c) != legal.end();
                    EXPECT_EQ(listed, rules.Validate(s, seat, c).has_value()) << Describe(c);
                }
            }

            Seat const actor = duel.ActingSeat();
            std::vector<Command> const legal = duel.LegalMoves(actor);
            ASSERT_FALSE(legal.empty());
            RandomAI& ai = actor == Seat::Host ? host_ai : away_ai;
            Command const c = ai.Play(duel.View(actor), legal);
            ASSERT_FALSE(duel.Submit(actor, c).empty()) << Describe(c);
            ASSERT_EQ(debug::CheckInvariants(duel.State()), std::vector<std::string>{}) << "after " << Describe(c);
        }
    }
}

TEST(LegalMoves, DecideIsDeterministic)
{
    Duel duel = make_duel(99);
    RandomAI ai{5};
    for (int step{}; step < 200 && !duel.Over(); ++step)
    {
        Seat const actor = duel.ActingSeat();
        std::vector<Command> const legal = duel.LegalMoves(actor);
        Command const c = ai.Play(duel.View(actor), legal);

        GameState const before = duel.State();
        EventList const first = Decide(before, actor, c, false);
        EXPECT_EQ(first, Decide(before, actor, c, false));
        EXPECT_EQ(duel.Submit(actor, c), Settle(before, first).events);
    }
}

TEST(LegalMoves, NoCommandIsReofferedForAnUnchangedState)
{
    for (std::uint64_t const seed : {21ull, 808ull})
    {
        Duel duel = make_duel(seed);
        RandomAI ai{seed};
        for (int step{}; step < 500 && !duel.Over(); ++step)
        {
            Seat const actor = duel.ActingSeat();
            std::vector<Command> const legal = duel.LegalMoves(actor);
            Command const c = ai.Play(duel.View(actor), legal);

            GameState const before = duel.State();
            ASSERT_FALSE(duel.Submit(actor, c).empty()) << Describe(c);
            if (!same_signature(before, duel.State()))
                continue;

            std::vector<Command> const again = duel.LegalMoves(actor);
            EXPECT_TRUE(std::ranges::find(again, c) == again.end()) << "seed " << seed << " re-offers " << Describe(c);
        }
    }
}

TEST(LegalMoves, MultiTargetListsFollowCandidateOrder)
{
    CardDefinition pair_spell;
    pair_spell.id = "double_detention";
    pair_spell.name = "Double Detention";
    pair_spell.type = CardType::Spell;
    pair_spell.spell_type = SpellType::Normal;
    pair_spell.effects.push_back(EffectDefinition{
        .id = "eff_0",
        .type = EffectType::Trigger,
        .target_count = 2,
        .target_filter = TargetFilter{.owner = Owner::Opponent, .zone = ZoneKind::Board},
        .actions = {AddVice{1}},
    });

    GameState s = WithExtraCards(MakeState(), {pair_spell});
    CardId const spell = AddToHand(s, Seat::Host, "double_detention");
    CardIds const foes{AddMonster(s, Seat::Away, "hall_monitor"), AddMonster(s, Seat::Away, "varsity_captain"),
                       AddMonster(s, Seat::Away, "library_sentinel")};

    EXPECT_FALSE(RejectionOf(s, Seat::Host, ActivateSpellCmd{spell, {foes[0], foes[1]}}).has_value());
    EXPECT_EQ(RejectionOf(s, Seat::Host, ActivateSpellCmd{spell, {foes[1], foes[0]}}), RVC::Activate_TargetsInvalid);
    EXPECT_EQ(RejectionOf(s, Seat::Host, ActivateSpellCmd{spell, {foes[2], foes[2]}}), RVC::Activate_TargetsInvalid);

    std::vector<Command> const legal = LegalMoves(s, Seat::Host);
    std::size_t offered{};
    for (CardId const& first : foes)
    {
        for (CardId const& second : foes)
        {
            Command const c = ActivateSpellCmd{spell, {first, second}};
            bool const listed = std::ranges::find(legal, c) != legal.end();
            EXPECT_EQ(listed, !RejectionOf(s, Seat::Host, c).has_value()) << Describe(c);
            offered += listed ? 1u : 0u;
        }
    }
    EXPECT_EQ(offered, 3u);
}

TEST(LegalMoves, NothingIsLegalOnceTheDuelIsOver)
{
    Duel duel = make_duel(3);
    ASSERT_FALSE(duel.Submit(Seat::Away, SurrenderCmd{}).empty());
    EXPECT_TRUE(duel.Over());
    EXPECT_TRUE(duel.LegalMoves(Seat::Host).empty());
    EXPECT_TRUE(duel.LegalMoves(Seat::Away).empty());
    EXPECT_TRUE(duel.Submit(Seat::Host, AdvancePhaseCmd{}).empty());
    EXPECT_EQ(duel.History().size(), 2u);
}

TEST(LegalMoves, OpeningTurnOffersFlowButNoAttacks)
{
    Duel duel = make_duel(11);
    GameState const& s = duel.State();
    EXPECT_EQ(s.turn_number, 1u);
    EXPECT_EQ(s.current_phase, Phase::Draw);
    EXPECT_EQ(s.Of(Seat::Host).hand.size(), s.config.starting_hand_size);
    EXPECT_EQ(s.Of(Seat::Away).hand.size(), s.config.starting_hand_size);

    std::vector<Command> const away = duel.LegalMoves(Seat::Away);
    EXPECT_EQ(away, (std::vector<Command>{SurrenderCmd{}}));

    std::vector<Command> const host = duel.LegalMoves(Seat::Host);
    EXPECT_TRUE(std::ranges::find(host, Command{AdvancePhaseCmd{}}) != host.end());
    EXPECT_TRUE(std::ranges::find(host, Command{EndTurnCmd{}}) == host.end());
    EXPECT_FALSE(std::ranges::any_of(host, [](Command const& c) { return std::holds_alternative<DeclareAttackCmd>(c); }));
}
