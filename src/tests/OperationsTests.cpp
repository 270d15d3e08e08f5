#include <gtest/gtest.h>
#include <vector>

#include "../core/Evolve.hpp"
#include "../core/Operations.hpp"
#include "../core/Queries.hpp"
#include "TestState.hpp"

using namespace ltcg::core;
using namespace ltcg::test;

namespace
{
    auto run(GameState const& s, EffectAction const& a, CardId const& source = "src",
             std::vector<CardId> const& targets = {}) -> EventList
    {
        return ExecuteAction(s, a, Seat::Host, source, targets);
    }
}

TEST(Operations, DamageHitsOpponentAndHealRestoresSelf)
{
    GameState s = MakeState();
    EventList const dmg = run(s, Damage{LiteralAmount{700}});
    ASSERT_EQ(dmg.size(), 1u);
    EXPECT_EQ(std::get<DamageDealt>(dmg[0]), (DamageDealt{Seat::Away, 700, false}));

    EventList const heal = run(s, Heal{LiteralAmount{300}});
    ASSERT_EQ(heal.size(), 1u);
    EXPECT_EQ(std::get<DamageDealt>(heal[0]), (DamageDealt{Seat::Host, -300, false}));

    s.Of(Seat::Host).life_points = 1000;
    GameState const after = Evolve(s, heal);
    EXPECT_EQ(after.Of(Seat::Host).life_points, 1300);
}

TEST(Operations, ZeroAmountsStillReportDamage)
{
    GameState s = MakeState();
    EventList const dmg = run(s, Damage{GraveyardCount{Owner::Any, 100}});
    ASSERT_EQ(dmg.size(), 1u);
    EXPECT_EQ(std::get<DamageDealt>(dmg[0]), (DamageDealt{Seat::Away, 0, false}));

    EventList const heal = run(s, Heal{LiteralAmount{0}});
    ASSERT_EQ(heal.size(), 1u);
    EXPECT_EQ(std::get<DamageDealt>(heal[0]), (DamageDealt{Seat::Host, 0, false}));

    GameState const after = Evolve(s, dmg);
    EXPECT_EQ(after.Of(Seat::Away).life_points, s.Of(Seat::Away).life_points);
}

TEST(Operations, DamageClampsAtZero)
{
    GameState s = MakeState();
    s.Of(Seat::Away).life_points = 200;
    GameState const after = Evolve(s, run(s, Damage{LiteralAmount{900}}));
    EXPECT_EQ(after.Of(Seat::Away).life_points, 0);
}

TEST(Operations, DrawTakesFromTopAndStopsAtEmptyDeck)
{
    GameState s = MakeState();
    CardId const top = AddToDeck(s, Seat::Host, "hall_monitor");
    CardId const next = AddToDeck(s, Seat::Host, "prom_tyrant");

    EventList const events = run(s, Draw{5});
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<CardDrawn>(events[0]).card_id, top);
    EXPECT_EQ(std::get<CardDrawn>(events[1]).card_id, next);

    GameState const after = Evolve(s, events);
    EXPECT_TRUE(after.Of(Seat::Host).deck.empty());
    EXPECT_EQ(after.Of(Seat::Host).hand, (CardIds{top, next}));
}

TEST(Operations, DiscardTakesFromEndOfOpponentHand)
{
    GameState s = MakeState();
    CardId const first = AddToHand(s, Seat::Away, "hall_monitor");
    CardId const last = AddToHand(s, Seat::Away, "cram_session");

    EventList const one = run(s, Discard{1});
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(std::get<CardSentToGraveyard>(one[0]), (CardSentToGraveyard{last, ZoneKind::Hand, Seat::Away}));

    GameState const after = Evolve(s, run(s, Discard{constants::DiscardAll}));
    EXPECT_TRUE(after.Of(Seat::Away).hand.empty());
    EXPECT_EQ(after.Of(Seat::Away).graveyard, (CardIds{last, first}));
}

TEST(Operations, DestroyRecordsOwningSeat)
{
    GameState s = MakeState();
    CardId const foe = AddMonster(s, Seat::Away, "varsity_captain");

    EventList const events = run(s, Destroy{DestroyTarget::Selected}, "src", {foe});
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<CardDestroyed>(events[0]), (CardDestroyed{foe, DestroyReason::Effect}));
    EXPECT_EQ(std::get<CardSentToGraveyard>(events[1]), (CardSentToGraveyard{foe, ZoneKind::Board, Seat::Away}));

    GameState const after = Evolve(s, events);
    EXPECT_TRUE(after.Of(Seat::Away).board.empty());
    EXPECT_EQ(after.Of(Seat::Away).graveyard, (CardIds{foe}));
}

TEST(Operations, DestroyAllSpellsTrapsSparesSource)
{
    GameState s = MakeState();
    CardId const mine = AddSetCard(s, Seat::Host, "fire_drill");
    CardId const theirs = AddSetCard(s, Seat::Away, "hall_pass_revoked");

    EventList const events = run(s, Destroy{DestroyTarget::AllSpellsTraps}, mine);
    ASSERT_EQ(CountOf<CardDestroyed>(events), 1u);
    EXPECT_EQ(std::get<CardDestroyed>(events[0]).card_id, theirs);
}

TEST(Operations, DestroyAllSpellsTrapsKeepsActivatingSideIntact)
{
    GameState s = MakeState();
    CardId const source = AddSetCard(s, Seat::Host, "fire_drill");
    CardId const own_set = AddSetCard(s, Seat::Host, "hall_pass_revoked");
    CardId const own_field = NewId(s, Seat::Host, "cafeteria");
    s.Of(Seat::Host).field_spell = SpellTrapCard{.card_id = own_field, .definition_id = "cafeteria",
                                                 .face_down = false, .activated = true, .is_field_spell = true};
    CardId const their_set = AddSetCard(s, Seat::Away, "hall_pass_revoked");
    CardId const their_field = NewId(s, Seat::Away, "cafeteria");
    s.Of(Seat::Away).field_spell = SpellTrapCard{.card_id = their_field, .definition_id = "cafeteria",
                                                 .face_down = false, .activated = true, .is_field_spell = true};

    EventList const events = run(s, Destroy{DestroyTarget::AllSpellsTraps}, source);
    ASSERT_EQ(CountOf<CardDestroyed>(events), 2u);
    EXPECT_EQ(std::get<CardDestroyed>(events[0]).card_id, their_set);
    EXPECT_EQ(std::get<CardDestroyed>(events[2]).card_id, their_field);

    GameState const after = Evolve(s, events);
    EXPECT_EQ(after.Of(Seat::Host).spell_trap_zone.size(), 2u);
    EXPECT_EQ(after.Of(Seat::Host).spell_trap_zone[1].card_id, own_set);
    ASSERT_TRUE(after.Of(Seat::Host).field_spell.has_value());
    EXPECT_EQ(after.Of(Seat::Host).field_spell->card_id, own_field);
    EXPECT_TRUE(after.Of(Seat::Away).spell_trap_zone.empty());
    EXPECT_FALSE(after.Of(Seat::Away).field_spell.has_value());
    EXPECT_EQ(after.Of(Seat::Away).graveyard, (CardIds{their_set, their_field}));
}

TEST(Operations, BoostTargetPrecedence)
{
    GameState s = MakeState();
    CardId const a = AddMonster(s, Seat::Host, "hall_monitor");
    CardId const b = AddMonster(s, Seat::Host, "varsity_captain");
    BoostAttack const boost{LiteralAmount{500}, BoostDuration::Turn};

    // explicit targets win
    EventList const explicit_t = run(s, boost, "src", {b});
    ASSERT_EQ(explicit_t.size(), 1u);
    EXPECT_EQ(std::get<ModifierApplied>(explicit_t[0]).card_id, b);

    // then the source, when it is on a board
    EventList const self = run(s, boost, a);
    ASSERT_EQ(self.size(), 1u);
    EXPECT_EQ(std::get<ModifierApplied>(self[0]).card_id, a);

    // otherwise every own monster
    EventList const all = run(s, boost, "spell-in-zone");
    ASSERT_EQ(all.size(), 2u);

    GameState const after = Evolve(s, all);
    EXPECT_EQ(query::EffectiveAttack(after, *Board(after, Seat::Host, a)), 1700);
    EXPECT_EQ(query::EffectiveAttack(after, *Board(after, Seat::Host, b)), 2300);
}

TEST(Operations, TurnBoostExpiresAtNextTurnStart)
{
    GameState s = MakeState();
    CardId const a = AddMonster(s, Seat::Host, "hall_monitor");

    GameState boosted = Evolve(s, run(s, BoostDefense{LiteralAmount{300}, BoostDuration::Turn}, a));
    EXPECT_EQ(query::EffectiveDefense(boosted, *Board(boosted, Seat::Host, a)), 1300);
    ASSERT_EQ(boosted.temporary_modifiers.size(), 1u);
    EXPECT_EQ(boosted.temporary_modifiers[0].expires_on_turn, s.turn_number + 1);

    GameState const next = Evolve(boosted, {TurnStarted{Seat::Away, s.turn_number + 1}});
    EXPECT_TRUE(next.temporary_modifiers.empty());
    EXPECT_EQ(query::EffectiveDefense(next, *Board(next, Seat::Host, a)), 1000);

    GameState const permanent = Evolve(s, run(s, BoostAttack{LiteralAmount{100}, BoostDuration::Permanent}, a));
    GameState const later = Evolve(permanent, {TurnStarted{Seat::Away, 9}});
    EXPECT_EQ(query::EffectiveAttack(later, *Board(later, Seat::Host, a)), 1300);
}

TEST(Operations, GraveyardAndMirrorAmounts)
{
    GameState s = MakeState();
    AddToGraveyard(s, Seat::Host, "hall_monitor");
    AddToGraveyard(s, Seat::Away, "hall_monitor");
    AddToGraveyard(s, Seat::Away, "cram_session");
    CardId const foe = AddMonster(s, Seat::Away, "varsity_captain");

    EXPECT_EQ(ResolveAmount(s, GraveyardCount{Owner::Self, 100}, Seat::Host, {}), 100);
    EXPECT_EQ(ResolveAmount(s, GraveyardCount{Owner::Opponent, 100}, Seat::Host, {}), 200);
    EXPECT_EQ(ResolveAmount(s, GraveyardCount{Owner::Any, 1}, Seat::Host, {}), 3);

    std::vector<CardId> const targets{foe};
    EXPECT_EQ(ResolveAmount(s, MirrorAmount{}, Seat::Host, targets), 1800);
    EXPECT_EQ(ResolveAmount(s, MirrorAmount{}, Seat::Host, {}), 0);
}

TEST(Operations, NegateSkipsSourceAndNegatedLinks)
{
    GameState s = MakeState();
    s.current_chain = {
        ChainLink{.card_id = "first", .activating_seat = Seat::Host},
        ChainLink{.card_id = "second", .activating_seat = Seat::Away},
        ChainLink{.card_id = "negator", .activating_seat = Seat::Host},
    };
    s.current_priority_player = Seat::Away;

    EventList const events = run(s, Negate{}, "negator");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<ChainLinkNegated>(events[0]).index, 1u);

    s.negated_links = {1};
    EventList const again = run(s, Negate{}, "negator");
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(std::get<ChainLinkNegated>(again[0]).index, 0u);

    EXPECT_TRUE(run(MakeState(), Negate{}, "negator").empty());
}

TEST(Operations, ZoneMovesSkipDecksAndMissingCards)
{
    GameState s = MakeState();
    CardId const grave = AddToGraveyard(s, Seat::Away, "hall_monitor");
    CardId const decked = AddToDeck(s, Seat::Away, "hall_monitor");

    EventList const back = run(s, ReturnToHand{}, "src", {grave, decked, "nowhere"});
    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(std::get<CardReturnedToHand>(back[0]), (CardReturnedToHand{grave, ZoneKind::Graveyard, Seat::Away}));

    EventList const gone = run(s, Banish{}, "src", {grave, decked});
    ASSERT_EQ(gone.size(), 1u);
    GameState const after = Evolve(s, gone);
    EXPECT_EQ(after.Of(Seat::Away).banished, (CardIds{grave}));
    EXPECT_TRUE(after.Of(Seat::Away).graveyard.empty());
}

TEST(Operations, SpecialSummonRequiresNamedZone)
{
    GameState s = MakeState();
    CardId const in_hand = AddToHand(s, Seat::Host, "hall_monitor");
    CardId const in_grave = AddToGraveyard(s, Seat::Host, "varsity_captain");
    CardId const spell = AddToGraveyard(s, Seat::Host, "cram_session");

    EXPECT_EQ(run(s, SpecialSummon{ZoneKind::Graveyard}, "src", {in_hand}).size(), 0u);
    EXPECT_EQ(run(s, SpecialSummon{ZoneKind::Graveyard}, "src", {spell}).size(), 0u);

    EventList const events = run(s, SpecialSummon{ZoneKind::Graveyard}, "src", {in_grave});
    ASSERT_EQ(events.size(), 1u);
    GameState const after = Evolve(s, events);
    ASSERT_NE(Board(after, Seat::Host, in_grave), nullptr);
    EXPECT_EQ(Board(after, Seat::Host, in_grave)->position, Position::Attack);
    EXPECT_TRUE(after.Of(Seat::Host).graveyard == (CardIds{spell}));
}

TEST(Operations, ViceCountersRunPerTarget)
{
    GameState s = MakeState();
    CardId const foe = AddMonster(s, Seat::Away, "hall_monitor");

    EventList const added = run(s, AddVice{2}, "src", {foe, foe});
    ASSERT_EQ(added.size(), 2u);
    EXPECT_EQ(std::get<ViceCounterAdded>(added[0]).new_count, 2u);
    EXPECT_EQ(std::get<ViceCounterAdded>(added[1]).new_count, 4u);

    GameState const after = Evolve(s, added);
    EXPECT_EQ(Board(after, Seat::Away, foe)->vice_counters, 4u);

    EventList const removed = run(after, RemoveVice{10}, "src", {foe});
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(std::get<ViceCounterRemoved>(removed[0]).new_count, 0u);
}

TEST(Operations, RestrictionsAndCostModifiers)
{
    GameState s = MakeState();
    EventList const r = run(s, ApplyRestriction{Restriction::DisableAttacks, SeatScope::Both, 2});
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(std::get<TurnRestrictionApplied>(r[0]).expires_on_turn, s.turn_number + 2);

    GameState const restricted = Evolve(s, r);
    EXPECT_TRUE(query::HasRestriction(restricted, Seat::Away, Restriction::DisableAttacks));

    EventList const c = run(s, ModifyCost{CostCardType::Spell, CostOperation::Add, 200, SeatScope::Opponent, 1});
    GameState const taxed = Evolve(s, c);
    EXPECT_EQ(query::AdjustedLpCost(taxed, Seat::Away, CardType::Spell, 500), 700);
    EXPECT_EQ(query::AdjustedLpCost(taxed, Seat::Away, CardType::Trap, 500), 500);
    EXPECT_EQ(query::AdjustedLpCost(taxed, Seat::Host, CardType::Spell, 500), 500);
}

TEST(Operations, TopOfDeckViewAndRearrange)
{
    GameState s = MakeState();
    CardId const a = AddToDeck(s, Seat::Host, "hall_monitor");
    CardId const b = AddToDeck(s, Seat::Host, "varsity_captain");
    CardId const c = AddToDeck(s, Seat::Host, "prom_tyrant");

    GameState const viewed = Evolve(s, run(s, ViewTopCards{2}));
    ASSERT_TRUE(viewed.Of(Seat::Host).top_deck_view.has_value());
    EXPECT_EQ(viewed.Of(Seat::Host).top_deck_view->card_ids, (CardIds{a, b}));

    GameState const swapped = Evolve(s, run(s, RearrangeTopCards{2, RearrangeStrategy::Reverse}));
    EXPECT_EQ(swapped.Of(Seat::Host).deck, (CardIds{b, a, c}));
}

TEST(Operations, EffectFoldsBetweenActions)
{
    GameState s = MakeState();
    CardId const drawn = AddToDeck(s, Seat::Host, "hall_monitor");
    CardId const foe_card = AddToHand(s, Seat::Away, "cram_session");

    EffectDefinition const eff{
        .id = "eff_0",
        .actions = {Draw{1}, Discard{1}, Damage{GraveyardCount{Owner::Opponent, 100}}},
    };
    EventList const events = ExecuteEffect(s, eff, Seat::Host, "src", {});
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(std::get<CardDrawn>(events[0]).card_id, drawn);
    EXPECT_EQ(std::get<CardSentToGraveyard>(events[1]).card_id, foe_card);
    // the discard has already landed when the damage is computed
    EXPECT_EQ(std::get<DamageDealt>(events[2]).amount, 100);
}
