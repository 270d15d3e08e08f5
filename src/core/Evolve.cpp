//
// Evolve.cpp
//

#include "Evolve.hpp"

#include <algorithm>
#include <ranges>
#include <type_traits>

#include "Queries.hpp"

namespace ltcg::core
{
    namespace
    {
        auto EraseId(CardIds& ids, std::string_view id) -> bool
        {
            auto const it = std::ranges::find(ids, id);
            if (it == ids.end())
            {
                return false;
            }
            ids.erase(it);
            return true;
        }

        auto MutableBoardCard(GameState& s, std::string_view id) -> BoardCard*
        {
            for (SeatState& ss : s.seats)
            {
                auto const it = std::ranges::find(ss.board, id, &BoardCard::card_id);
                if (it != ss.board.end())
                {
                    return &*it;
                }
            }
            return nullptr;
        }

        auto MutableSpellTrap(GameState& s, std::string_view id) -> SpellTrapCard*
        {
            for (SeatState& ss : s.seats)
            {
                auto const it = std::ranges::find(ss.spell_trap_zone, id, &SpellTrapCard::card_id);
                if (it != ss.spell_trap_zone.end())
                {
                    return &*it;
                }
                if (ss.field_spell && ss.field_spell->card_id == id)
                {
                    return &*ss.field_spell;
                }
            }
            return nullptr;
        }

        auto AddBoost(BoardCard& c, StatField const field, std::int32_t const amount) -> void
        {
            if (field == StatField::Attack)
            {
                c.temporary_boosts.attack += amount;
            }
            else
            {
                c.temporary_boosts.defense += amount;
            }
        }

        auto ExpiresOn(std::uint32_t const turn, Expiry const e) -> std::optional<std::uint32_t>
        {
            switch (e)
            {
            case Expiry::EndOfTurn: return turn + 1;
            case Expiry::EndOfNextTurn: return turn + 2;
            case Expiry::Permanent: return std::nullopt;
            }
            return std::nullopt;
        }

        // Reverses and drops every modifier matching pred.
        template <typename Pred>
        auto DropModifiers(GameState& s, Pred pred) -> void
        {
            for (TemporaryModifier const& m : s.temporary_modifiers)
            {
                if (!pred(m))
                {
                    continue;
                }
                if (BoardCard* c = MutableBoardCard(s, m.card_id))
                {
                    AddBoost(*c, m.field, -m.amount);
                }
            }
            std::erase_if(s.temporary_modifiers, pred);
        }

        // Takes a card out of whichever zone holds it. A monster leaving the board takes its
        // modifiers and lingering boosts with it; its equips stay behind until EQUIP_DESTROYED.
        auto Detach(GameState& s, std::string_view id) -> void
        {
            for (SeatState& ss : s.seats)
            {
                if (EraseId(ss.hand, id) || EraseId(ss.graveyard, id) || EraseId(ss.banished, id) ||
                    EraseId(ss.deck, id))
                {
                    return;
                }

                auto const b = std::ranges::find(ss.board, id, &BoardCard::card_id);
                if (b != ss.board.end())
                {
                    ss.board.erase(b);
                    std::erase_if(s.temporary_modifiers, [&](TemporaryModifier const& m) { return m.card_id == id; });
                    std::erase_if(s.lingering_effects, [&](LingeringEffect const& l) { return l.target == id; });
                    return;
                }

                auto const z = std::ranges::find(ss.spell_trap_zone, id, &SpellTrapCard::card_id);
                if (z != ss.spell_trap_zone.end())
                {
                    ss.spell_trap_zone.erase(z);
                    for (SeatState& other : s.seats)
                    {
                        for (BoardCard& c : other.board)
                        {
                            EraseId(c.equipped_cards, id);
                        }
                    }
                    return;
                }

                if (ss.field_spell && ss.field_spell->card_id == id)
                {
                    ss.field_spell.reset();
                    return;
                }
            }
        }

        auto EndGame(GameState& s, Seat const winner, WinReason const reason) -> void
        {
            if (s.game_over)
            {
                return;
            }
            s.game_over = true;
            s.winner = winner;
            s.win_reason = reason;
        }

        auto NewBoardCard(GameState const& s, CardId const& id, Position const pos, bool const face_down) -> BoardCard
        {
            return BoardCard{
                .card_id = id,
                .definition_id = query::DefinitionIdOf(s, id),
                .position = pos,
                .face_down = face_down,
                .turn_summoned = s.turn_number,
            };
        }
    }

    auto ApplyEvent(GameState& s, Event const& e) -> void
    {
        std::visit(
            [&]<typename T0>(T0 const& ev)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, GameStarted> || std::is_same_v<T, TurnEnded> ||
                    std::is_same_v<T, BattleResolved> || std::is_same_v<T, CardDestroyed> ||
                    std::is_same_v<T, CostPaid>)
                {
                    // informational
                }
                else if constexpr (std::is_same_v<T, GameEnded>)
                {
                    EndGame(s, ev.winner, ev.reason);
                }
                else if constexpr (std::is_same_v<T, TurnStarted>)
                {
                    s.current_turn_player = ev.seat;
                    s.turn_number = ev.turn_number;
                    s.current_phase = Phase::Draw;
                    for (SeatState& ss : s.seats)
                    {
                        ss.normal_summoned_this_turn = false;
                        if (ss.top_deck_view && ss.top_deck_view->viewed_at_turn + 1 < s.turn_number)
                        {
                            ss.top_deck_view.reset();
                        }
                    }
                    s.opt_used_this_turn.clear();

                    DropModifiers(s, [&](TemporaryModifier const& m)
                    {
                        return m.expires_on_turn && *m.expires_on_turn <= s.turn_number;
                    });
                    std::erase_if(s.cost_modifiers, [&](CostModifier const& m)
                    {
                        return m.expires_on_turn <= s.turn_number;
                    });
                    std::erase_if(s.turn_restrictions, [&](TurnRestriction const& r)
                    {
                        return r.expires_on_turn <= s.turn_number;
                    });

                    for (BoardCard& c : s.Of(ev.seat).board)
                    {
                        c.can_attack = true;
                        c.has_attacked_this_turn = false;
                        c.changed_position_this_turn = false;
                    }
                }
                else if constexpr (std::is_same_v<T, PhaseChanged>)
                {
                    s.current_phase = ev.to;
                }
                else if constexpr (std::is_same_v<T, CardDrawn>)
                {
                    SeatState& ss = s.Of(ev.seat);
                    if (EraseId(ss.deck, ev.card_id))
                    {
                        ss.hand.push_back(ev.card_id);
                    }
                }
                else if constexpr (std::is_same_v<T, DeckOut>)
                {
                    EndGame(s, Opponent(ev.seat), WinReason::DeckOut);
                }
                else if constexpr (std::is_same_v<T, MonsterSummoned>)
                {
                    SeatState& ss = s.Of(ev.seat);
                    if (EraseId(ss.hand, ev.card_id))
                    {
                        ss.board.push_back(NewBoardCard(s, ev.card_id, ev.position, false));
                        ss.normal_summoned_this_turn = true;
                    }
                }
                else if constexpr (std::is_same_v<T, MonsterSet>)
                {
                    SeatState& ss = s.Of(ev.seat);
                    if (EraseId(ss.hand, ev.card_id))
                    {
                        ss.board.push_back(NewBoardCard(s, ev.card_id, Position::Defense, true));
                        ss.normal_summoned_this_turn = true;
                    }
                }
                else if constexpr (std::is_same_v<T, FlipSummoned>)
                {
                    if (BoardCard* c = MutableBoardCard(s, ev.card_id))
                    {
                        c->face_down = false;
                        c->position = ev.position;
                        c->changed_position_this_turn = true;
                    }
                }
                else if constexpr (std::is_same_v<T, SpecialSummoned>)
                {
                    Detach(s, ev.card_id);
                    s.Of(ev.seat).board.push_back(NewBoardCard(s, ev.card_id, ev.position, false));
                }
                else if constexpr (std::is_same_v<T, SpellTrapSet>)
                {
                    SeatState& ss = s.Of(ev.seat);
                    if (EraseId(ss.hand, ev.card_id))
                    {
                        ss.spell_trap_zone.push_back(SpellTrapCard{
                            .card_id = ev.card_id,
                            .definition_id = query::DefinitionIdOf(s, ev.card_id),
                        });
                    }
                }
                else if constexpr (std::is_same_v<T, SpellActivated> || std::is_same_v<T, TrapActivated>)
                {
                    SeatState& ss = s.Of(ev.seat);
                    if (EraseId(ss.hand, ev.card_id))
                    {
                        CardDefinition const* def = query::DefinitionOf(s, ev.card_id);
                        SpellTrapCard card{
                            .card_id = ev.card_id,
                            .definition_id = query::DefinitionIdOf(s, ev.card_id),
                            .face_down = false,
                            .activated = true,
                            .is_field_spell = def != nullptr && IsFieldSpell(*def),
                        };
                        if (card.is_field_spell)
                        {
                            ss.field_spell = std::move(card);
                        }
                        else
                        {
                            ss.spell_trap_zone.push_back(std::move(card));
                        }
                    }
                    else if (SpellTrapCard* c = MutableSpellTrap(s, ev.card_id))
                    {
                        c->face_down = false;
                        c->activated = true;
                    }
                }
                else if constexpr (std::is_same_v<T, EffectActivated>)
                {
                    CardDefinition const* def = query::DefinitionOf(s, ev.card_id);
                    if (def == nullptr || ev.effect_index >= def->effects.size())
                    {
                        return;
                    }
                    EffectDefinition const& eff = def->effects[ev.effect_index];
                    if (eff.once_per_turn)
                    {
                        s.opt_used_this_turn.push_back(query::OptKey(ev.card_id, eff));
                    }
                    if (eff.hard_once_per_turn)
                    {
                        s.hopt_used_effects.push_back(query::HoptKey(s, ev.card_id, eff));
                    }
                }
                else if constexpr (std::is_same_v<T, AttackDeclared>)
                {
                    if (BoardCard* a = MutableBoardCard(s, ev.attacker_id))
                    {
                        a->has_attacked_this_turn = true;
                    }
                    if (!ev.target_id.empty())
                    {
                        if (BoardCard* t = MutableBoardCard(s, ev.target_id))
                        {
                            t->face_down = false;
                        }
                    }
                }
                else if constexpr (std::is_same_v<T, DamageDealt>)
                {
                    SeatState& ss = s.Of(ev.seat);
                    ss.life_points = std::max(0, ss.life_points - ev.amount);
                }
                else if constexpr (std::is_same_v<T, CardBanished>)
                {
                    Detach(s, ev.card_id);
                    s.Of(ev.owner).banished.push_back(ev.card_id);
                }
                else if constexpr (std::is_same_v<T, CardReturnedToHand>)
                {
                    Detach(s, ev.card_id);
                    s.Of(ev.owner).hand.push_back(ev.card_id);
                }
                else if constexpr (std::is_same_v<T, CardSentToGraveyard>)
                {
                    Detach(s, ev.card_id);
                    s.Of(ev.owner).graveyard.push_back(ev.card_id);
                }
                else if constexpr (std::is_same_v<T, ViceCounterAdded> || std::is_same_v<T, ViceCounterRemoved>)
                {
                    if (BoardCard* c = MutableBoardCard(s, ev.card_id))
                    {
                        c->vice_counters = ev.new_count;
                    }
                }
                else if constexpr (std::is_same_v<T, BreakdownTriggered>)
                {
                    Seat const credited = Opponent(ev.seat);
                    SeatState& ss = s.Of(credited);
                    ++ss.breakdowns_caused;
                    if (ss.breakdowns_caused >= s.config.max_breakdowns_to_win)
                    {
                        EndGame(s, credited, WinReason::Breakdown);
                    }
                }
                else if constexpr (std::is_same_v<T, PositionChanged>)
                {
                    if (BoardCard* c = MutableBoardCard(s, ev.card_id))
                    {
                        c->position = ev.to;
                        c->changed_position_this_turn = true;
                    }
                }
                else if constexpr (std::is_same_v<T, ModifierApplied>)
                {
                    if (BoardCard* c = MutableBoardCard(s, ev.card_id))
                    {
                        AddBoost(*c, ev.field, ev.amount);
                        s.temporary_modifiers.push_back(TemporaryModifier{
                            .card_id = ev.card_id,
                            .field = ev.field,
                            .amount = ev.amount,
                            .expires = ev.expires,
                            .source = ev.source,
                            .expires_on_turn = ExpiresOn(s.turn_number, ev.expires),
                        });
                    }
                }
                else if constexpr (std::is_same_v<T, ModifierExpired>)
                {
                    DropModifiers(s, [&](TemporaryModifier const& m)
                    {
                        return m.card_id == ev.card_id && m.source == ev.source;
                    });
                }
                else if constexpr (std::is_same_v<T, ChainStarted>)
                {
                    s.negated_links.clear();
                }
                else if constexpr (std::is_same_v<T, ChainLinkAdded>)
                {
                    s.current_chain.push_back(ChainLink{
                        .card_id = ev.card_id,
                        .effect_index = ev.effect_index,
                        .activating_seat = ev.seat,
                        .targets = ev.targets,
                    });
                    s.current_priority_player = Opponent(ev.seat);
                    s.current_chain_passer.reset();
                }
                else if constexpr (std::is_same_v<T, ChainLinkNegated>)
                {
                    if (!std::ranges::contains(s.negated_links, ev.index))
                    {
                        s.negated_links.push_back(ev.index);
                    }
                }
                else if constexpr (std::is_same_v<T, ChainLinkResolved>)
                {
                    if (!s.current_chain.empty())
                    {
                        s.current_chain.pop_back();
                    }
                    std::erase(s.negated_links, ev.index);
                    s.current_chain_passer.reset();
                    if (s.current_chain.empty())
                    {
                        s.current_priority_player.reset();
                    }
                    else
                    {
                        s.current_priority_player = s.current_turn_player;
                    }
                }
                else if constexpr (std::is_same_v<T, ChainPassed>)
                {
                    s.current_chain_passer = ev.seat;
                    s.current_priority_player = Opponent(ev.seat);
                }
                else if constexpr (std::is_same_v<T, ChainResolved>)
                {
                    s.current_chain.clear();
                    s.negated_links.clear();
                    s.current_priority_player.reset();
                    s.current_chain_passer.reset();
                }
                else if constexpr (std::is_same_v<T, CostModifierApplied>)
                {
                    s.cost_modifiers.push_back(CostModifier{
                        .seat = ev.seat,
                        .card_type = ev.card_type,
                        .operation = ev.operation,
                        .amount = ev.amount,
                        .source = ev.source,
                        .expires_on_turn = ev.expires_on_turn,
                    });
                }
                else if constexpr (std::is_same_v<T, TurnRestrictionApplied>)
                {
                    s.turn_restrictions.push_back(TurnRestriction{
                        .seat = ev.seat,
                        .restriction = ev.restriction,
                        .source = ev.source,
                        .expires_on_turn = ev.expires_on_turn,
                    });
                }
                else if constexpr (std::is_same_v<T, TopCardsViewed>)
                {
                    s.Of(ev.seat).top_deck_view = TopDeckView{
                        .card_ids = ev.card_ids,
                        .source = ev.source,
                        .viewed_at_turn = s.turn_number,
                    };
                }
                else if constexpr (std::is_same_v<T, TopCardsRearranged>)
                {
                    CardIds& deck = s.Of(ev.seat).deck;
                    for (std::size_t i{}; i < ev.card_ids.size() && i < deck.size(); ++i)
                    {
                        deck[i] = ev.card_ids[i];
                    }
                }
                else if constexpr (std::is_same_v<T, SpellEquipped>)
                {
                    if (BoardCard* c = MutableBoardCard(s, ev.target_id))
                    {
                        c->equipped_cards.push_back(ev.card_id);
                    }
                }
                else if constexpr (std::is_same_v<T, RitualSummoned>)
                {
                    SeatState& ss = s.Of(ev.seat);
                    if (EraseId(ss.hand, ev.card_id))
                    {
                        ss.board.push_back(NewBoardCard(s, ev.card_id, Position::Attack, false));
                    }
                }
                else if constexpr (std::is_same_v<T, EquipDestroyed>)
                {
                    Detach(s, ev.card_id);
                    s.Of(ev.owner).graveyard.push_back(ev.card_id);
                }
                else if constexpr (std::is_same_v<T, ContinuousEffectApplied>)
                {
                    if (BoardCard* c = MutableBoardCard(s, ev.target))
                    {
                        AddBoost(*c, ev.field, ev.amount);
                        s.lingering_effects.push_back(LingeringEffect{
                            .source = ev.source,
                            .source_seat = ev.source_seat,
                            .target = ev.target,
                            .field = ev.field,
                            .amount = ev.amount,
                        });
                    }
                }
                else if constexpr (std::is_same_v<T, ContinuousEffectRemoved>)
                {
                    if (BoardCard* c = MutableBoardCard(s, ev.target))
                    {
                        AddBoost(*c, ev.field, -ev.amount);
                    }
                    std::erase_if(s.lingering_effects, [&](LingeringEffect const& l)
                    {
                        return l.source == ev.source && l.target == ev.target && l.field == ev.field;
                    });
                }
                else
                {
                    static_assert([]{ return false; }(), "Event without a fold case");
                }
            },
            e);
    }

    auto Evolve(GameState const& s, EventList const& events) -> GameState
    {
        GameState next = s;
        for (Event const& e : events)
        {
            ApplyEvent(next, e);
        }
        return next;
    }
} // namespace ltcg::core
