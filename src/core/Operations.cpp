//
// Operations.cpp
//

#include "Operations.hpp"

#include <algorithm>
#include <map>
#include <ranges>
#include <type_traits>

#include "Evolve.hpp"
#include "Queries.hpp"

namespace ltcg::core
{
    namespace
    {
        auto SeatsFor(Seat const activating, SeatScope const scope) -> std::vector<Seat>
        {
            switch (scope)
            {
            case SeatScope::Self: return {activating};
            case SeatScope::Opponent: return {Opponent(activating)};
            case SeatScope::Both: return {Seat::Host, Seat::Away};
            }
            return {};
        }

        auto ToExpiry(BoostDuration const d) -> Expiry
        {
            return d == BoostDuration::Turn ? Expiry::EndOfTurn : Expiry::Permanent;
        }

        // Explicit targets on a board, else the source if it is on a board, else every
        // monster of the activating seat.
        auto MonsterTargets(GameState const& s, Seat const activating, CardId const& source,
                            std::span<CardId const> targets) -> CardIds
        {
            CardIds out;
            if (!targets.empty())
            {
                for (CardId const& t : targets)
                {
                    if (query::FindOnAnyBoard(s, t))
                    {
                        out.push_back(t);
                    }
                }
                return out;
            }
            if (query::FindOnAnyBoard(s, source))
            {
                out.push_back(source);
                return out;
            }
            for (BoardCard const& c : s.Of(activating).board)
            {
                out.push_back(c.card_id);
            }
            return out;
        }

        auto BoardCardAt(GameState const& s, query::Location const& loc) -> BoardCard const&
        {
            return s.Of(loc.seat).board[loc.index];
        }

        auto DestroyEvents(EventList& out, CardId const& id, ZoneKind const from, Seat const owner) -> void
        {
            out.emplace_back(CardDestroyed{id, DestroyReason::Effect});
            out.emplace_back(CardSentToGraveyard{id, from, owner});
        }

        auto Boost(GameState const& s, StatField const field, Amount const& amount, BoostDuration const duration,
                   Seat const activating, CardId const& source, std::span<CardId const> targets) -> EventList
        {
            EventList out;
            std::int32_t const value = ResolveAmount(s, amount, activating, targets);
            for (CardId const& id : MonsterTargets(s, activating, source, targets))
            {
                out.emplace_back(ModifierApplied{id, field, value, source, ToExpiry(duration)});
            }
            return out;
        }
    }

    auto ResolveAmount(GameState const& s, Amount const& amount, Seat const activating,
                       std::span<CardId const> targets) -> std::int32_t
    {
        return std::visit(
            [&]<typename T0>(T0 const& a) -> std::int32_t
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, LiteralAmount>)
                {
                    return a.value;
                }
                else if constexpr (std::is_same_v<T, GraveyardCount>)
                {
                    std::size_t n{};
                    if (a.scope != Owner::Opponent) n += s.Of(activating).graveyard.size();
                    if (a.scope != Owner::Self) n += s.Of(Opponent(activating)).graveyard.size();
                    return static_cast<std::int32_t>(n) * a.multiplier;
                }
                else if constexpr (std::is_same_v<T, MirrorAmount>)
                {
                    if (targets.empty())
                    {
                        return 0;
                    }
                    auto const loc = query::FindOnAnyBoard(s, targets.front());
                    return loc ? query::EffectiveAttack(s, BoardCardAt(s, *loc)) : 0;
                }
                else
                {
                    static_assert([]{ return false; }(), "Amount source without a resolver");
                }
            },
            amount);
    }

    auto ExecuteAction(GameState const& s, EffectAction const& action, Seat const activating,
                       CardId const& source, std::span<CardId const> targets) -> EventList
    {
        Seat const opponent = Opponent(activating);

        return std::visit(
            [&]<typename T0>(T0 const& a) -> EventList
            {
                using T = std::decay_t<T0>;
                EventList out;

                if constexpr (std::is_same_v<T, BoostAttack>)
                {
                    return Boost(s, StatField::Attack, a.amount, a.duration, activating, source, targets);
                }
                else if constexpr (std::is_same_v<T, BoostDefense>)
                {
                    return Boost(s, StatField::Defense, a.amount, a.duration, activating, source, targets);
                }
                else if constexpr (std::is_same_v<T, Damage>)
                {
                    std::int32_t const value = ResolveAmount(s, a.amount, activating, targets);
                    out.emplace_back(DamageDealt{opponent, value, false});
                }
                else if constexpr (std::is_same_v<T, Heal>)
                {
                    std::int32_t const value = ResolveAmount(s, a.amount, activating, targets);
                    out.emplace_back(DamageDealt{activating, -value, false});
                }
                else if constexpr (std::is_same_v<T, Draw>)
                {
                    CardIds const& deck = s.Of(activating).deck;
                    std::size_t const n = std::min<std::size_t>(a.count, deck.size());
                    for (std::size_t i{}; i < n; ++i)
                    {
                        out.emplace_back(CardDrawn{activating, deck[i]});
                    }
                }
                else if constexpr (std::is_same_v<T, Discard>)
                {
                    CardIds const& hand = s.Of(opponent).hand;
                    std::size_t const n = std::min<std::size_t>(a.count, hand.size());
                    for (std::size_t i{}; i < n; ++i)
                    {
                        out.emplace_back(CardSentToGraveyard{hand[hand.size() - 1 - i], ZoneKind::Hand, opponent});
                    }
                }
                else if constexpr (std::is_same_v<T, Destroy>)
                {
                    switch (a.target)
                    {
                    case DestroyTarget::Selected:
                        for (CardId const& t : targets)
                        {
                            auto const loc = query::Locate(s, t);
                            if (loc && (loc->zone == ZoneKind::Board || loc->zone == ZoneKind::SpellTrapZone ||
                                loc->zone == ZoneKind::Field))
                            {
                                DestroyEvents(out, t, loc->zone, loc->seat);
                            }
                        }
                        break;
                    case DestroyTarget::AllOpponentMonsters:
                        for (BoardCard const& c : s.Of(opponent).board)
                        {
                            DestroyEvents(out, c.card_id, ZoneKind::Board, opponent);
                        }
                        break;
                    case DestroyTarget::AllSpellsTraps:
                    {
                        // Opponent's zone and field only; the activating side is never swept.
                        SeatState const& ss = s.Of(opponent);
                        for (SpellTrapCard const& c : ss.spell_trap_zone)
                        {
                            if (c.card_id != source)
                            {
                                DestroyEvents(out, c.card_id, ZoneKind::SpellTrapZone, opponent);
                            }
                        }
                        if (ss.field_spell && ss.field_spell->card_id != source)
                        {
                            DestroyEvents(out, ss.field_spell->card_id, ZoneKind::Field, opponent);
                        }
                        break;
                    }
                    }
                }
                else if constexpr (std::is_same_v<T, Negate>)
                {
                    for (std::size_t i = s.current_chain.size(); i-- > 0;)
                    {
                        auto const index = static_cast<std::uint32_t>(i);
                        if (s.current_chain[i].card_id == source || std::ranges::contains(s.negated_links, index))
                        {
                            continue;
                        }
                        out.emplace_back(ChainLinkNegated{index});
                        break;
                    }
                }
                else if constexpr (std::is_same_v<T, ReturnToHand>)
                {
                    for (CardId const& t : targets)
                    {
                        auto const loc = query::Locate(s, t);
                        if (loc && loc->zone != ZoneKind::Hand)
                        {
                            out.emplace_back(CardReturnedToHand{t, loc->zone, loc->seat});
                        }
                    }
                }
                else if constexpr (std::is_same_v<T, Banish>)
                {
                    for (CardId const& t : targets)
                    {
                        auto const loc = query::Locate(s, t);
                        if (loc && loc->zone != ZoneKind::Banished)
                        {
                            out.emplace_back(CardBanished{t, loc->zone, loc->seat});
                        }
                    }
                }
                else if constexpr (std::is_same_v<T, SpecialSummon>)
                {
                    std::size_t room = s.config.max_board_slots > s.Of(activating).board.size()
                        ? s.config.max_board_slots - s.Of(activating).board.size()
                        : 0;
                    for (CardId const& t : targets)
                    {
                        if (room == 0)
                        {
                            break;
                        }
                        auto const loc = query::Locate(s, t, a.from == ZoneKind::Deck);
                        CardDefinition const* def = query::DefinitionOf(s, t);
                        if (!loc || loc->seat != activating || loc->zone != a.from || def == nullptr ||
                            def->type != CardType::Monster)
                        {
                            continue;
                        }
                        out.emplace_back(SpecialSummoned{activating, t, a.from, Position::Attack});
                        --room;
                    }
                }
                else if constexpr (std::is_same_v<T, ChangePosition>)
                {
                    for (CardId const& id : MonsterTargets(s, activating, source, targets))
                    {
                        auto const loc = query::FindOnAnyBoard(s, id);
                        BoardCard const& c = BoardCardAt(s, *loc);
                        if (c.face_down)
                        {
                            continue;
                        }
                        Position const to = c.position == Position::Attack ? Position::Defense : Position::Attack;
                        out.emplace_back(PositionChanged{id, c.position, to});
                    }
                }
                else if constexpr (std::is_same_v<T, AddVice> || std::is_same_v<T, RemoveVice>)
                {
                    std::map<CardId, std::uint32_t> running;
                    for (CardId const& t : targets)
                    {
                        auto const loc = query::FindOnAnyBoard(s, t);
                        if (!loc)
                        {
                            continue;
                        }
                        auto const it = running.try_emplace(t, BoardCardAt(s, *loc).vice_counters).first;
                        if constexpr (std::is_same_v<T, AddVice>)
                        {
                            it->second += a.count;
                            out.emplace_back(ViceCounterAdded{t, it->second});
                        }
                        else
                        {
                            it->second = it->second > a.count ? it->second - a.count : 0;
                            out.emplace_back(ViceCounterRemoved{t, it->second});
                        }
                    }
                }
                else if constexpr (std::is_same_v<T, ApplyRestriction>)
                {
                    std::uint32_t const expires = s.turn_number + std::max<std::uint32_t>(1, a.duration_turns);
                    for (Seat const seat : SeatsFor(activating, a.target))
                    {
                        out.emplace_back(TurnRestrictionApplied{seat, a.restriction, source, expires});
                    }
                }
                else if constexpr (std::is_same_v<T, ModifyCost>)
                {
                    std::uint32_t const expires = s.turn_number + std::max<std::uint32_t>(1, a.duration_turns);
                    for (Seat const seat : SeatsFor(activating, a.target))
                    {
                        out.emplace_back(CostModifierApplied{seat, a.card_type, a.operation, a.amount, source, expires});
                    }
                }
                else if constexpr (std::is_same_v<T, ViewTopCards>)
                {
                    CardIds const& deck = s.Of(activating).deck;
                    std::size_t const n = std::min<std::size_t>(a.count, deck.size());
                    out.emplace_back(TopCardsViewed{activating, CardIds(deck.begin(), deck.begin() + n), source});
                }
                else if constexpr (std::is_same_v<T, RearrangeTopCards>)
                {
                    CardIds const& deck = s.Of(activating).deck;
                    std::size_t const n = std::min<std::size_t>(a.count, deck.size());
                    CardIds top(deck.begin(), deck.begin() + n);
                    if (a.strategy == RearrangeStrategy::Reverse)
                    {
                        std::ranges::reverse(top);
                    }
                    out.emplace_back(TopCardsRearranged{activating, std::move(top), source});
                }
                else
                {
                    static_assert([]{ return false; }(), "EffectAction without an interpreter case");
                }
                return out;
            },
            action);
    }

    auto ExecuteEffect(GameState const& s, EffectDefinition const& effect, Seat const activating,
                       CardId const& source, std::span<CardId const> targets) -> EventList
    {
        EventList out;
        GameState current = s;
        for (EffectAction const& action : effect.actions)
        {
            // stat boosts of continuous effects live in the lingering layer
            bool const lingering = std::holds_alternative<BoostAttack>(action) ||
                std::holds_alternative<BoostDefense>(action);
            if (effect.type == EffectType::Continuous && lingering)
            {
                continue;
            }
            EventList const step = ExecuteAction(current, action, activating, source, targets);
            if (step.empty())
            {
                continue;
            }
            current = Evolve(current, step);
            out.insert(out.end(), step.begin(), step.end());
        }
        return out;
    }
} // namespace ltcg::core
