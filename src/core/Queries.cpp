//
// Queries.cpp
//

#include "Queries.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <iterator>
#include <ranges>

namespace ltcg::core::query
{
    namespace
    {
        constexpr std::array<Seat, 2> kSeatOrder{Seat::Host, Seat::Away};

        auto IndexIn(CardIds const& ids, std::string_view id) -> std::optional<std::size_t>
        {
            auto const it = std::ranges::find(ids, id);
            if (it == ids.end())
            {
                return std::nullopt;
            }
            return static_cast<std::size_t>(std::distance(ids.begin(), it));
        }

        auto OwnersFor(Seat const seat, Owner const owner) -> std::vector<Seat>
        {
            switch (owner)
            {
            case Owner::Self: return {seat};
            case Owner::Opponent: return {Opponent(seat)};
            case Owner::Any: return {Seat::Host, Seat::Away};
            }
            return {};
        }

        auto TypeMatches(GameState const& s, std::string_view id, std::optional<CardType> const want) -> bool
        {
            if (!want)
            {
                return true;
            }
            CardDefinition const* def = DefinitionOf(s, id);
            return def != nullptr && def->type == *want;
        }
    }

    auto DefinitionOf(GameState const& s, std::string_view card_id) -> CardDefinition const*
    {
        if (!s.registry)
        {
            return nullptr;
        }
        auto const it = s.instance_to_definition.find(std::string{card_id});
        if (it != s.instance_to_definition.end())
        {
            return s.registry->Find(it->second);
        }
        return s.registry->Find(card_id);
    }

    auto DefinitionIdOf(GameState const& s, std::string_view card_id) -> DefinitionId
    {
        auto const it = s.instance_to_definition.find(std::string{card_id});
        return it != s.instance_to_definition.end() ? it->second : DefinitionId{card_id};
    }

    auto FindBoardCard(GameState const& s, Seat const seat, std::string_view card_id) -> BoardCard const*
    {
        auto const& board = s.Of(seat).board;
        auto const it = std::ranges::find(board, card_id, &BoardCard::card_id);
        return it != board.end() ? &*it : nullptr;
    }

    auto FindSpellTrap(GameState const& s, Seat const seat, std::string_view card_id) -> SpellTrapCard const*
    {
        auto const& zone = s.Of(seat).spell_trap_zone;
        auto const it = std::ranges::find(zone, card_id, &SpellTrapCard::card_id);
        return it != zone.end() ? &*it : nullptr;
    }

    auto FindOnAnyBoard(GameState const& s, std::string_view card_id) -> std::optional<Location>
    {
        for (Seat const seat : kSeatOrder)
        {
            auto const& board = s.Of(seat).board;
            auto const it = std::ranges::find(board, card_id, &BoardCard::card_id);
            if (it != board.end())
            {
                return Location{seat, ZoneKind::Board, static_cast<std::size_t>(std::distance(board.begin(), it))};
            }
        }
        return std::nullopt;
    }

    auto Locate(GameState const& s, std::string_view card_id, bool const include_deck) -> std::optional<Location>
    {
        for (Seat const seat : kSeatOrder)
        {
            SeatState const& ss = s.Of(seat);
            if (auto i = IndexIn(ss.hand, card_id)) return Location{seat, ZoneKind::Hand, *i};
            if (auto i = IndexIn(ss.graveyard, card_id)) return Location{seat, ZoneKind::Graveyard, *i};
            if (auto i = IndexIn(ss.banished, card_id)) return Location{seat, ZoneKind::Banished, *i};

            auto const b = std::ranges::find(ss.board, card_id, &BoardCard::card_id);
            if (b != ss.board.end())
            {
                return Location{seat, ZoneKind::Board, static_cast<std::size_t>(std::distance(ss.board.begin(), b))};
            }
            auto const z = std::ranges::find(ss.spell_trap_zone, card_id, &SpellTrapCard::card_id);
            if (z != ss.spell_trap_zone.end())
            {
                return Location{seat, ZoneKind::SpellTrapZone,
                                static_cast<std::size_t>(std::distance(ss.spell_trap_zone.begin(), z))};
            }
            if (ss.field_spell && ss.field_spell->card_id == card_id)
            {
                return Location{seat, ZoneKind::Field, 0};
            }
            if (include_deck)
            {
                if (auto i = IndexIn(ss.deck, card_id)) return Location{seat, ZoneKind::Deck, *i};
            }
        }
        return std::nullopt;
    }

    auto InHand(GameState const& s, Seat const seat, std::string_view card_id) -> bool
    {
        return IndexIn(s.Of(seat).hand, card_id).has_value();
    }

    auto EffectiveAttack(GameState const& s, BoardCard const& c) -> std::int32_t
    {
        CardDefinition const* def = DefinitionOf(s, c.definition_id);
        std::int32_t const base = def ? def->attack : 0;
        return base + c.temporary_boosts.attack;
    }

    auto EffectiveDefense(GameState const& s, BoardCard const& c) -> std::int32_t
    {
        CardDefinition const* def = DefinitionOf(s, c.definition_id);
        std::int32_t const base = def ? def->defense : 0;
        return base + c.temporary_boosts.defense;
    }

    auto HasRestriction(GameState const& s, Seat const seat, Restriction const r) -> bool
    {
        return std::ranges::any_of(s.turn_restrictions, [&](TurnRestriction const& t)
        {
            return t.seat == seat && t.restriction == r && t.expires_on_turn > s.turn_number;
        });
    }

    auto FaceUpMonsterCount(GameState const& s, Seat const seat) -> std::size_t
    {
        return static_cast<std::size_t>(
            std::ranges::count_if(s.Of(seat).board, [](BoardCard const& c) { return !c.face_down; }));
    }

    auto OptKey(std::string_view card_id, EffectDefinition const& eff) -> std::string
    {
        return std::format("{}|{}", card_id, eff.id);
    }

    auto HoptKey(GameState const& s, std::string_view card_id, EffectDefinition const& eff) -> std::string
    {
        return std::format("{}|{}", DefinitionIdOf(s, card_id), eff.id);
    }

    auto EffectUsable(GameState const& s, std::string_view card_id, EffectDefinition const& eff) -> bool
    {
        if (eff.once_per_turn && std::ranges::contains(s.opt_used_this_turn, OptKey(card_id, eff)))
        {
            return false;
        }
        if (eff.hard_once_per_turn && std::ranges::contains(s.hopt_used_effects, HoptKey(s, card_id, eff)))
        {
            return false;
        }
        return true;
    }

    auto TargetCandidates(GameState const& s, Seat const seat, TargetFilter const& filter) -> CardIds
    {
        CardIds out;
        ZoneKind zone = filter.zone.value_or(ZoneKind::Board);
        if (!filter.zone && (filter.card_type == CardType::Spell || filter.card_type == CardType::Trap))
        {
            zone = ZoneKind::SpellTrapZone;
        }

        for (Seat const owner : OwnersFor(seat, filter.owner))
        {
            SeatState const& ss = s.Of(owner);
            switch (zone)
            {
            case ZoneKind::Board:
                for (BoardCard const& c : ss.board)
                {
                    if (!c.face_down && TypeMatches(s, c.card_id, filter.card_type))
                    {
                        out.push_back(c.card_id);
                    }
                }
                break;
            case ZoneKind::SpellTrapZone:
            case ZoneKind::Field:
                for (SpellTrapCard const& c : ss.spell_trap_zone)
                {
                    if (TypeMatches(s, c.card_id, filter.card_type))
                    {
                        out.push_back(c.card_id);
                    }
                }
                if (ss.field_spell && TypeMatches(s, ss.field_spell->card_id, filter.card_type))
                {
                    out.push_back(ss.field_spell->card_id);
                }
                break;
            case ZoneKind::Hand:
                std::ranges::copy_if(ss.hand, std::back_inserter(out),
                                     [&](CardId const& id) { return TypeMatches(s, id, filter.card_type); });
                break;
            case ZoneKind::Graveyard:
                std::ranges::copy_if(ss.graveyard, std::back_inserter(out),
                                     [&](CardId const& id) { return TypeMatches(s, id, filter.card_type); });
                break;
            case ZoneKind::Banished:
                std::ranges::copy_if(ss.banished, std::back_inserter(out),
                                     [&](CardId const& id) { return TypeMatches(s, id, filter.card_type); });
                break;
            case ZoneKind::Deck:
                break;
            }
        }
        return out;
    }

    auto TargetsSatisfy(GameState const& s, Seat const seat, EffectDefinition const& eff,
                        std::span<CardId const> targets) -> bool
    {
        std::size_t const required = eff.target_count.value_or(0);
        if (targets.size() != required)
        {
            return false;
        }
        if (required == 0)
        {
            return true;
        }

        // targets must follow candidate order, which also rules out repeats
        CardIds const candidates = TargetCandidates(s, seat, eff.target_filter.value_or(TargetFilter{}));
        auto from = candidates.begin();
        for (CardId const& t : targets)
        {
            from = std::ranges::find(from, candidates.end(), t);
            if (from == candidates.end())
            {
                return false;
            }
            ++from;
        }
        return true;
    }

    auto Combinations(CardIds const& candidates, std::size_t const count) -> std::vector<CardIds>
    {
        std::vector<CardIds> out;
        if (count == 0)
        {
            out.emplace_back();
            return out;
        }
        if (count > candidates.size())
        {
            return out;
        }

        std::vector<std::size_t> idx(count);
        for (std::size_t i{}; i < count; ++i)
        {
            idx[i] = i;
        }

        for (;;)
        {
            CardIds pick;
            pick.reserve(count);
            for (std::size_t const i : idx)
            {
                pick.push_back(candidates[i]);
            }
            out.push_back(std::move(pick));

            // advance the rightmost index that still has room
            std::size_t k = count;
            while (k > 0 && idx[k - 1] == candidates.size() - count + (k - 1))
            {
                --k;
            }
            if (k == 0)
            {
                break;
            }
            ++idx[k - 1];
            for (std::size_t j{k}; j < count; ++j)
            {
                idx[j] = idx[j - 1] + 1;
            }
        }
        return out;
    }

    auto AdjustedLpCost(GameState const& s, Seat const seat, CardType const type, std::int32_t base) -> std::int32_t
    {
        std::int32_t cost = base;
        for (CostModifier const& m : s.cost_modifiers)
        {
            if (m.seat != seat || m.expires_on_turn <= s.turn_number)
            {
                continue;
            }
            bool const applies = m.card_type == CostCardType::All ||
                (m.card_type == CostCardType::Spell && type == CardType::Spell) ||
                (m.card_type == CostCardType::Trap && type == CardType::Trap);
            if (!applies)
            {
                continue;
            }
            switch (m.operation)
            {
            case CostOperation::Set: cost = m.amount; break;
            case CostOperation::Add: cost += m.amount; break;
            case CostOperation::Multiply: cost *= m.amount; break;
            }
        }
        return std::max(cost, 0);
    }

    auto CanPayCost(GameState const& s, Seat const seat, std::string_view card_id,
                    CostDefinition const& cost) -> bool
    {
        SeatState const& ss = s.Of(seat);
        switch (cost.type)
        {
        case CostType::PayLp:
        {
            CardDefinition const* def = DefinitionOf(s, card_id);
            CardType const type = def ? def->type : CardType::Monster;
            return ss.life_points > AdjustedLpCost(s, seat, type, cost.amount);
        }
        case CostType::Discard:
        {
            auto const others = std::ranges::count_if(ss.hand, [&](CardId const& id) { return id != card_id; });
            return static_cast<std::size_t>(others) >= cost.count;
        }
        case CostType::Tribute:
        {
            auto const others = std::ranges::count_if(ss.board, [&](BoardCard const& c)
            {
                return c.card_id != card_id && !c.face_down;
            });
            return static_cast<std::size_t>(others) >= cost.count;
        }
        case CostType::RemoveVice:
        {
            BoardCard const* src = FindBoardCard(s, seat, card_id);
            return src != nullptr && src->vice_counters >= cost.count;
        }
        case CostType::Banish:
            return ss.graveyard.size() >= cost.count;
        }
        return false;
    }
} // namespace ltcg::core::query
