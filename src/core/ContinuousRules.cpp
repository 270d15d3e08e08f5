//
// ContinuousRules.cpp
//

#include "RuleModules.hpp"

#include <algorithm>
#include <array>

#include "Operations.hpp"
#include "Queries.hpp"

namespace ltcg::core::rules
{
    namespace
    {
        // Monsters a continuous effect of `source` holds a boost on.
        auto LingeringTargets(GameState const& s, Seat const seat, CardId const& source, CardDefinition const& def,
                              EffectDefinition const& eff) -> CardIds
        {
            CardIds out;
            if (IsEquipSpell(def))
            {
                for (SeatState const& ss : s.seats)
                {
                    for (BoardCard const& c : ss.board)
                    {
                        if (std::ranges::contains(c.equipped_cards, source))
                        {
                            out.push_back(c.card_id);
                        }
                    }
                }
                return out;
            }
            if (eff.target_filter)
            {
                for (CardId const& id : query::TargetCandidates(s, seat, *eff.target_filter))
                {
                    if (query::FindOnAnyBoard(s, id))
                    {
                        out.push_back(id);
                    }
                }
                return out;
            }
            for (BoardCard const& c : s.Of(seat).board)
            {
                if (!c.face_down)
                {
                    out.push_back(c.card_id);
                }
            }
            return out;
        }

        auto Accumulate(std::vector<LingeringEffect>& out, LingeringEffect entry) -> void
        {
            auto const it = std::ranges::find_if(out, [&](LingeringEffect const& l)
            {
                return l.source == entry.source && l.target == entry.target && l.field == entry.field;
            });
            if (it != out.end())
            {
                it->amount += entry.amount;
                return;
            }
            out.push_back(std::move(entry));
        }

        auto CollectFrom(GameState const& s, Seat const seat, CardId const& source,
                         std::vector<LingeringEffect>& out) -> void
        {
            CardDefinition const* def = query::DefinitionOf(s, source);
            if (def == nullptr)
            {
                return;
            }
            for (EffectDefinition const& eff : def->effects)
            {
                if (eff.type != EffectType::Continuous)
                {
                    continue;
                }
                CardIds const targets = LingeringTargets(s, seat, source, *def, eff);
                for (EffectAction const& action : eff.actions)
                {
                    std::optional<StatField> field;
                    Amount const* amount = nullptr;
                    if (auto const* a = std::get_if<BoostAttack>(&action))
                    {
                        field = StatField::Attack;
                        amount = &a->amount;
                    }
                    else if (auto const* d = std::get_if<BoostDefense>(&action))
                    {
                        field = StatField::Defense;
                        amount = &d->amount;
                    }
                    if (!field)
                    {
                        continue;
                    }
                    std::int32_t const value = ResolveAmount(s, *amount, seat, {});
                    for (CardId const& target : targets)
                    {
                        Accumulate(out, LingeringEffect{source, seat, target, *field, value});
                    }
                }
            }
            std::erase_if(out, [](LingeringEffect const& l) { return l.amount == 0; });
        }
    }

    auto DesiredLingering(GameState const& s) -> std::vector<LingeringEffect>
    {
        std::vector<LingeringEffect> out;
        for (Seat const seat : std::array{Seat::Host, Seat::Away})
        {
            SeatState const& ss = s.Of(seat);
            for (SpellTrapCard const& c : ss.spell_trap_zone)
            {
                if (!c.face_down)
                {
                    CollectFrom(s, seat, c.card_id, out);
                }
            }
            if (ss.field_spell && !ss.field_spell->face_down)
            {
                CollectFrom(s, seat, ss.field_spell->card_id, out);
            }
            for (BoardCard const& c : ss.board)
            {
                if (!c.face_down)
                {
                    CollectFrom(s, seat, c.card_id, out);
                }
            }
        }
        return out;
    }

    auto ContinuousEvents(GameState const& s) -> EventList
    {
        std::vector<LingeringEffect> const desired = DesiredLingering(s);

        EventList out;
        for (LingeringEffect const& l : s.lingering_effects)
        {
            if (!std::ranges::contains(desired, l))
            {
                out.emplace_back(ContinuousEffectRemoved{l.source, l.target, l.field, l.amount});
            }
        }
        for (LingeringEffect const& l : desired)
        {
            if (!std::ranges::contains(s.lingering_effects, l))
            {
                out.emplace_back(ContinuousEffectApplied{l.source, l.source_seat, l.target, l.field, l.amount});
            }
        }
        return out;
    }

    auto OrphanedEquipEvents(GameState const& s) -> EventList
    {
        EventList out;
        for (Seat const seat : std::array{Seat::Host, Seat::Away})
        {
            for (SpellTrapCard const& c : s.Of(seat).spell_trap_zone)
            {
                CardDefinition const* def = query::DefinitionOf(s, c.card_id);
                if (c.face_down || def == nullptr || !IsEquipSpell(*def))
                {
                    continue;
                }
                bool const carried = std::ranges::any_of(s.seats, [&](SeatState const& ss)
                {
                    return std::ranges::any_of(ss.board, [&](BoardCard const& b)
                    {
                        return std::ranges::contains(b.equipped_cards, c.card_id);
                    });
                });
                if (!carried)
                {
                    out.emplace_back(EquipDestroyed{c.card_id, seat});
                }
            }
        }
        return out;
    }
} // namespace ltcg::core::rules
