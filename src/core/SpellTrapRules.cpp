//
// SpellTrapRules.cpp
//

#include "RuleModules.hpp"

#include <algorithm>
#include <ranges>

#include "Evolve.hpp"
#include "Operations.hpp"
#include "Queries.hpp"

namespace
{
    inline auto Viol(ltcg::core::error::RuleViolationCode code) -> ltcg::core::error::RuleViolation
    {
        return ltcg::core::error::RuleViolation{.code = code};
    }
}

namespace ltcg::core::rules
{
    using RVC = error::RuleViolationCode;

    namespace
    {
        auto Append(EventList& out, EventList more) -> void
        {
            out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
        }

        auto OwnFaceUpMonster(GameState const& s, Seat const seat, CardId const& id) -> bool
        {
            BoardCard const* c = query::FindBoardCard(s, seat, id);
            return c != nullptr && !c->face_down;
        }

        // Where a spell/trap of `seat` currently sits on the field, if anywhere.
        auto FieldZoneOf(GameState const& s, Seat const seat, CardId const& id) -> std::optional<ZoneKind>
        {
            if (query::FindSpellTrap(s, seat, id) != nullptr)
            {
                return ZoneKind::SpellTrapZone;
            }
            auto const& field = s.Of(seat).field_spell;
            if (field && field->card_id == id)
            {
                return ZoneKind::Field;
            }
            return std::nullopt;
        }

        // Only zero-point damage reports; folding them leaves the state as it was.
        auto Inert(EventList const& events) -> bool
        {
            return std::ranges::all_of(events, [](Event const& e)
            {
                auto const* dmg = std::get_if<DamageDealt>(&e);
                return dmg != nullptr && dmg->amount == 0;
            });
        }
    }

    auto ActivationCount(CardDefinition const& def) -> std::uint32_t
    {
        if (IsRitualSpell(def) || def.effects.empty())
        {
            return 1;
        }
        return static_cast<std::uint32_t>(def.effects.size());
    }

    auto ActivationEffect(CardDefinition const& def, std::uint32_t const effect_index) -> EffectDefinition const*
    {
        return effect_index < def.effects.size() ? &def.effects[effect_index] : nullptr;
    }

    auto CheckRitualTargets(GameState const& s, Seat const seat, std::span<CardId const> targets) -> ValidateResult
    {
        if (targets.empty() || !query::InHand(s, seat, targets.front()))
            return std::unexpected(Viol(RVC::Ritual_MonsterInvalid).with_actor(seat));

        CardDefinition const* monster = query::DefinitionOf(s, targets.front());
        if (monster == nullptr || monster->type != CardType::Monster)
            return std::unexpected(Viol(RVC::Ritual_MonsterInvalid).with_card(targets.front()));

        std::span<CardId const> const tributes = targets.subspan(1);
        if (tributes.empty())
            return std::unexpected(Viol(RVC::Ritual_TributesInvalid).with_expected(1).with_attempted(0));

        // tributes are listed in board order, which also rules out repeats
        std::vector<BoardCard> const& board = s.Of(seat).board;
        auto from = board.begin();
        std::uint32_t levels{};
        for (CardId const& t : tributes)
        {
            from = std::ranges::find(from, board.end(), t, &BoardCard::card_id);
            if (from == board.end() || from->face_down)
                return std::unexpected(Viol(RVC::Ritual_TributesInvalid).with_card(t).with_actor(seat));

            CardDefinition const* def = query::DefinitionOf(s, t);
            levels += def != nullptr ? def->level : 0;
            ++from;
        }

        if (levels < monster->level)
            return std::unexpected(Viol(RVC::Ritual_LevelTooLow).with_card(targets.front())
                                   .with_expected(monster->level).with_attempted(levels));
        return {};
    }

    auto ActivationTargetsOk(GameState const& s, Seat const seat, CardDefinition const& def,
                             std::uint32_t const effect_index, std::span<CardId const> targets) -> bool
    {
        if (IsRitualSpell(def))
        {
            return CheckRitualTargets(s, seat, targets).has_value();
        }
        if (IsEquipSpell(def))
        {
            return targets.size() == 1 && OwnFaceUpMonster(s, seat, targets.front());
        }
        if (EffectDefinition const* eff = ActivationEffect(def, effect_index))
        {
            return query::TargetsSatisfy(s, seat, *eff, targets);
        }
        return targets.empty();
    }

    auto EffectTargetChoices(GameState const& s, Seat const seat, EffectDefinition const& eff) -> std::vector<CardIds>
    {
        CardIds const candidates = query::TargetCandidates(s, seat, eff.target_filter.value_or(TargetFilter{}));
        return query::Combinations(candidates, eff.target_count.value_or(0));
    }

    auto RitualTargetChoices(GameState const& s, Seat const seat) -> std::vector<CardIds>
    {
        SeatState const& ss = s.Of(seat);
        std::vector<BoardCard const*> tributes;
        for (BoardCard const& c : ss.board)
        {
            if (!c.face_down)
            {
                tributes.push_back(&c);
            }
        }

        std::vector<CardIds> out;
        for (CardId const& id : ss.hand)
        {
            CardDefinition const* monster = query::DefinitionOf(s, id);
            if (monster == nullptr || monster->type != CardType::Monster)
            {
                continue;
            }
            // every non-empty subset of face-up monsters, kept in board order
            for (std::size_t mask = 1; mask < (std::size_t{1} << tributes.size()); ++mask)
            {
                CardIds pick{id};
                std::uint32_t levels{};
                for (std::size_t i{}; i < tributes.size(); ++i)
                {
                    if (mask & (std::size_t{1} << i))
                    {
                        pick.push_back(tributes[i]->card_id);
                        CardDefinition const* def = query::DefinitionOf(s, tributes[i]->card_id);
                        levels += def != nullptr ? def->level : 0;
                    }
                }
                if (levels >= monster->level)
                {
                    out.push_back(std::move(pick));
                }
            }
        }
        return out;
    }

    auto ActivationTargetChoices(GameState const& s, Seat const seat, CardDefinition const& def,
                                 std::uint32_t const effect_index) -> std::vector<CardIds>
    {
        if (IsRitualSpell(def))
        {
            return RitualTargetChoices(s, seat);
        }
        if (IsEquipSpell(def))
        {
            std::vector<CardIds> out;
            for (BoardCard const& c : s.Of(seat).board)
            {
                if (!c.face_down)
                {
                    out.push_back({c.card_id});
                }
            }
            return out;
        }
        if (EffectDefinition const* eff = ActivationEffect(def, effect_index))
        {
            return EffectTargetChoices(s, seat, *eff);
        }
        return {CardIds{}};
    }

    auto ResolveCardEffect(GameState const& s, Seat const seat, CardId const& card_id, std::uint32_t const effect_index,
                           std::span<CardId const> targets, bool const negated) -> EventList
    {
        CardDefinition const* def = query::DefinitionOf(s, card_id);
        LTCG_ASSERT(def != nullptr, std::format("Resolving unknown card '{}'", card_id));

        EventList out;
        if (IsEquipSpell(*def) && !targets.empty() && query::FindOnAnyBoard(s, targets.front()))
        {
            out.emplace_back(SpellEquipped{seat, card_id, targets.front()});
        }
        if (!negated && effect_index < def->effects.size())
        {
            GameState const now = Evolve(s, out);
            Append(out, ExecuteEffect(now, def->effects[effect_index], seat, card_id, targets));
        }

        if (!StaysOnField(*def))
        {
            GameState const after = Evolve(s, out);
            if (auto const zone = FieldZoneOf(after, seat, card_id))
            {
                out.emplace_back(CardSentToGraveyard{card_id, *zone, seat});
            }
        }
        return out;
    }

    auto ChainActivation(GameState const& s, Seat const seat, CardId const& card_id, std::uint32_t const effect_index,
                         CardIds const& targets) -> EventList
    {
        CardDefinition const* def = query::DefinitionOf(s, card_id);
        LTCG_ASSERT(def != nullptr, std::format("Chaining unknown card '{}'", card_id));

        EventList out;
        if (!s.ChainOpen())
        {
            out.emplace_back(ChainStarted{});
        }
        out.emplace_back(ChainLinkAdded{card_id, seat, effect_index, targets});
        if (def->type == CardType::Trap)
        {
            out.emplace_back(TrapActivated{seat, card_id, targets});
        }
        else
        {
            out.emplace_back(SpellActivated{seat, card_id, targets});
        }
        return out;
    }

    auto CostEvents(GameState const& s, Seat const seat, CardId const& card_id, CostDefinition const& cost) -> EventList
    {
        SeatState const& ss = s.Of(seat);
        EventList out;
        switch (cost.type)
        {
        case CostType::PayLp:
        {
            CardDefinition const* def = query::DefinitionOf(s, card_id);
            std::int32_t const lp = query::AdjustedLpCost(s, seat, def ? def->type : CardType::Monster, cost.amount);
            out.emplace_back(CostPaid{seat, card_id, cost.type, lp});
            out.emplace_back(DamageDealt{seat, lp, false});
            break;
        }
        case CostType::Discard:
        {
            out.emplace_back(CostPaid{seat, card_id, cost.type, static_cast<std::int32_t>(cost.count)});
            std::uint32_t left = cost.count;
            for (CardId const& id : ss.hand | std::views::reverse)
            {
                if (left == 0)
                    break;
                if (id == card_id)
                    continue;
                out.emplace_back(CardSentToGraveyard{id, ZoneKind::Hand, seat});
                --left;
            }
            break;
        }
        case CostType::Tribute:
        {
            out.emplace_back(CostPaid{seat, card_id, cost.type, static_cast<std::int32_t>(cost.count)});
            std::uint32_t left = cost.count;
            for (BoardCard const& c : ss.board)
            {
                if (left == 0)
                    break;
                if (c.card_id == card_id || c.face_down)
                    continue;
                out.emplace_back(CardSentToGraveyard{c.card_id, ZoneKind::Board, seat});
                --left;
            }
            break;
        }
        case CostType::RemoveVice:
        {
            out.emplace_back(CostPaid{seat, card_id, cost.type, static_cast<std::int32_t>(cost.count)});
            if (BoardCard const* src = query::FindBoardCard(s, seat, card_id))
            {
                std::uint32_t const left = src->vice_counters > cost.count ? src->vice_counters - cost.count : 0;
                out.emplace_back(ViceCounterRemoved{card_id, left});
            }
            break;
        }
        case CostType::Banish:
        {
            out.emplace_back(CostPaid{seat, card_id, cost.type, static_cast<std::int32_t>(cost.count)});
            std::size_t const n = std::min<std::size_t>(cost.count, ss.graveyard.size());
            for (std::size_t i{}; i < n; ++i)
            {
                out.emplace_back(CardBanished{ss.graveyard[i], ZoneKind::Graveyard, seat});
            }
            break;
        }
        }
        return out;
    }

    auto CheckSetSpellTrap(GameState const& s, Seat const seat, SetSpellTrapCmd const& c) -> ValidateResult
    {
        if (!IsMainPhase(s.current_phase))
            return std::unexpected(Viol(RVC::WrongPhase_MainRequired).with_phase(s.current_phase).with_actor(seat));

        if (!query::InHand(s, seat, c.card_id))
            return std::unexpected(Viol(RVC::Card_NotInHand).with_card(c.card_id).with_actor(seat));

        CardDefinition const* def = query::DefinitionOf(s, c.card_id);
        if (def == nullptr)
            return std::unexpected(Viol(RVC::Card_UnknownDefinition).with_card(c.card_id));

        if (def->type == CardType::Monster || IsFieldSpell(*def))
            return std::unexpected(Viol(RVC::Card_WrongType).with_card(c.card_id));

        if (s.Of(seat).spell_trap_zone.size() >= s.config.max_spell_trap_slots)
            return std::unexpected(Viol(RVC::Zone_SpellTrapFull).with_actor(seat).with_capacity(s.config.max_spell_trap_slots));

        return {};
    }

    auto EmitSetSpellTrap(GameState const&, Seat const seat, SetSpellTrapCmd const& c) -> EventList
    {
        return {SpellTrapSet{seat, c.card_id}};
    }

    auto CheckActivateSpell(GameState const& s, Seat const seat, ActivateSpellCmd const& c) -> ValidateResult
    {
        CardDefinition const* def = query::DefinitionOf(s, c.card_id);
        bool const in_hand = query::InHand(s, seat, c.card_id);
        SpellTrapCard const* set = query::FindSpellTrap(s, seat, c.card_id);

        if (!in_hand && set == nullptr)
            return std::unexpected(Viol(RVC::Card_NotInHand).with_card(c.card_id).with_actor(seat));

        if (def == nullptr)
            return std::unexpected(Viol(RVC::Card_UnknownDefinition).with_card(c.card_id));

        if (def->type != CardType::Spell)
            return std::unexpected(Viol(RVC::Card_WrongType).with_card(c.card_id));

        if (in_hand)
        {
            if (seat != s.current_turn_player)
                return std::unexpected(Viol(RVC::Activate_HandOnlyOnOwnTurn).with_actor(seat).with_turn_player(s.current_turn_player));

            if (!IsMainPhase(s.current_phase))
                return std::unexpected(Viol(RVC::WrongPhase_MainRequired).with_phase(s.current_phase).with_actor(seat));

            if (!IsFieldSpell(*def) && s.Of(seat).spell_trap_zone.size() >= s.config.max_spell_trap_slots)
                return std::unexpected(Viol(RVC::Zone_SpellTrapFull).with_actor(seat).with_capacity(s.config.max_spell_trap_slots));
        }
        else
        {
            if (!set->face_down)
                return std::unexpected(Viol(RVC::Activate_FaceDownRequired).with_card(c.card_id));

            if (!IsQuickPlay(*def))
            {
                if (seat != s.current_turn_player)
                    return std::unexpected(Viol(RVC::WrongActor_TurnPlayerRequired).with_actor(seat).with_turn_player(s.current_turn_player));

                if (!IsMainPhase(s.current_phase))
                    return std::unexpected(Viol(RVC::WrongPhase_MainRequired).with_phase(s.current_phase).with_actor(seat));
            }
        }

        if (c.effect_index >= ActivationCount(*def))
            return std::unexpected(Viol(RVC::Activate_NoSuchEffect).with_card(c.card_id)
                                   .with_attempted(c.effect_index).with_capacity(ActivationCount(*def)));

        if (IsRitualSpell(*def))
            return CheckRitualTargets(s, seat, c.targets);

        if (!ActivationTargetsOk(s, seat, *def, c.effect_index, c.targets))
            return std::unexpected(Viol(RVC::Activate_TargetsInvalid).with_card(c.card_id));

        return {};
    }

    auto EmitActivateSpell(GameState const& s, Seat const seat, ActivateSpellCmd const& c) -> EventList
    {
        CardDefinition const& def = *query::DefinitionOf(s, c.card_id);
        bool const in_hand = query::InHand(s, seat, c.card_id);

        // a set quick-play opens (or joins) a chain instead of resolving on the spot
        if (!in_hand && IsQuickPlay(def))
        {
            return ChainActivation(s, seat, c.card_id, c.effect_index, c.targets);
        }

        EventList out;
        if (IsRitualSpell(def))
        {
            CardIds const tributes(c.targets.begin() + 1, c.targets.end());
            out.emplace_back(SpellActivated{seat, c.card_id, c.targets});
            for (CardId const& t : tributes)
            {
                out.emplace_back(CardDestroyed{t, DestroyReason::Effect});
                out.emplace_back(CardSentToGraveyard{t, ZoneKind::Board, seat});
            }
            out.emplace_back(RitualSummoned{seat, c.targets.front(), c.card_id, tributes});

            GameState const after = Evolve(s, out);
            if (auto const zone = FieldZoneOf(after, seat, c.card_id))
            {
                out.emplace_back(CardSentToGraveyard{c.card_id, *zone, seat});
            }
            return out;
        }

        auto const& old_field = s.Of(seat).field_spell;
        if (IsFieldSpell(def) && old_field)
        {
            out.emplace_back(CardSentToGraveyard{old_field->card_id, ZoneKind::Field, seat});
        }
        out.emplace_back(SpellActivated{seat, c.card_id, c.targets});

        GameState const now = Evolve(s, out);
        Append(out, ResolveCardEffect(now, seat, c.card_id, c.effect_index, c.targets, false));
        return out;
    }

    auto CheckActivateTrap(GameState const& s, Seat const seat, ActivateTrapCmd const& c) -> ValidateResult
    {
        SpellTrapCard const* set = query::FindSpellTrap(s, seat, c.card_id);
        if (set == nullptr)
            return std::unexpected(Viol(RVC::Card_NotInSpellTrapZone).with_card(c.card_id).with_actor(seat));

        CardDefinition const* def = query::DefinitionOf(s, c.card_id);
        if (def == nullptr)
            return std::unexpected(Viol(RVC::Card_UnknownDefinition).with_card(c.card_id));

        if (def->type != CardType::Trap)
            return std::unexpected(Viol(RVC::Card_WrongType).with_card(c.card_id));

        if (!set->face_down)
            return std::unexpected(Viol(RVC::Activate_FaceDownRequired).with_card(c.card_id));

        if (c.effect_index >= ActivationCount(*def))
            return std::unexpected(Viol(RVC::Activate_NoSuchEffect).with_card(c.card_id)
                                   .with_attempted(c.effect_index).with_capacity(ActivationCount(*def)));

        if (!ActivationTargetsOk(s, seat, *def, c.effect_index, c.targets))
            return std::unexpected(Viol(RVC::Activate_TargetsInvalid).with_card(c.card_id));

        return {};
    }

    auto EmitActivateTrap(GameState const& s, Seat const seat, ActivateTrapCmd const& c) -> EventList
    {
        return ChainActivation(s, seat, c.card_id, c.effect_index, c.targets);
    }

    auto CheckActivateEffect(GameState const& s, Seat const seat, ActivateEffectCmd const& c) -> ValidateResult
    {
        if (!IsMainPhase(s.current_phase))
            return std::unexpected(Viol(RVC::WrongPhase_MainRequired).with_phase(s.current_phase).with_actor(seat));

        BoardCard const* card = query::FindBoardCard(s, seat, c.card_id);
        if (card == nullptr || card->face_down)
            return std::unexpected(Viol(RVC::Card_NotOnBoard).with_card(c.card_id).with_actor(seat));

        CardDefinition const* def = query::DefinitionOf(s, c.card_id);
        if (def == nullptr)
            return std::unexpected(Viol(RVC::Card_UnknownDefinition).with_card(c.card_id));

        if (c.effect_index >= def->effects.size())
            return std::unexpected(Viol(RVC::Activate_NoSuchEffect).with_card(c.card_id)
                                   .with_attempted(c.effect_index)
                                   .with_capacity(static_cast<std::uint32_t>(def->effects.size())));

        EffectDefinition const& eff = def->effects[c.effect_index];
        if (eff.type != EffectType::Ignition)
            return std::unexpected(Viol(RVC::Activate_WrongEffectType).with_card(c.card_id));

        if (!query::EffectUsable(s, c.card_id, eff))
            return std::unexpected(Viol(RVC::Activate_OncePerTurnUsed).with_card(c.card_id));

        if (eff.cost && !query::CanPayCost(s, seat, c.card_id, *eff.cost))
            return std::unexpected(Viol(RVC::Activate_CostUnpayable).with_card(c.card_id));

        if (!query::TargetsSatisfy(s, seat, eff, c.targets))
            return std::unexpected(Viol(RVC::Activate_TargetsInvalid)
                                   .with_card(c.card_id)
                                   .with_expected(eff.target_count.value_or(0))
                                   .with_attempted(static_cast<std::uint32_t>(c.targets.size())));

        // an unlimited effect that would change nothing is not offered
        bool const tracked = eff.once_per_turn || eff.hard_once_per_turn || eff.cost;
        if (!tracked && Inert(ExecuteEffect(s, eff, seat, c.card_id, c.targets)))
            return std::unexpected(Viol(RVC::Activate_NoValidTargets).with_card(c.card_id));

        return {};
    }

    auto EmitActivateEffect(GameState const& s, Seat const seat, ActivateEffectCmd const& c) -> EventList
    {
        EffectDefinition const& eff = query::DefinitionOf(s, c.card_id)->effects[c.effect_index];

        EventList out;
        if (eff.cost)
        {
            out = CostEvents(s, seat, c.card_id, *eff.cost);
        }
        out.emplace_back(EffectActivated{seat, c.card_id, c.effect_index, c.targets});

        GameState const now = Evolve(s, out);
        Append(out, ExecuteEffect(now, eff, seat, c.card_id, c.targets));
        return out;
    }
} // namespace ltcg::core::rules
