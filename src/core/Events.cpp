//
// Events.cpp
//

#include "Events.hpp"

#include <format>
#include <type_traits>

namespace ltcg::core
{
    namespace
    {
        auto JoinIds(CardIds const& ids) -> std::string
        {
            std::string body;
            for (std::size_t i{}; i < ids.size(); ++i)
            {
                body += (i ? "," : "");
                body += ids[i];
            }
            return body;
        }

        auto s_result(BattleResult const r) -> std::string_view
        {
            switch (r)
            {
            case BattleResult::Win: return "win";
            case BattleResult::Lose: return "lose";
            case BattleResult::Draw: return "draw";
            }
            return "?";
        }

        auto s_reason(DestroyReason const r) -> std::string_view
        {
            switch (r)
            {
            case DestroyReason::Battle: return "battle";
            case DestroyReason::Effect: return "effect";
            case DestroyReason::Breakdown: return "breakdown";
            }
            return "?";
        }

        auto s_field(StatField const f) -> std::string_view
        {
            return f == StatField::Attack ? "attack" : "defense";
        }
    }

    auto EventName(Event const& e) -> std::string_view
    {
        return std::visit(
            []<typename T0>(T0 const&) -> std::string_view
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, GameStarted>) return "GAME_STARTED";
                else if constexpr (std::is_same_v<T, GameEnded>) return "GAME_ENDED";
                else if constexpr (std::is_same_v<T, TurnStarted>) return "TURN_STARTED";
                else if constexpr (std::is_same_v<T, TurnEnded>) return "TURN_ENDED";
                else if constexpr (std::is_same_v<T, PhaseChanged>) return "PHASE_CHANGED";
                else if constexpr (std::is_same_v<T, CardDrawn>) return "CARD_DRAWN";
                else if constexpr (std::is_same_v<T, DeckOut>) return "DECK_OUT";
                else if constexpr (std::is_same_v<T, MonsterSummoned>) return "MONSTER_SUMMONED";
                else if constexpr (std::is_same_v<T, MonsterSet>) return "MONSTER_SET";
                else if constexpr (std::is_same_v<T, FlipSummoned>) return "FLIP_SUMMONED";
                else if constexpr (std::is_same_v<T, SpecialSummoned>) return "SPECIAL_SUMMONED";
                else if constexpr (std::is_same_v<T, SpellTrapSet>) return "SPELL_TRAP_SET";
                else if constexpr (std::is_same_v<T, SpellActivated>) return "SPELL_ACTIVATED";
                else if constexpr (std::is_same_v<T, TrapActivated>) return "TRAP_ACTIVATED";
                else if constexpr (std::is_same_v<T, EffectActivated>) return "EFFECT_ACTIVATED";
                else if constexpr (std::is_same_v<T, AttackDeclared>) return "ATTACK_DECLARED";
                else if constexpr (std::is_same_v<T, DamageDealt>) return "DAMAGE_DEALT";
                else if constexpr (std::is_same_v<T, BattleResolved>) return "BATTLE_RESOLVED";
                else if constexpr (std::is_same_v<T, CardDestroyed>) return "CARD_DESTROYED";
                else if constexpr (std::is_same_v<T, CardBanished>) return "CARD_BANISHED";
                else if constexpr (std::is_same_v<T, CardReturnedToHand>) return "CARD_RETURNED_TO_HAND";
                else if constexpr (std::is_same_v<T, CardSentToGraveyard>) return "CARD_SENT_TO_GRAVEYARD";
                else if constexpr (std::is_same_v<T, ViceCounterAdded>) return "VICE_COUNTER_ADDED";
                else if constexpr (std::is_same_v<T, ViceCounterRemoved>) return "VICE_COUNTER_REMOVED";
                else if constexpr (std::is_same_v<T, BreakdownTriggered>) return "BREAKDOWN_TRIGGERED";
                else if constexpr (std::is_same_v<T, PositionChanged>) return "POSITION_CHANGED";
                else if constexpr (std::is_same_v<T, ModifierApplied>) return "MODIFIER_APPLIED";
                else if constexpr (std::is_same_v<T, ModifierExpired>) return "MODIFIER_EXPIRED";
                else if constexpr (std::is_same_v<T, ChainStarted>) return "CHAIN_STARTED";
                else if constexpr (std::is_same_v<T, ChainLinkAdded>) return "CHAIN_LINK_ADDED";
                else if constexpr (std::is_same_v<T, ChainLinkNegated>) return "CHAIN_LINK_NEGATED";
                else if constexpr (std::is_same_v<T, ChainLinkResolved>) return "CHAIN_LINK_RESOLVED";
                else if constexpr (std::is_same_v<T, ChainPassed>) return "CHAIN_PASSED";
                else if constexpr (std::is_same_v<T, ChainResolved>) return "CHAIN_RESOLVED";
                else if constexpr (std::is_same_v<T, CostPaid>) return "COST_PAID";
                else if constexpr (std::is_same_v<T, CostModifierApplied>) return "COST_MODIFIER_APPLIED";
                else if constexpr (std::is_same_v<T, TurnRestrictionApplied>) return "TURN_RESTRICTION_APPLIED";
                else if constexpr (std::is_same_v<T, TopCardsViewed>) return "TOP_CARDS_VIEWED";
                else if constexpr (std::is_same_v<T, TopCardsRearranged>) return "TOP_CARDS_REARRANGED";
                else if constexpr (std::is_same_v<T, SpellEquipped>) return "SPELL_EQUIPPED";
                else if constexpr (std::is_same_v<T, RitualSummoned>) return "RITUAL_SUMMONED";
                else if constexpr (std::is_same_v<T, EquipDestroyed>) return "EQUIP_DESTROYED";
                else if constexpr (std::is_same_v<T, ContinuousEffectApplied>) return "CONTINUOUS_EFFECT_APPLIED";
                else if constexpr (std::is_same_v<T, ContinuousEffectRemoved>) return "CONTINUOUS_EFFECT_REMOVED";
                else static_assert([]{ return false; }(), "Event variant without a name");
            },
            e);
    }

    auto Describe(Event const& e) -> std::string
    {
        return std::visit(
            [&]<typename T0>(T0 const& ev) -> std::string
            {
                using T = std::decay_t<T0>;
                std::string_view const name = EventName(e);

                if constexpr (std::is_same_v<T, GameEnded>)
                    return std::format("{} winner={} reason={}", name, to_string(ev.winner), to_string(ev.reason));
                else if constexpr (std::is_same_v<T, TurnStarted>)
                    return std::format("{} seat={} turn={}", name, to_string(ev.seat), ev.turn_number);
                else if constexpr (std::is_same_v<T, PhaseChanged>)
                    return std::format("{} {} -> {}", name, to_string(ev.from), to_string(ev.to));
                else if constexpr (std::is_same_v<T, MonsterSummoned>)
                    return std::format("{} seat={} card={} pos={} tributes=[{}]", name, to_string(ev.seat), ev.card_id,
                                       to_string(ev.position), JoinIds(ev.tributes));
                else if constexpr (std::is_same_v<T, AttackDeclared>)
                    return std::format("{} seat={} attacker={} target={}", name, to_string(ev.seat), ev.attacker_id,
                                       ev.target_id.empty() ? std::string{"direct"} : ev.target_id);
                else if constexpr (std::is_same_v<T, DamageDealt>)
                    return std::format("{} seat={} amount={}{}", name, to_string(ev.seat), ev.amount,
                                       ev.is_battle ? " battle" : "");
                else if constexpr (std::is_same_v<T, BattleResolved>)
                    return std::format("{} {} vs {} -> {}", name, ev.attacker_id,
                                       ev.defender_id.empty() ? std::string{"direct"} : ev.defender_id,
                                       s_result(ev.result));
                else if constexpr (std::is_same_v<T, CardDestroyed>)
                    return std::format("{} card={} reason={}", name, ev.card_id, s_reason(ev.reason));
                else if constexpr (std::is_same_v<T, CardBanished> || std::is_same_v<T, CardReturnedToHand> ||
                    std::is_same_v<T, CardSentToGraveyard>)
                    return std::format("{} card={} from={} owner={}", name, ev.card_id, to_string(ev.from),
                                       to_string(ev.owner));
                else if constexpr (std::is_same_v<T, ViceCounterAdded> || std::is_same_v<T, ViceCounterRemoved>)
                    return std::format("{} card={} count={}", name, ev.card_id, ev.new_count);
                else if constexpr (std::is_same_v<T, ModifierApplied>)
                    return std::format("{} card={} {}{:+} source={} {}", name, ev.card_id, s_field(ev.field), ev.amount,
                                       ev.source, to_string(ev.expires));
                else if constexpr (std::is_same_v<T, RitualSummoned>)
                    return std::format("{} seat={} card={} spell={} tributes=[{}]", name, to_string(ev.seat),
                                       ev.card_id, ev.ritual_spell_id, JoinIds(ev.tributes));
                else if constexpr (std::is_same_v<T, EquipDestroyed>)
                    return std::format("{} card={} owner={}", name, ev.card_id, to_string(ev.owner));
                else if constexpr (std::is_same_v<T, ContinuousEffectApplied> ||
                    std::is_same_v<T, ContinuousEffectRemoved>)
                    return std::format("{} card={} {}{:+} source={}", name, ev.target, s_field(ev.field), ev.amount,
                                       ev.source);
                else if constexpr (std::is_same_v<T, ChainLinkAdded>)
                    return std::format("{} seat={} card={} effect={} targets=[{}]", name, to_string(ev.seat),
                                       ev.card_id, ev.effect_index, JoinIds(ev.targets));
                else if constexpr (std::is_same_v<T, ChainLinkResolved>)
                    return std::format("{} #{} card={}{}", name, ev.index, ev.card_id, ev.negated ? " (negated)" : "");
                else if constexpr (std::is_same_v<T, ChainLinkNegated>)
                    return std::format("{} #{}", name, ev.index);
                else if constexpr (requires { ev.seat; ev.card_id; })
                    return std::format("{} seat={} card={}", name, to_string(ev.seat), ev.card_id);
                else if constexpr (requires { ev.card_id; })
                    return std::format("{} card={}", name, ev.card_id);
                else if constexpr (requires { ev.seat; })
                    return std::format("{} seat={}", name, to_string(ev.seat));
                else
                    return std::string{name};
            },
            e);
    }
}
