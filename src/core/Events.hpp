//
// Events.hpp
//

#ifndef LTCG_EVENTS_HPP
#define LTCG_EVENTS_HPP

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Cards.hpp"
#include "Types.hpp"

namespace ltcg::core
{
    enum class BattleResult : std::uint8_t { Win = 0, Lose, Draw };
    enum class DestroyReason : std::uint8_t { Battle = 0, Effect, Breakdown };

    struct GameStarted { Seat going_first{Seat::Host}; auto operator==(GameStarted const&) const -> bool = default; };
    struct GameEnded { Seat winner{}; WinReason reason{}; auto operator==(GameEnded const&) const -> bool = default; };
    struct TurnStarted { Seat seat{}; std::uint32_t turn_number{}; auto operator==(TurnStarted const&) const -> bool = default; };
    struct TurnEnded { Seat seat{}; auto operator==(TurnEnded const&) const -> bool = default; };
    struct PhaseChanged { Phase from{}; Phase to{}; auto operator==(PhaseChanged const&) const -> bool = default; };
    struct CardDrawn { Seat seat{}; CardId card_id; auto operator==(CardDrawn const&) const -> bool = default; };
    struct DeckOut { Seat seat{}; auto operator==(DeckOut const&) const -> bool = default; };

    struct MonsterSummoned
    {
        Seat seat{};
        CardId card_id;
        Position position{};
        CardIds tributes;
        auto operator==(MonsterSummoned const&) const -> bool = default;
    };

    struct MonsterSet { Seat seat{}; CardId card_id; auto operator==(MonsterSet const&) const -> bool = default; };

    struct FlipSummoned
    {
        Seat seat{};
        CardId card_id;
        Position position{Position::Attack};
        auto operator==(FlipSummoned const&) const -> bool = default;
    };

    struct SpecialSummoned
    {
        Seat seat{};
        CardId card_id;
        ZoneKind from{};
        Position position{Position::Attack};
        auto operator==(SpecialSummoned const&) const -> bool = default;
    };

    struct SpellTrapSet { Seat seat{}; CardId card_id; auto operator==(SpellTrapSet const&) const -> bool = default; };

    struct SpellActivated
    {
        Seat seat{};
        CardId card_id;
        CardIds targets;
        auto operator==(SpellActivated const&) const -> bool = default;
    };

    struct TrapActivated
    {
        Seat seat{};
        CardId card_id;
        CardIds targets;
        auto operator==(TrapActivated const&) const -> bool = default;
    };

    struct EffectActivated
    {
        Seat seat{};
        CardId card_id;
        std::uint32_t effect_index{};
        CardIds targets;
        auto operator==(EffectActivated const&) const -> bool = default;
    };

    struct AttackDeclared
    {
        Seat seat{};
        CardId attacker_id;
        CardId target_id;
        auto operator==(AttackDeclared const&) const -> bool = default;
    };

    // negative amount heals
    struct DamageDealt
    {
        Seat seat{};
        std::int32_t amount{};
        bool is_battle{false};
        auto operator==(DamageDealt const&) const -> bool = default;
    };

    struct BattleResolved
    {
        CardId attacker_id;
        CardId defender_id;
        BattleResult result{};
        auto operator==(BattleResolved const&) const -> bool = default;
    };

    struct CardDestroyed { CardId card_id; DestroyReason reason{}; auto operator==(CardDestroyed const&) const -> bool = default; };

    struct CardBanished
    {
        CardId card_id;
        ZoneKind from{};
        Seat owner{};
        auto operator==(CardBanished const&) const -> bool = default;
    };

    struct CardReturnedToHand
    {
        CardId card_id;
        ZoneKind from{};
        Seat owner{};
        auto operator==(CardReturnedToHand const&) const -> bool = default;
    };

    struct CardSentToGraveyard
    {
        CardId card_id;
        ZoneKind from{};
        Seat owner{};
        auto operator==(CardSentToGraveyard const&) const -> bool = default;
    };

    struct ViceCounterAdded { CardId card_id; std::uint32_t new_count{}; auto operator==(ViceCounterAdded const&) const -> bool = default; };
    struct ViceCounterRemoved { CardId card_id; std::uint32_t new_count{}; auto operator==(ViceCounterRemoved const&) const -> bool = default; };

    // seat = owner of the broken-down monster
    struct BreakdownTriggered { Seat seat{}; CardId card_id; auto operator==(BreakdownTriggered const&) const -> bool = default; };

    struct PositionChanged
    {
        CardId card_id;
        Position from{};
        Position to{};
        auto operator==(PositionChanged const&) const -> bool = default;
    };

    struct ModifierApplied
    {
        CardId card_id;
        StatField field{};
        std::int32_t amount{};
        CardId source;
        Expiry expires{};
        auto operator==(ModifierApplied const&) const -> bool = default;
    };

    struct ModifierExpired { CardId card_id; CardId source; auto operator==(ModifierExpired const&) const -> bool = default; };

    struct ChainStarted { auto operator==(ChainStarted const&) const -> bool = default; };

    struct ChainLinkAdded
    {
        CardId card_id;
        Seat seat{};
        std::uint32_t effect_index{};
        CardIds targets;
        auto operator==(ChainLinkAdded const&) const -> bool = default;
    };

    struct ChainLinkNegated { std::uint32_t index{}; auto operator==(ChainLinkNegated const&) const -> bool = default; };

    struct ChainLinkResolved
    {
        std::uint32_t index{};
        CardId card_id;
        bool negated{false};
        auto operator==(ChainLinkResolved const&) const -> bool = default;
    };

    struct ChainPassed { Seat seat{}; auto operator==(ChainPassed const&) const -> bool = default; };
    struct ChainResolved { auto operator==(ChainResolved const&) const -> bool = default; };

    struct CostPaid
    {
        Seat seat{};
        CardId card_id;
        CostType cost_type{};
        std::int32_t amount{};
        auto operator==(CostPaid const&) const -> bool = default;
    };

    struct CostModifierApplied
    {
        Seat seat{};
        CostCardType card_type{};
        CostOperation operation{};
        std::int32_t amount{};
        CardId source;
        std::uint32_t expires_on_turn{};
        auto operator==(CostModifierApplied const&) const -> bool = default;
    };

    struct TurnRestrictionApplied
    {
        Seat seat{};
        Restriction restriction{};
        CardId source;
        std::uint32_t expires_on_turn{};
        auto operator==(TurnRestrictionApplied const&) const -> bool = default;
    };

    struct TopCardsViewed
    {
        Seat seat{};
        CardIds card_ids;
        CardId source;
        auto operator==(TopCardsViewed const&) const -> bool = default;
    };

    // card_ids = new order of the top of the deck
    struct TopCardsRearranged
    {
        Seat seat{};
        CardIds card_ids;
        CardId source;
        auto operator==(TopCardsRearranged const&) const -> bool = default;
    };

    struct SpellEquipped
    {
        Seat seat{};
        CardId card_id;
        CardId target_id;
        auto operator==(SpellEquipped const&) const -> bool = default;
    };

    // Ritual monster moved from hand to the board; tributes already left through their own events.
    struct RitualSummoned
    {
        Seat seat{};
        CardId card_id;
        CardId ritual_spell_id;
        CardIds tributes;
        auto operator==(RitualSummoned const&) const -> bool = default;
    };

    // Equip spell whose monster left the board.
    struct EquipDestroyed
    {
        CardId card_id;
        Seat owner{};
        auto operator==(EquipDestroyed const&) const -> bool = default;
    };

    struct ContinuousEffectApplied
    {
        CardId source;
        Seat source_seat{};
        CardId target;
        StatField field{};
        std::int32_t amount{};
        auto operator==(ContinuousEffectApplied const&) const -> bool = default;
    };

    struct ContinuousEffectRemoved
    {
        CardId source;
        CardId target;
        StatField field{};
        std::int32_t amount{};
        auto operator==(ContinuousEffectRemoved const&) const -> bool = default;
    };

    using Event = std::variant<
        GameStarted, GameEnded, TurnStarted, TurnEnded, PhaseChanged, CardDrawn, DeckOut,
        MonsterSummoned, MonsterSet, FlipSummoned, SpecialSummoned, SpellTrapSet,
        SpellActivated, TrapActivated, EffectActivated, AttackDeclared, DamageDealt,
        BattleResolved, CardDestroyed, CardBanished, CardReturnedToHand, CardSentToGraveyard,
        ViceCounterAdded, ViceCounterRemoved, BreakdownTriggered, PositionChanged,
        ModifierApplied, ModifierExpired, ChainStarted, ChainLinkAdded, ChainLinkNegated,
        ChainLinkResolved, ChainPassed, ChainResolved, CostPaid, CostModifierApplied,
        TurnRestrictionApplied, TopCardsViewed, TopCardsRearranged, SpellEquipped, RitualSummoned,
        EquipDestroyed, ContinuousEffectApplied, ContinuousEffectRemoved>;

    using EventList = std::vector<Event>;

    // Stable upper-snake name, e.g. "MONSTER_SUMMONED".
    auto EventName(Event const& e) -> std::string_view;
    auto Describe(Event const& e) -> std::string;

    template <typename T>
    auto Holds(Event const& e) -> bool
    {
        return std::holds_alternative<T>(e);
    }

    template <typename T>
    auto CountOf(EventList const& events) -> std::size_t
    {
        std::size_t n{};
        for (Event const& e : events)
        {
            n += std::holds_alternative<T>(e) ? 1u : 0u;
        }
        return n;
    }
} // namespace ltcg::core

#endif //LTCG_EVENTS_HPP
