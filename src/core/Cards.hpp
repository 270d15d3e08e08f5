//
// Cards.hpp
//

#ifndef LTCG_CARDS_HPP
#define LTCG_CARDS_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "Types.hpp"

namespace ltcg::core
{
    // ---------- Amounts ----------

    struct LiteralAmount
    {
        std::int32_t value{};
        auto operator==(LiteralAmount const&) const -> bool = default;
    };

    // Cards in the chosen graveyard(s) at execution time, times multiplier.
    struct GraveyardCount
    {
        Owner scope{Owner::Self};
        std::int32_t multiplier{1};
        auto operator==(GraveyardCount const&) const -> bool = default;
    };

    // Effective ATK of the first explicit target at execution time.
    struct MirrorAmount
    {
        auto operator==(MirrorAmount const&) const -> bool = default;
    };

    using Amount = std::variant<LiteralAmount, GraveyardCount, MirrorAmount>;

    // ---------- Effect actions ----------

    enum class BoostDuration : std::uint8_t { Turn = 0, Permanent };
    enum class DestroyTarget : std::uint8_t { Selected = 0, AllOpponentMonsters, AllSpellsTraps };
    enum class SeatScope : std::uint8_t { Self = 0, Opponent, Both };
    enum class CostCardType : std::uint8_t { Spell = 0, Trap, All };
    enum class CostOperation : std::uint8_t { Set = 0, Add, Multiply };
    enum class RearrangeStrategy : std::uint8_t { Reverse = 0, Keep };

    struct BoostAttack
    {
        Amount amount{LiteralAmount{}};
        BoostDuration duration{BoostDuration::Turn};
        auto operator==(BoostAttack const&) const -> bool = default;
    };

    struct BoostDefense
    {
        Amount amount{LiteralAmount{}};
        BoostDuration duration{BoostDuration::Turn};
        auto operator==(BoostDefense const&) const -> bool = default;
    };

    // always hits the opponent of the activating seat
    struct Damage
    {
        Amount amount{LiteralAmount{}};
        auto operator==(Damage const&) const -> bool = default;
    };

    // always restores the activating seat
    struct Heal
    {
        Amount amount{LiteralAmount{}};
        auto operator==(Heal const&) const -> bool = default;
    };

    struct Draw
    {
        std::uint32_t count{1};
        auto operator==(Draw const&) const -> bool = default;
    };

    // from the end of the opponent's hand
    struct Discard
    {
        std::uint32_t count{1};
        auto operator==(Discard const&) const -> bool = default;
    };

    struct Destroy
    {
        DestroyTarget target{DestroyTarget::Selected};
        auto operator==(Destroy const&) const -> bool = default;
    };

    // targets the most recent live chain link
    struct Negate
    {
        auto operator==(Negate const&) const -> bool = default;
    };

    struct ReturnToHand
    {
        auto operator==(ReturnToHand const&) const -> bool = default;
    };

    struct Banish
    {
        auto operator==(Banish const&) const -> bool = default;
    };

    struct SpecialSummon
    {
        ZoneKind from{ZoneKind::Hand};
        auto operator==(SpecialSummon const&) const -> bool = default;
    };

    struct ChangePosition
    {
        auto operator==(ChangePosition const&) const -> bool = default;
    };

    struct AddVice
    {
        std::uint32_t count{1};
        auto operator==(AddVice const&) const -> bool = default;
    };

    struct RemoveVice
    {
        std::uint32_t count{1};
        auto operator==(RemoveVice const&) const -> bool = default;
    };

    struct ApplyRestriction
    {
        Restriction restriction{Restriction::DisableAttacks};
        SeatScope target{SeatScope::Opponent};
        std::uint32_t duration_turns{1};
        auto operator==(ApplyRestriction const&) const -> bool = default;
    };

    struct ModifyCost
    {
        CostCardType card_type{CostCardType::All};
        CostOperation operation{CostOperation::Add};
        std::int32_t amount{};
        SeatScope target{SeatScope::Opponent};
        std::uint32_t duration_turns{1};
        auto operator==(ModifyCost const&) const -> bool = default;
    };

    struct ViewTopCards
    {
        std::uint32_t count{1};
        auto operator==(ViewTopCards const&) const -> bool = default;
    };

    struct RearrangeTopCards
    {
        std::uint32_t count{1};
        RearrangeStrategy strategy{RearrangeStrategy::Reverse};
        auto operator==(RearrangeTopCards const&) const -> bool = default;
    };

    using EffectAction = std::variant<
        BoostAttack, BoostDefense, Damage, Heal, Draw, Discard, Destroy, Negate,
        ReturnToHand, Banish, SpecialSummon, ChangePosition, AddVice, RemoveVice,
        ApplyRestriction, ModifyCost, ViewTopCards, RearrangeTopCards>;

    auto ActionName(EffectAction const& a) -> std::string_view;

    // ---------- Effects ----------

    enum class EffectType : std::uint8_t
    {
        OnSummon = 0,
        Ignition,
        Trigger,
        Quick,
        Continuous,
        Flip
    };

    enum class CostType : std::uint8_t
    {
        Tribute = 0,
        Discard,
        PayLp,
        RemoveVice,
        Banish
    };

    struct CostDefinition
    {
        CostType type{CostType::PayLp};
        std::uint32_t count{1};
        std::int32_t amount{};
        auto operator==(CostDefinition const&) const -> bool = default;
    };

    struct TargetFilter
    {
        Owner owner{Owner::Any};
        std::optional<ZoneKind> zone{};
        std::optional<CardType> card_type{};
        auto operator==(TargetFilter const&) const -> bool = default;
    };

    struct EffectDefinition
    {
        std::string id;
        EffectType type{EffectType::Ignition};
        std::string description;
        std::optional<CostDefinition> cost{};
        std::optional<std::uint32_t> target_count{};
        std::optional<TargetFilter> target_filter{};
        std::vector<EffectAction> actions;
        bool once_per_turn{false};
        bool hard_once_per_turn{false};
        auto operator==(EffectDefinition const&) const -> bool = default;
    };

    struct CardDefinition
    {
        DefinitionId id;
        std::string name;
        CardType type{CardType::Monster};
        Rarity rarity{Rarity::Common};
        std::int32_t attack{};
        std::int32_t defense{};
        std::uint32_t level{};
        std::optional<SpellType> spell_type{};
        std::optional<TrapType> trap_type{};
        std::vector<EffectDefinition> effects;
        std::string description;
    };

    inline auto IsQuickPlay(CardDefinition const& d) -> bool
    {
        return d.type == CardType::Spell && d.spell_type == SpellType::QuickPlay;
    }

    inline auto IsFieldSpell(CardDefinition const& d) -> bool
    {
        return d.type == CardType::Spell && d.spell_type == SpellType::Field;
    }

    inline auto IsEquipSpell(CardDefinition const& d) -> bool
    {
        return d.type == CardType::Spell && d.spell_type == SpellType::Equip;
    }

    inline auto IsRitualSpell(CardDefinition const& d) -> bool
    {
        return d.type == CardType::Spell && d.spell_type == SpellType::Ritual;
    }

    // Normal spells/traps leave the field once they resolve; the rest stay face-up.
    inline auto StaysOnField(CardDefinition const& d) -> bool
    {
        if (d.type == CardType::Spell)
        {
            return d.spell_type == SpellType::Continuous || d.spell_type == SpellType::Equip ||
                d.spell_type == SpellType::Field;
        }
        if (d.type == CardType::Trap)
        {
            return d.trap_type == TrapType::Continuous;
        }
        return false;
    }

    // Read-only catalog shared by every state derived from one duel.
    class CardRegistry
    {
    public:
        CardRegistry() = default;
        explicit CardRegistry(std::vector<CardDefinition> defs);

        auto Find(std::string_view id) const -> CardDefinition const*;
        auto Get(std::string_view id) const -> CardDefinition const&;
        auto Contains(std::string_view id) const -> bool { return Find(id) != nullptr; }
        auto Size() const noexcept -> std::size_t { return defs_.size(); }

    private:
        std::map<DefinitionId, CardDefinition, std::less<>> defs_;
    };

    using RegistryCSP = std::shared_ptr<CardRegistry const>;
}

#endif //LTCG_CARDS_HPP
