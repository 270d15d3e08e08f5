//
// Commands.hpp
//

#ifndef LTCG_COMMANDS_HPP
#define LTCG_COMMANDS_HPP

#include <optional>
#include <string_view>
#include <variant>

#include "Types.hpp"

namespace ltcg::core
{
    struct SummonCmd
    {
        CardId card_id;
        Position position{Position::Attack};
        CardIds tribute_card_ids;
        auto operator==(SummonCmd const&) const -> bool = default;
    };

    struct SetMonsterCmd
    {
        CardId card_id;
        auto operator==(SetMonsterCmd const&) const -> bool = default;
    };

    struct FlipSummonCmd
    {
        CardId card_id;
        auto operator==(FlipSummonCmd const&) const -> bool = default;
    };

    struct ChangePositionCmd
    {
        CardId card_id;
        auto operator==(ChangePositionCmd const&) const -> bool = default;
    };

    struct SetSpellTrapCmd
    {
        CardId card_id;
        auto operator==(SetSpellTrapCmd const&) const -> bool = default;
    };

    // A ritual spell takes the monster to summon as targets[0] and its tributes after it.
    struct ActivateSpellCmd
    {
        CardId card_id;
        CardIds targets;
        std::uint32_t effect_index{};
        auto operator==(ActivateSpellCmd const&) const -> bool = default;
    };

    struct ActivateTrapCmd
    {
        CardId card_id;
        CardIds targets;
        std::uint32_t effect_index{};
        auto operator==(ActivateTrapCmd const&) const -> bool = default;
    };

    struct ActivateEffectCmd
    {
        CardId card_id;
        std::uint32_t effect_index{};
        CardIds targets;
        auto operator==(ActivateEffectCmd const&) const -> bool = default;
    };

    // empty target_id = direct attack
    struct DeclareAttackCmd
    {
        CardId attacker_id;
        CardId target_id;
        auto operator==(DeclareAttackCmd const&) const -> bool = default;
    };

    struct AdvancePhaseCmd
    {
        auto operator==(AdvancePhaseCmd const&) const -> bool = default;
    };

    struct EndTurnCmd
    {
        auto operator==(EndTurnCmd const&) const -> bool = default;
    };

    struct ChainResponseCmd
    {
        std::optional<CardId> card_id{};
        CardIds targets;
        bool pass{true};
        std::uint32_t effect_index{};
        auto operator==(ChainResponseCmd const&) const -> bool = default;
    };

    struct SurrenderCmd
    {
        auto operator==(SurrenderCmd const&) const -> bool = default;
    };

    using Command = std::variant<
        SummonCmd, SetMonsterCmd, FlipSummonCmd, ChangePositionCmd, SetSpellTrapCmd,
        ActivateSpellCmd, ActivateTrapCmd, ActivateEffectCmd, DeclareAttackCmd,
        AdvancePhaseCmd, EndTurnCmd, ChainResponseCmd, SurrenderCmd>;

    auto CommandName(Command const& c) -> std::string_view;
    auto Describe(Command const& c) -> std::string;
} // namespace ltcg::core

#endif //LTCG_COMMANDS_HPP
