//
// DuelRules.cpp
//

#include "Rules.hpp"

#include <type_traits>

#include "Queries.hpp"
#include "RuleModules.hpp"

namespace
{
    inline auto Viol(ltcg::core::error::RuleViolationCode code) -> ltcg::core::error::RuleViolation
    {
        return ltcg::core::error::RuleViolation{.code = code};
    }

    auto IsActivation(ltcg::core::Command const& c) -> bool
    {
        using namespace ltcg::core;
        if (auto const* r = std::get_if<ChainResponseCmd>(&c))
        {
            return !r->pass;
        }
        return std::holds_alternative<ActivateSpellCmd>(c) || std::holds_alternative<ActivateTrapCmd>(c) ||
            std::holds_alternative<ActivateEffectCmd>(c);
    }
}

namespace ltcg::core
{
    auto DuelRules::Validate(GameState const& s, Seat const seat, Command const& c) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;

        if (s.game_over)
            return std::unexpected(Viol(RVC::GameOver).with_actor(seat));

        if (std::holds_alternative<SurrenderCmd>(c))
            return {};

        bool const is_response = std::holds_alternative<ChainResponseCmd>(c);
        if (s.ChainOpen())
        {
            if (s.current_priority_player != seat)
                return std::unexpected(Viol(RVC::WrongActor_PriorityRequired).with_actor(seat).with_phase(s.current_phase));

            if (!is_response)
                return std::unexpected(Viol(RVC::ChainOpen_OnlyResponses).with_actor(seat));
        }
        else
        {
            if (is_response)
                return std::unexpected(Viol(RVC::Chain_NotOpen).with_actor(seat));

            // the non-turn seat may only open a chain with a set trap or quick-play
            bool const opens_chain = std::holds_alternative<ActivateTrapCmd>(c) || std::holds_alternative<ActivateSpellCmd>(c);
            if (seat != s.current_turn_player && !opens_chain)
                return std::unexpected(Viol(RVC::WrongActor_TurnPlayerRequired)
                                       .with_actor(seat).with_turn_player(s.current_turn_player));
        }

        if (IsActivation(c) && query::HasRestriction(s, seat, Restriction::DisableEffects))
            return std::unexpected(Viol(RVC::Effects_Disabled).with_actor(seat));

        return std::visit([&]<typename T0>(T0 const& cmd) -> CheckResult
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, SummonCmd>) return rules::CheckSummon(s, seat, cmd);
            else if constexpr (std::is_same_v<T, SetMonsterCmd>) return rules::CheckSetMonster(s, seat, cmd);
            else if constexpr (std::is_same_v<T, FlipSummonCmd>) return rules::CheckFlipSummon(s, seat, cmd);
            else if constexpr (std::is_same_v<T, ChangePositionCmd>) return rules::CheckChangePosition(s, seat, cmd);
            else if constexpr (std::is_same_v<T, SetSpellTrapCmd>) return rules::CheckSetSpellTrap(s, seat, cmd);
            else if constexpr (std::is_same_v<T, ActivateSpellCmd>)
            {
                if (seat != s.current_turn_player)
                {
                    // off-turn activation needs a set quick-play
                    CardDefinition const* def = query::DefinitionOf(s, cmd.card_id);
                    if (query::FindSpellTrap(s, seat, cmd.card_id) == nullptr || def == nullptr || !IsQuickPlay(*def))
                        return std::unexpected(Viol(RVC::WrongActor_TurnPlayerRequired)
                                               .with_actor(seat).with_turn_player(s.current_turn_player));
                }
                return rules::CheckActivateSpell(s, seat, cmd);
            }
            else if constexpr (std::is_same_v<T, ActivateTrapCmd>) return rules::CheckActivateTrap(s, seat, cmd);
            else if constexpr (std::is_same_v<T, ActivateEffectCmd>) return rules::CheckActivateEffect(s, seat, cmd);
            else if constexpr (std::is_same_v<T, DeclareAttackCmd>) return rules::CheckDeclareAttack(s, seat, cmd);
            else if constexpr (std::is_same_v<T, AdvancePhaseCmd>) return rules::CheckAdvancePhase(s, seat, cmd);
            else if constexpr (std::is_same_v<T, EndTurnCmd>) return rules::CheckEndTurn(s, seat, cmd);
            else if constexpr (std::is_same_v<T, ChainResponseCmd>) return rules::CheckChainResponse(s, seat, cmd);
            else if constexpr (std::is_same_v<T, SurrenderCmd>) return CheckResult{};
            else static_assert([] { return false; }(), "Unhandled command in Validate");
        }, c);
    }

    auto DuelRules::Emit(GameState const& s, Seat const seat, Command const& c) const -> EventList
    {
        return std::visit([&]<typename T0>(T0 const& cmd) -> EventList
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, SummonCmd>) return rules::EmitSummon(s, seat, cmd);
            else if constexpr (std::is_same_v<T, SetMonsterCmd>) return rules::EmitSetMonster(s, seat, cmd);
            else if constexpr (std::is_same_v<T, FlipSummonCmd>) return rules::EmitFlipSummon(s, seat, cmd);
            else if constexpr (std::is_same_v<T, ChangePositionCmd>) return rules::EmitChangePosition(s, seat, cmd);
            else if constexpr (std::is_same_v<T, SetSpellTrapCmd>) return rules::EmitSetSpellTrap(s, seat, cmd);
            else if constexpr (std::is_same_v<T, ActivateSpellCmd>) return rules::EmitActivateSpell(s, seat, cmd);
            else if constexpr (std::is_same_v<T, ActivateTrapCmd>) return rules::EmitActivateTrap(s, seat, cmd);
            else if constexpr (std::is_same_v<T, ActivateEffectCmd>) return rules::EmitActivateEffect(s, seat, cmd);
            else if constexpr (std::is_same_v<T, DeclareAttackCmd>) return rules::EmitDeclareAttack(s, seat, cmd);
            else if constexpr (std::is_same_v<T, AdvancePhaseCmd>) return rules::EmitAdvancePhase(s, seat, cmd);
            else if constexpr (std::is_same_v<T, EndTurnCmd>) return rules::EmitEndTurn(s, seat, cmd);
            else if constexpr (std::is_same_v<T, ChainResponseCmd>) return rules::EmitChainResponse(s, seat, cmd);
            else if constexpr (std::is_same_v<T, SurrenderCmd>) return rules::EmitSurrender(s, seat, cmd);
            else static_assert([] { return false; }(), "Unhandled command in Emit");
        }, c);
    }

    auto DuelRules::Derive(GameState const& s, EventList const& batch) const -> EventList
    {
        return rules::DeriveStateBased(s, batch);
    }

    auto DuelRules::Candidates(GameState const& s, Seat const seat) const -> std::vector<Command>
    {
        return rules::CandidateCommands(s, seat);
    }
} // namespace ltcg::core
