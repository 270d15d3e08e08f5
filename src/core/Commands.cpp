//
// Commands.cpp
//

#include "Commands.hpp"

#include <format>
#include <string>
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
    }

    auto CommandName(Command const& c) -> std::string_view
    {
        return std::visit(
            []<typename T0>(T0 const&) -> std::string_view
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, SummonCmd>) return "SUMMON";
                else if constexpr (std::is_same_v<T, SetMonsterCmd>) return "SET_MONSTER";
                else if constexpr (std::is_same_v<T, FlipSummonCmd>) return "FLIP_SUMMON";
                else if constexpr (std::is_same_v<T, ChangePositionCmd>) return "CHANGE_POSITION";
                else if constexpr (std::is_same_v<T, SetSpellTrapCmd>) return "SET_SPELL_TRAP";
                else if constexpr (std::is_same_v<T, ActivateSpellCmd>) return "ACTIVATE_SPELL";
                else if constexpr (std::is_same_v<T, ActivateTrapCmd>) return "ACTIVATE_TRAP";
                else if constexpr (std::is_same_v<T, ActivateEffectCmd>) return "ACTIVATE_EFFECT";
                else if constexpr (std::is_same_v<T, DeclareAttackCmd>) return "DECLARE_ATTACK";
                else if constexpr (std::is_same_v<T, AdvancePhaseCmd>) return "ADVANCE_PHASE";
                else if constexpr (std::is_same_v<T, EndTurnCmd>) return "END_TURN";
                else if constexpr (std::is_same_v<T, ChainResponseCmd>) return "CHAIN_RESPONSE";
                else if constexpr (std::is_same_v<T, SurrenderCmd>) return "SURRENDER";
                else static_assert([]{ return false; }(), "Command variant without a name");
            },
            c);
    }

    auto Describe(Command const& c) -> std::string
    {
        return std::visit(
            [&]<typename T0>(T0 const& cmd) -> std::string
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, SummonCmd>)
                {
                    return std::format("SUMMON[{} {} tributes={}]", cmd.card_id, to_string(cmd.position),
                                       JoinIds(cmd.tribute_card_ids));
                }
                else if constexpr (std::is_same_v<T, SetMonsterCmd> || std::is_same_v<T, FlipSummonCmd> ||
                    std::is_same_v<T, ChangePositionCmd> || std::is_same_v<T, SetSpellTrapCmd>)
                {
                    return std::format("{}[{}]", CommandName(c), cmd.card_id);
                }
                else if constexpr (std::is_same_v<T, ActivateSpellCmd> || std::is_same_v<T, ActivateTrapCmd> ||
                    std::is_same_v<T, ActivateEffectCmd>)
                {
                    return std::format("{}[{}#{} -> {}]", CommandName(c), cmd.card_id, cmd.effect_index,
                                       JoinIds(cmd.targets));
                }
                else if constexpr (std::is_same_v<T, DeclareAttackCmd>)
                {
                    return std::format("DECLARE_ATTACK[{} -> {}]", cmd.attacker_id,
                                       cmd.target_id.empty() ? std::string{"direct"} : cmd.target_id);
                }
                else if constexpr (std::is_same_v<T, ChainResponseCmd>)
                {
                    if (cmd.pass || !cmd.card_id)
                    {
                        return "CHAIN_RESPONSE[pass]";
                    }
                    return std::format("CHAIN_RESPONSE[{}#{} -> {}]", *cmd.card_id, cmd.effect_index,
                                       JoinIds(cmd.targets));
                }
                else
                {
                    return std::string{CommandName(c)};
                }
            },
            c);
    }
}
