//
// CombatRules.cpp
//

#include "RuleModules.hpp"

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

    auto CheckDeclareAttack(GameState const& s, Seat const seat, DeclareAttackCmd const& c) -> ValidateResult
    {
        if (s.current_phase != Phase::Combat)
            return std::unexpected(Viol(RVC::WrongPhase_CombatRequired).with_phase(s.current_phase).with_actor(seat));

        if (s.turn_number <= 1)
            return std::unexpected(Viol(RVC::Attack_FirstTurn).with_actor(seat));

        if (query::HasRestriction(s, seat, Restriction::DisableAttacks))
            return std::unexpected(Viol(RVC::Attack_Restricted).with_actor(seat));

        BoardCard const* attacker = query::FindBoardCard(s, seat, c.attacker_id);
        if (attacker == nullptr || attacker->face_down)
            return std::unexpected(Viol(RVC::Attack_AttackerInvalid).with_card(c.attacker_id).with_actor(seat));

        if (!attacker->can_attack)
            return std::unexpected(Viol(RVC::Attack_CannotAttack).with_card(c.attacker_id));

        if (attacker->has_attacked_this_turn)
            return std::unexpected(Viol(RVC::Attack_AlreadyAttacked).with_card(c.attacker_id));

        Seat const opp = Opponent(seat);
        if (c.target_id.empty())
        {
            if (query::FaceUpMonsterCount(s, opp) > 0)
                return std::unexpected(Viol(RVC::Attack_DirectNotAllowed).with_actor(seat));
        }
        else if (query::FindBoardCard(s, opp, c.target_id) == nullptr)
        {
            return std::unexpected(Viol(RVC::Attack_TargetInvalid).with_card(c.target_id));
        }

        return {};
    }

    auto EmitDeclareAttack(GameState const& s, Seat const seat, DeclareAttackCmd const& c) -> EventList
    {
        Seat const opp = Opponent(seat);
        BoardCard const& attacker = *query::FindBoardCard(s, seat, c.attacker_id);
        std::int32_t const atk = query::EffectiveAttack(s, attacker);

        EventList out;
        out.emplace_back(AttackDeclared{seat, c.attacker_id, c.target_id});

        if (c.target_id.empty())
        {
            out.emplace_back(DamageDealt{opp, atk, true});
            out.emplace_back(BattleResolved{c.attacker_id, c.target_id, BattleResult::Win});
            return out;
        }

        BoardCard const& defender = *query::FindBoardCard(s, opp, c.target_id);

        auto destroy = [&](CardId const& id, Seat const owner)
        {
            out.emplace_back(CardDestroyed{id, DestroyReason::Battle});
            out.emplace_back(CardSentToGraveyard{id, ZoneKind::Board, owner});
        };

        if (defender.position == Position::Attack)
        {
            std::int32_t const def_atk = query::EffectiveAttack(s, defender);
            if (atk > def_atk)
            {
                destroy(c.target_id, opp);
                out.emplace_back(DamageDealt{opp, atk - def_atk, true});
                out.emplace_back(BattleResolved{c.attacker_id, c.target_id, BattleResult::Win});
            }
            else if (atk < def_atk)
            {
                destroy(c.attacker_id, seat);
                out.emplace_back(DamageDealt{seat, def_atk - atk, true});
                out.emplace_back(BattleResolved{c.attacker_id, c.target_id, BattleResult::Lose});
            }
            else
            {
                destroy(c.attacker_id, seat);
                destroy(c.target_id, opp);
                out.emplace_back(BattleResolved{c.attacker_id, c.target_id, BattleResult::Draw});
            }
            return out;
        }

        // defense position: no damage to the defender's controller
        std::int32_t const def = query::EffectiveDefense(s, defender);
        if (atk > def)
        {
            destroy(c.target_id, opp);
            out.emplace_back(BattleResolved{c.attacker_id, c.target_id, BattleResult::Win});
        }
        else if (atk < def)
        {
            out.emplace_back(DamageDealt{seat, def - atk, true});
            out.emplace_back(BattleResolved{c.attacker_id, c.target_id, BattleResult::Lose});
        }
        else
        {
            out.emplace_back(BattleResolved{c.attacker_id, c.target_id, BattleResult::Draw});
        }
        return out;
    }
} // namespace ltcg::core::rules
