//
// ChainRules.cpp
//

#include "RuleModules.hpp"

#include <algorithm>

#include "Evolve.hpp"
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

    auto CheckChainResponse(GameState const& s, Seat const seat, ChainResponseCmd const& c) -> ValidateResult
    {
        if (c.pass)
        {
            if (c.card_id || !c.targets.empty() || c.effect_index != 0)
                return std::unexpected(Viol(RVC::Chain_ResponseInvalid).with_actor(seat));
            return {};
        }

        if (!c.card_id)
            return std::unexpected(Viol(RVC::Chain_ResponseInvalid).with_actor(seat));

        CardId const& id = *c.card_id;
        SpellTrapCard const* set = query::FindSpellTrap(s, seat, id);
        CardDefinition const* def = query::DefinitionOf(s, id);
        bool const chainable = def != nullptr && (def->type == CardType::Trap || IsQuickPlay(*def));
        if (set == nullptr || !set->face_down || !chainable)
            return std::unexpected(Viol(RVC::Chain_ResponseInvalid).with_card(id).with_actor(seat));

        if (c.effect_index >= ActivationCount(*def))
            return std::unexpected(Viol(RVC::Activate_NoSuchEffect).with_card(id)
                                   .with_attempted(c.effect_index).with_capacity(ActivationCount(*def)));

        if (!ActivationTargetsOk(s, seat, *def, c.effect_index, c.targets))
            return std::unexpected(Viol(RVC::Activate_TargetsInvalid).with_card(id));

        return {};
    }

    auto EmitChainResponse(GameState const& s, Seat const seat, ChainResponseCmd const& c) -> EventList
    {
        if (!c.pass)
        {
            return ChainActivation(s, seat, *c.card_id, c.effect_index, c.targets);
        }

        EventList out{ChainPassed{seat}};
        // both seats passed in a row: the top link resolves
        if (s.current_chain_passer == Opponent(seat))
        {
            GameState const now = Evolve(s, out);
            EventList resolved = ResolveTopLink(now);
            out.insert(out.end(), std::make_move_iterator(resolved.begin()), std::make_move_iterator(resolved.end()));
        }
        return out;
    }

    auto ResolveTopLink(GameState const& s) -> EventList
    {
        LTCG_ASSERT(s.ChainOpen(), "ResolveTopLink without an open chain");

        ChainLink const link = s.current_chain.back();
        auto const index = static_cast<std::uint32_t>(s.current_chain.size() - 1);
        bool const negated = std::ranges::contains(s.negated_links, index);

        EventList out{ChainLinkResolved{index, link.card_id, negated}};
        GameState const popped = Evolve(s, out);

        EventList effect = ResolveCardEffect(popped, link.activating_seat, link.card_id, link.effect_index,
                                             link.targets, negated);
        out.insert(out.end(), std::make_move_iterator(effect.begin()), std::make_move_iterator(effect.end()));

        if (popped.current_chain.empty())
        {
            out.emplace_back(ChainResolved{});
        }
        return out;
    }
} // namespace ltcg::core::rules
