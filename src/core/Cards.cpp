//
// Cards.cpp
//

#include "Cards.hpp"

#include <format>
#include <type_traits>

#include "Exception.hpp"

namespace ltcg::core
{
    CardRegistry::CardRegistry(std::vector<CardDefinition> defs)
    {
        for (CardDefinition& d : defs)
        {
            if (d.id.empty())
            {
                LTCG_THROW(error::Code::Registry, "Card definition without id");
            }
            auto const [it, inserted] = defs_.emplace(d.id, std::move(d));
            if (!inserted)
            {
                LTCG_THROW(error::Code::Registry, std::format("Duplicate card definition '{}'", it->first));
            }
        }
    }

    auto CardRegistry::Find(std::string_view id) const -> CardDefinition const*
    {
        auto const it = defs_.find(id);
        return it != defs_.end() ? &it->second : nullptr;
    }

    auto CardRegistry::Get(std::string_view id) const -> CardDefinition const&
    {
        CardDefinition const* d = Find(id);
        if (d == nullptr)
        {
            LTCG_THROW(error::Code::Registry, std::format("Unknown card definition '{}'", id));
        }
        return *d;
    }

    auto ActionName(EffectAction const& a) -> std::string_view
    {
        return std::visit(
            []<typename T0>(T0 const&) -> std::string_view
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, BoostAttack>) return "boost_attack";
                else if constexpr (std::is_same_v<T, BoostDefense>) return "boost_defense";
                else if constexpr (std::is_same_v<T, Damage>) return "damage";
                else if constexpr (std::is_same_v<T, Heal>) return "heal";
                else if constexpr (std::is_same_v<T, Draw>) return "draw";
                else if constexpr (std::is_same_v<T, Discard>) return "discard";
                else if constexpr (std::is_same_v<T, Destroy>) return "destroy";
                else if constexpr (std::is_same_v<T, Negate>) return "negate";
                else if constexpr (std::is_same_v<T, ReturnToHand>) return "return_to_hand";
                else if constexpr (std::is_same_v<T, Banish>) return "banish";
                else if constexpr (std::is_same_v<T, SpecialSummon>) return "special_summon";
                else if constexpr (std::is_same_v<T, ChangePosition>) return "change_position";
                else if constexpr (std::is_same_v<T, AddVice>) return "add_vice";
                else if constexpr (std::is_same_v<T, RemoveVice>) return "remove_vice";
                else if constexpr (std::is_same_v<T, ApplyRestriction>) return "apply_restriction";
                else if constexpr (std::is_same_v<T, ModifyCost>) return "modify_cost";
                else if constexpr (std::is_same_v<T, ViewTopCards>) return "view_top_cards";
                else if constexpr (std::is_same_v<T, RearrangeTopCards>) return "rearrange_top_cards";
                else static_assert([]{ return false; }(), "EffectAction variant without a name");
            },
            a);
    }
}
