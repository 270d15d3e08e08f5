//
// EffectCompiler.hpp
//

#ifndef LTCG_EFFECT_COMPILER_HPP
#define LTCG_EFFECT_COMPILER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Cards.hpp"

// Translates authored ability records ("trigger + targets + KEYWORD: text" operations)
// into effect definitions the interpreter can run.
namespace ltcg::core::compiler
{
    using Speed = std::variant<std::monostate, std::int64_t, std::string>;

    struct AbilityRecord
    {
        std::optional<std::string> trigger{};
        Speed speed{};
        std::vector<std::string> targets;
        std::optional<std::vector<std::string>> operations{};
    };

    // nullopt stands for input that was not a list at all.
    using AbilityList = std::optional<std::vector<AbilityRecord>>;

    auto MapTrigger(std::string_view trigger, Speed const& speed) -> EffectType;

    struct TargetSpec
    {
        std::optional<TargetFilter> filter{};
        std::optional<std::uint32_t> count{};
    };

    // Only the first keyword is consulted.
    auto MapTargets(std::vector<std::string> const& targets) -> TargetSpec;

    // One operation string; nullopt for keywords without an engine action.
    auto ParseOperation(std::string_view op) -> std::optional<EffectAction>;

    // Id "eff_<index>", description = operations joined by "; ". A record missing its
    // trigger or operations yields nullopt. Zero compiled actions still yields a definition.
    auto ParseAbility(AbilityRecord const& record, std::size_t index) -> std::optional<EffectDefinition>;

    // Drops records that compile to no actions; nullopt when nothing survives.
    auto ParseAbilities(AbilityList const& abilities) -> std::optional<std::vector<EffectDefinition>>;
} // namespace ltcg::core::compiler

#endif //LTCG_EFFECT_COMPILER_HPP
