//
// EffectCompiler.cpp
//

#include "EffectCompiler.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <limits>
#include <system_error>
#include <utility>

namespace ltcg::core::compiler
{
    namespace
    {
        constexpr std::array<std::pair<std::string_view, EffectType>, 30> kTriggers{{
            {"OnSummon", EffectType::OnSummon},
            {"OnMainPhase", EffectType::Ignition},
            {"OnSpellActivation", EffectType::Trigger},
            {"OnSpellPlayed", EffectType::Trigger},
            {"OnTrapActivation", EffectType::Trigger},
            {"OnTrapActivated", EffectType::Trigger},
            {"OnEffectActivation", EffectType::Trigger},
            {"OnEnvironmentActivation", EffectType::Trigger},
            {"OnSpellResolution", EffectType::Trigger},
            {"OnAttackDeclaration", EffectType::Trigger},
            {"OnOpponentAttackDeclaration", EffectType::Trigger},
            {"OnOpponentStereotypeSummoned", EffectType::Trigger},
            {"OnOpponentSpellActivation", EffectType::Trigger},
            {"OnOpponentEffectResolution", EffectType::Trigger},
            {"OnOpponentCardActivation", EffectType::Trigger},
            {"OnOpponentSummon", EffectType::Trigger},
            {"OnOpponentDrawPhaseStart", EffectType::Trigger},
            {"OnOpponentReputationGain", EffectType::Trigger},
            {"OnStabilityZero", EffectType::Trigger},
            {"OnStabilityBelowThreshold", EffectType::Trigger},
            {"OnDestroy", EffectType::Trigger},
            {"OnCardDestroyed", EffectType::Trigger},
            {"OnTurnStart", EffectType::Continuous},
            {"OnDrawPhase", EffectType::Trigger},
            {"OnBattlePhaseStart", EffectType::Trigger},
            {"OnDeckEmpty", EffectType::Trigger},
            {"OnGameStart", EffectType::Continuous},
            {"OnSpellCountThree", EffectType::Trigger},
            {"OnReputationGain", EffectType::Trigger},
            {"OnTrapTargetingYou", EffectType::Quick},
        }};

        constexpr std::array<std::string_view, 9> kArchetypes{
            "Dropouts", "Preps", "Geeks", "Geek", "Freaks", "Nerds", "Nerd", "Goodies", "alliedStereotypes"};

        auto Trim(std::string_view s) -> std::string_view
        {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
            return s;
        }

        auto Lowered(std::string_view s) -> std::string
        {
            std::string out(s);
            std::ranges::transform(out, out.begin(), [](unsigned char const c)
            {
                return static_cast<char>(std::tolower(c));
            });
            return out;
        }

        auto IsDigit(char const c) -> bool
        {
            return c >= '0' && c <= '9';
        }

        // Digit runs past the int32 range saturate at its maximum.
        auto ParseDigits(std::string_view s) -> std::int32_t
        {
            std::int32_t v{};
            auto const [_, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
            if (ec == std::errc::result_out_of_range)
            {
                return std::numeric_limits<std::int32_t>::max();
            }
            return v;
        }

        auto DigitRun(std::string_view s, std::size_t const from) -> std::string_view
        {
            std::size_t end = from;
            while (end < s.size() && IsDigit(s[end])) ++end;
            return s.substr(from, end - from);
        }

        auto LeadingNumber(std::string_view s) -> std::optional<std::int32_t>
        {
            if (s.empty() || !IsDigit(s.front()))
            {
                return std::nullopt;
            }
            return ParseDigits(DigitRun(s, 0));
        }

        auto FirstNumber(std::string_view s) -> std::optional<std::int32_t>
        {
            auto const it = std::ranges::find_if(s, IsDigit);
            if (it == s.end())
            {
                return std::nullopt;
            }
            return ParseDigits(DigitRun(s, static_cast<std::size_t>(it - s.begin())));
        }

        // First digit run directly after `marker`, e.g. "+500".
        auto NumberAfter(std::string_view s, char const marker) -> std::optional<std::int32_t>
        {
            for (std::size_t i{}; i + 1 < s.size(); ++i)
            {
                if (s[i] == marker && IsDigit(s[i + 1]))
                {
                    return ParseDigits(DigitRun(s, i + 1));
                }
            }
            return std::nullopt;
        }

        // First digit run directly followed by '%'.
        auto Percent(std::string_view s) -> std::optional<std::int32_t>
        {
            for (std::size_t i{}; i < s.size(); ++i)
            {
                if (!IsDigit(s[i]) || (i > 0 && IsDigit(s[i - 1])))
                {
                    continue;
                }
                std::string_view const run = DigitRun(s, i);
                if (i + run.size() < s.size() && s[i + run.size()] == '%')
                {
                    return ParseDigits(run);
                }
            }
            return std::nullopt;
        }

        auto Contains(std::string_view s, std::string_view needle) -> bool
        {
            return s.find(needle) != std::string_view::npos;
        }

        auto Body(std::string_view op, std::string_view keyword) -> std::string_view
        {
            return Trim(op.substr(keyword.size()));
        }

        // Amount for a stat phrase without a literal number.
        auto VariableAmount(std::string_view rest) -> Amount
        {
            if (Contains(rest, "graveyard"))
            {
                Owner scope = Owner::Self;
                if (Contains(rest, "both") || Contains(rest, "all graveyards"))
                {
                    scope = Owner::Any;
                }
                else if (Contains(rest, "opponent"))
                {
                    scope = Owner::Opponent;
                }
                return GraveyardCount{scope, 1};
            }
            if (Contains(rest, "mirror") || Contains(rest, "same as"))
            {
                return MirrorAmount{};
            }
            return LiteralAmount{0};
        }

        auto ParseModifyStat(std::string_view body) -> std::optional<EffectAction>
        {
            bool const reputation = body.starts_with("reputation");
            bool const stability = body.starts_with("stability");
            if (!reputation && !stability)
            {
                return std::nullopt;
            }
            std::string_view const rest = Trim(body.substr(reputation ? 10 : 9));

            char const sign = rest.empty() ? '\0' : rest.front();
            bool const numeric = (sign == '+' || sign == '-' || sign == '*') && rest.size() > 1 && IsDigit(rest[1]);

            Amount amount = numeric ? Amount{LiteralAmount{ParseDigits(DigitRun(rest, 1))}} : VariableAmount(rest);
            bool const positive = sign != '-';

            if (!positive)
            {
                return Damage{std::move(amount)};
            }
            if (reputation)
            {
                return BoostAttack{std::move(amount), BoostDuration::Permanent};
            }
            return BoostDefense{std::move(amount), BoostDuration::Permanent};
        }

        auto ParseDestroy(std::string_view body) -> EffectAction
        {
            if (Contains(body, "all traps") || Contains(body, "all spells"))
            {
                return Destroy{DestroyTarget::AllSpellsTraps};
            }
            if (body == "alliedStereotypes")
            {
                return Destroy{DestroyTarget::AllOpponentMonsters};
            }
            return Destroy{DestroyTarget::Selected};
        }

        auto ParseMoveToZone(std::string_view body) -> EffectAction
        {
            if (Contains(body, "to hand"))
            {
                return ReturnToHand{};
            }
            if (Contains(body, "to deck"))
            {
                return Banish{};
            }
            return ReturnToHand{};
        }

        auto JoinOperations(std::vector<std::string> const& ops) -> std::string
        {
            std::string out;
            for (std::size_t i{}; i < ops.size(); ++i)
            {
                if (i)
                {
                    out += "; ";
                }
                out += ops[i];
            }
            return out;
        }
    }

    auto MapTrigger(std::string_view trigger, Speed const& speed) -> EffectType
    {
        if (auto const* s = std::get_if<std::string>(&speed))
        {
            if (*s == "ignition") return EffectType::Ignition;
            if (*s == "quick") return EffectType::Quick;
        }
        if (auto const* n = std::get_if<std::int64_t>(&speed); n && *n == 2)
        {
            return EffectType::Quick;
        }

        auto const it = std::ranges::find(kTriggers, trigger, &std::pair<std::string_view, EffectType>::first);
        return it != kTriggers.end() ? it->second : EffectType::Trigger;
    }

    auto MapTargets(std::vector<std::string> const& targets) -> TargetSpec
    {
        if (targets.empty())
        {
            return {};
        }
        // keywords match regardless of case
        std::string const primary = Lowered(Trim(targets.front()));

        if (primary == "self") return {TargetFilter{.owner = Owner::Self}, std::nullopt};
        if (primary == "opponent") return {TargetFilter{.owner = Owner::Opponent}, std::nullopt};
        if (primary == "bothplayers" || primary == "allplayers") return {TargetFilter{.owner = Owner::Any}, std::nullopt};
        if (std::ranges::any_of(kArchetypes, [&](std::string_view const a) { return Lowered(a) == primary; }))
        {
            return {TargetFilter{.owner = Owner::Self, .card_type = CardType::Monster}, std::nullopt};
        }
        if (primary == "allstereotypes")
        {
            return {TargetFilter{.owner = Owner::Any, .card_type = CardType::Monster}, std::nullopt};
        }
        if (primary == "attacker" || primary == "opponentcard" || primary == "targetcard" ||
            primary == "destroyedcard")
        {
            return {TargetFilter{.owner = Owner::Opponent}, 1u};
        }
        if (primary == "field" || primary == "environment")
        {
            return {TargetFilter{.owner = Owner::Any, .zone = ZoneKind::Board}, std::nullopt};
        }
        if (primary == "spells" || primary == "spell")
        {
            return {TargetFilter{.owner = Owner::Any, .card_type = CardType::Spell}, std::nullopt};
        }
        if (primary == "traps" || primary == "trap")
        {
            return {TargetFilter{.owner = Owner::Any, .card_type = CardType::Trap}, std::nullopt};
        }
        return {};
    }

    auto ParseOperation(std::string_view op) -> std::optional<EffectAction>
    {
        std::string_view const t = Trim(op);

        if (t.starts_with("MODIFY_STAT:")) return ParseModifyStat(Body(t, "MODIFY_STAT:"));
        if (t.starts_with("CONDITIONAL_MODIFY_STAT:")) return ParseModifyStat(Body(t, "CONDITIONAL_MODIFY_STAT:"));
        if (t.starts_with("RANDOM_MODIFY_STAT:")) return ParseModifyStat(Body(t, "RANDOM_MODIFY_STAT:"));

        if (t.starts_with("DRAW:") || t.starts_with("CONDITIONAL_DRAW:"))
        {
            std::string_view const body = Body(t, t.starts_with("DRAW:") ? "DRAW:" : "CONDITIONAL_DRAW:");
            return Draw{static_cast<std::uint32_t>(LeadingNumber(body).value_or(1))};
        }
        if (t.starts_with("DISCARD:"))
        {
            std::string_view const body = Body(t, "DISCARD:");
            if (body == "all" || body == "all from both hands")
            {
                return Discard{constants::DiscardAll};
            }
            return Discard{static_cast<std::uint32_t>(LeadingNumber(body).value_or(1))};
        }
        if (t.starts_with("DESTROY:")) return ParseDestroy(Body(t, "DESTROY:"));
        if (t.starts_with("NEGATE") || t == "RANDOM_NEGATE") return Negate{};
        if (t.starts_with("MOVE_TO_ZONE:")) return ParseMoveToZone(Body(t, "MOVE_TO_ZONE:"));
        if (t.starts_with("GRANT_IMMUNITY:")) return BoostDefense{LiteralAmount{9999}, BoostDuration::Turn};
        if (t.starts_with("RANDOM_GAIN:")) return Damage{LiteralAmount{NumberAfter(t, '+').value_or(500)}};
        if (t.starts_with("FORCE_ATTACK") || t == "CHANGE_ATTACK_TARGET" || t.starts_with("FORCE_TARGET:"))
        {
            return ChangePosition{};
        }
        if (t.starts_with("SKIP_") || t.starts_with("DISABLE_")) return BoostDefense{LiteralAmount{0}, BoostDuration::Turn};
        if (t.starts_with("SET_STAT:")) return Heal{LiteralAmount{FirstNumber(t).value_or(1000)}};
        if (t.starts_with("RANDOM_CARD:")) return Draw{1};
        if (t.starts_with("STEAL:")) return SpecialSummon{ZoneKind::Hand};
        if (t.starts_with("COPY_LAST_SPELL_EFFECT")) return Draw{1};
        if (t.starts_with("REDUCE_DAMAGE:"))
        {
            return BoostDefense{LiteralAmount{Percent(t).value_or(50) * 10}, BoostDuration::Turn};
        }
        if (t.starts_with("REMOVE_COUNTERS:")) return RemoveVice{1};

        // MODIFY_COST, VIEW_TOP_CARDS, REARRANGE_CARDS, REVEAL_HAND, SHUFFLE and free text
        return std::nullopt;
    }

    auto ParseAbility(AbilityRecord const& record, std::size_t const index) -> std::optional<EffectDefinition>
    {
        if (!record.trigger || record.trigger->empty() || !record.operations)
        {
            return std::nullopt;
        }

        TargetSpec targets = MapTargets(record.targets);
        EffectDefinition def{
            .id = "eff_" + std::to_string(index),
            .type = MapTrigger(*record.trigger, record.speed),
            .description = JoinOperations(*record.operations),
            .target_count = targets.count,
            .target_filter = std::move(targets.filter),
            .once_per_turn = *record.trigger == "OnMainPhase" || *record.trigger == "OnSummon",
        };
        for (std::string const& op : *record.operations)
        {
            if (auto action = ParseOperation(op))
            {
                def.actions.push_back(std::move(*action));
            }
        }
        return def;
    }

    auto ParseAbilities(AbilityList const& abilities) -> std::optional<std::vector<EffectDefinition>>
    {
        if (!abilities || abilities->empty())
        {
            return std::nullopt;
        }

        std::vector<EffectDefinition> out;
        for (std::size_t i{}; i < abilities->size(); ++i)
        {
            std::optional<EffectDefinition> def = ParseAbility((*abilities)[i], i);
            if (def && !def->actions.empty())
            {
                out.push_back(std::move(*def));
            }
        }
        if (out.empty())
        {
            return std::nullopt;
        }
        return out;
    }
} // namespace ltcg::core::compiler
