#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include "../core/EffectCompiler.hpp"

using namespace ltcg::core;
using namespace ltcg::core::compiler;

namespace
{
    auto make_record(std::string trigger, std::vector<std::string> ops,
                     std::vector<std::string> targets = {}, Speed speed = {}) -> AbilityRecord
    {
        return AbilityRecord{
            .trigger = std::move(trigger),
            .speed = std::move(speed),
            .targets = std::move(targets),
            .operations = std::move(ops),
        };
    }

    auto literal(EffectAction const& a) -> std::int32_t
    {
        return std::visit([]<typename T>(T const& act) -> std::int32_t
        {
            if constexpr (requires { std::get_if<LiteralAmount>(&act.amount); })
            {
                if (auto const* l = std::get_if<LiteralAmount>(&act.amount))
                    return l->value;
            }
            return -1;
        }, a);
    }
}

TEST(EffectCompiler, ReputationBoostIsPermanentAttack)
{
    auto const a = ParseOperation("MODIFY_STAT: reputation +300");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(std::holds_alternative<BoostAttack>(*a));
    EXPECT_EQ(std::get<BoostAttack>(*a).duration, BoostDuration::Permanent);
    EXPECT_EQ(literal(*a), 300);
}

TEST(EffectCompiler, DiscardAllUsesSentinel)
{
    auto const a = ParseOperation("DISCARD: all");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(std::holds_alternative<Discard>(*a));
    EXPECT_EQ(std::get<Discard>(*a).count, constants::DiscardAll);

    auto const both = ParseOperation("DISCARD: all from both hands");
    ASSERT_TRUE(both.has_value());
    EXPECT_EQ(std::get<Discard>(*both).count, 99u);
}

TEST(EffectCompiler, StatSignAndFieldSelectAction)
{
    auto const neg = ParseOperation("MODIFY_STAT: reputation -400");
    ASSERT_TRUE(neg.has_value());
    EXPECT_TRUE(std::holds_alternative<Damage>(*neg));
    EXPECT_EQ(literal(*neg), 400);

    auto const stab = ParseOperation("CONDITIONAL_MODIFY_STAT: stability +250");
    ASSERT_TRUE(stab.has_value());
    EXPECT_TRUE(std::holds_alternative<BoostDefense>(*stab));
    EXPECT_EQ(literal(*stab), 250);

    auto const mul = ParseOperation("RANDOM_MODIFY_STAT: reputation *2");
    ASSERT_TRUE(mul.has_value());
    EXPECT_TRUE(std::holds_alternative<BoostAttack>(*mul));
    EXPECT_EQ(literal(*mul), 2);

    // variable amounts are left for the interpreter
    auto const grave = ParseOperation("MODIFY_STAT: reputation +equal to opponent graveyard count");
    ASSERT_TRUE(grave.has_value());
    auto const& boost = std::get<BoostAttack>(*grave);
    ASSERT_TRUE(std::holds_alternative<GraveyardCount>(boost.amount));
    EXPECT_EQ(std::get<GraveyardCount>(boost.amount).scope, Owner::Opponent);

    EXPECT_FALSE(ParseOperation("MODIFY_STAT: charisma +100").has_value());
}

TEST(EffectCompiler, CountsAndDefaults)
{
    EXPECT_EQ(std::get<Draw>(*ParseOperation("DRAW: 3 cards")).count, 3u);
    EXPECT_EQ(std::get<Draw>(*ParseOperation("  DRAW: a card  ")).count, 1u);
    EXPECT_EQ(std::get<Discard>(*ParseOperation("DISCARD: 2")).count, 2u);
    EXPECT_EQ(literal(*ParseOperation("RANDOM_GAIN: reputation")), 500);
    EXPECT_EQ(literal(*ParseOperation("RANDOM_GAIN: reputation +750")), 750);
    EXPECT_EQ(literal(*ParseOperation("SET_STAT: stability")), 1000);
    EXPECT_EQ(literal(*ParseOperation("REDUCE_DAMAGE: half")), 500);
    EXPECT_EQ(literal(*ParseOperation("REDUCE_DAMAGE: 30% of battle damage")), 300);
}

TEST(EffectCompiler, OversizedNumbersSaturate)
{
    std::int32_t const max = std::numeric_limits<std::int32_t>::max();
    EXPECT_EQ(literal(*ParseOperation("MODIFY_STAT: reputation +99999999999")), max);
    EXPECT_EQ(literal(*ParseOperation("MODIFY_STAT: stability -4294967296")), max);
    EXPECT_EQ(std::get<Draw>(*ParseOperation("DRAW: 12345678901234")).count, static_cast<std::uint32_t>(max));
    EXPECT_EQ(literal(*ParseOperation("MODIFY_STAT: reputation +2147483647")), max);
}

TEST(EffectCompiler, DestroyAndMoveKeywords)
{
    EXPECT_EQ(std::get<Destroy>(*ParseOperation("DESTROY: all traps")).target, DestroyTarget::AllSpellsTraps);
    EXPECT_EQ(std::get<Destroy>(*ParseOperation("DESTROY: alliedStereotypes")).target,
              DestroyTarget::AllOpponentMonsters);
    EXPECT_EQ(std::get<Destroy>(*ParseOperation("DESTROY: target")).target, DestroyTarget::Selected);

    EXPECT_TRUE(std::holds_alternative<ReturnToHand>(*ParseOperation("MOVE_TO_ZONE: target to hand")));
    EXPECT_TRUE(std::holds_alternative<Banish>(*ParseOperation("MOVE_TO_ZONE: target to deck")));
    EXPECT_TRUE(std::holds_alternative<ReturnToHand>(*ParseOperation("MOVE_TO_ZONE: somewhere")));
    EXPECT_TRUE(std::holds_alternative<Negate>(*ParseOperation("NEGATE: activation")));
}

TEST(EffectCompiler, UnknownKeywordsDropSilently)
{
    EXPECT_FALSE(ParseOperation("SHUFFLE: deck").has_value());
    EXPECT_FALSE(ParseOperation("REVEAL_HAND: opponent").has_value());
    EXPECT_FALSE(ParseOperation("just some flavour text").has_value());
}

TEST(EffectCompiler, TriggerMappingAndSpeedOverride)
{
    EXPECT_EQ(MapTrigger("OnSummon", {}), EffectType::OnSummon);
    EXPECT_EQ(MapTrigger("OnMainPhase", {}), EffectType::Ignition);
    EXPECT_EQ(MapTrigger("OnDestroy", {}), EffectType::Trigger);
    EXPECT_EQ(MapTrigger("OnTrapTargetingYou", {}), EffectType::Quick);
    EXPECT_EQ(MapTrigger("OnGameStart", {}), EffectType::Continuous);
    EXPECT_EQ(MapTrigger("SomethingNew", {}), EffectType::Trigger);

    EXPECT_EQ(MapTrigger("OnSummon", Speed{std::int64_t{2}}), EffectType::Quick);
    EXPECT_EQ(MapTrigger("OnSummon", Speed{std::string{"quick"}}), EffectType::Quick);
    EXPECT_EQ(MapTrigger("OnDestroy", Speed{std::string{"ignition"}}), EffectType::Ignition);
    EXPECT_EQ(MapTrigger("OnDestroy", Speed{std::int64_t{1}}), EffectType::Trigger);
}

TEST(EffectCompiler, TargetKeywords)
{
    EXPECT_FALSE(MapTargets({}).filter.has_value());

    TargetSpec const self = MapTargets({"self", "opponent"});
    ASSERT_TRUE(self.filter.has_value());
    EXPECT_EQ(self.filter->owner, Owner::Self);

    TargetSpec const geeks = MapTargets({"Geeks"});
    ASSERT_TRUE(geeks.filter.has_value());
    EXPECT_EQ(geeks.filter->owner, Owner::Self);
    EXPECT_EQ(geeks.filter->card_type, CardType::Monster);

    TargetSpec const single = MapTargets({"opponentCard"});
    ASSERT_TRUE(single.filter.has_value());
    EXPECT_EQ(single.filter->owner, Owner::Opponent);
    EXPECT_EQ(single.count, 1u);

    TargetSpec const field = MapTargets({"Environment"});
    ASSERT_TRUE(field.filter.has_value());
    EXPECT_EQ(field.filter->zone, ZoneKind::Board);
    EXPECT_EQ(field.filter->owner, Owner::Any);

    EXPECT_EQ(MapTargets({"traps"}).filter->card_type, CardType::Trap);
    EXPECT_FALSE(MapTargets({"nobody"}).filter.has_value());
}

TEST(EffectCompiler, TargetKeywordsIgnoreCase)
{
    for (std::string const word : {"field", "Field", "FIELD", "environment", "ENVIRONMENT", " Environment "})
    {
        TargetSpec const spec = MapTargets({word});
        ASSERT_TRUE(spec.filter.has_value()) << word;
        EXPECT_EQ(spec.filter->zone, ZoneKind::Board) << word;
        EXPECT_EQ(spec.filter->owner, Owner::Any) << word;
    }

    EXPECT_EQ(MapTargets({"Self"}).filter->owner, Owner::Self);
    EXPECT_EQ(MapTargets({"BOTHPLAYERS"}).filter->owner, Owner::Any);
    EXPECT_EQ(MapTargets({"geeks"}).filter->card_type, CardType::Monster);
    EXPECT_EQ(MapTargets({"OpponentCard"}).count, 1u);
}

TEST(EffectCompiler, AbilityIdsDescriptionsAndOncePerTurn)
{
    auto const def = ParseAbility(make_record("OnMainPhase", {"DRAW: 1", "SHUFFLE: deck"}), 4);
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->id, "eff_4");
    EXPECT_EQ(def->type, EffectType::Ignition);
    EXPECT_EQ(def->description, "DRAW: 1; SHUFFLE: deck");
    EXPECT_TRUE(def->once_per_turn);
    ASSERT_EQ(def->actions.size(), 1u);

    auto const trig = ParseAbility(make_record("OnDestroy", {"DRAW: 1"}), 0);
    ASSERT_TRUE(trig.has_value());
    EXPECT_FALSE(trig->once_per_turn);

    AbilityRecord no_ops = make_record("OnSummon", {});
    no_ops.operations.reset();
    EXPECT_FALSE(ParseAbility(no_ops, 0).has_value());

    AbilityRecord no_trigger = make_record("", {"DRAW: 1"});
    EXPECT_FALSE(ParseAbility(no_trigger, 0).has_value());
}

TEST(EffectCompiler, AbilityListDropsEmptyCompilations)
{
    EXPECT_FALSE(ParseAbilities(std::nullopt).has_value());
    EXPECT_FALSE(ParseAbilities(std::vector<AbilityRecord>{}).has_value());
    EXPECT_FALSE(ParseAbilities(std::vector{make_record("OnSummon", {"SHUFFLE: deck"})}).has_value());

    auto const list = ParseAbilities(std::vector{
        make_record("OnSummon", {"SHUFFLE: deck"}),
        make_record("OnSummon", {"DRAW: 2"}),
    });
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ(list->size(), 1u);
    EXPECT_EQ(list->front().id, "eff_1");
    EXPECT_EQ(list->front().type, EffectType::OnSummon);
}
