//
// DemoCatalog.cpp
//

#include "DemoCatalog.hpp"

#include <memory>

#include "EffectCompiler.hpp"

namespace ltcg::core::demo
{
    namespace
    {
        auto Compiled(std::string trigger, std::vector<std::string> targets, std::vector<std::string> ops)
            -> std::vector<EffectDefinition>
        {
            compiler::AbilityRecord record{
                .trigger = std::move(trigger),
                .targets = std::move(targets),
                .operations = std::move(ops),
            };
            return compiler::ParseAbilities(std::vector{std::move(record)}).value_or(std::vector<EffectDefinition>{});
        }

        auto Monster(std::string id, std::string name, std::uint32_t level, std::int32_t atk, std::int32_t def)
            -> CardDefinition
        {
            CardDefinition d;
            d.id = std::move(id);
            d.name = std::move(name);
            d.type = CardType::Monster;
            d.level = level;
            d.attack = atk;
            d.defense = def;
            return d;
        }

        auto Spell(std::string id, std::string name, SpellType type, std::vector<EffectDefinition> effects)
            -> CardDefinition
        {
            CardDefinition d;
            d.id = std::move(id);
            d.name = std::move(name);
            d.type = CardType::Spell;
            d.spell_type = type;
            d.effects = std::move(effects);
            return d;
        }

        auto Trap(std::string id, std::string name, EffectDefinition effect) -> CardDefinition
        {
            CardDefinition d;
            d.id = std::move(id);
            d.name = std::move(name);
            d.type = CardType::Trap;
            d.trap_type = TrapType::Normal;
            d.effects = {std::move(effect)};
            return d;
        }
    }

    auto Cards() -> std::vector<CardDefinition>
    {
        std::vector<CardDefinition> out;

        out.push_back(Monster("hall_monitor", "Hall Monitor", 3, 1200, 1000));
        out.push_back(Monster("varsity_captain", "Varsity Captain", 4, 1800, 1200));
        out.push_back(Monster("library_sentinel", "Library Sentinel", 4, 1000, 2000));

        CardDefinition gossip = Monster("gossip_queen", "Gossip Queen", 4, 1500, 1100);
        gossip.effects = Compiled("OnSummon", {}, {"DRAW: 1"});
        out.push_back(std::move(gossip));

        CardDefinition dealer = Monster("detention_dealer", "Detention Dealer", 3, 900, 900);
        dealer.effects.push_back(EffectDefinition{
            .id = "eff_0",
            .type = EffectType::Ignition,
            .description = "Pay 500 LP: put a vice counter on an opposing monster",
            .cost = CostDefinition{.type = CostType::PayLp, .amount = 500},
            .target_count = 1,
            .target_filter = TargetFilter{.owner = Owner::Opponent, .zone = ZoneKind::Board},
            .actions = {AddVice{1}},
            .once_per_turn = true,
        });
        out.push_back(std::move(dealer));

        CardDefinition clown = Monster("class_clown", "Class Clown", 2, 600, 400);
        clown.effects.push_back(EffectDefinition{
            .id = "eff_0",
            .type = EffectType::Flip,
            .description = "Deal 500 damage",
            .actions = {Damage{LiteralAmount{500}}},
        });
        out.push_back(std::move(clown));

        out.push_back(Monster("prom_tyrant", "Prom Tyrant", 7, 2600, 2100));
        out.push_back(Monster("valedictorian", "Valedictorian", 6, 2400, 2000));

        out.push_back(Spell("cram_session", "Cram Session", SpellType::Normal,
                            Compiled("OnSpellActivation", {}, {"DRAW: 2"})));
        out.push_back(Spell("pep_rally", "Pep Rally", SpellType::QuickPlay,
                            {EffectDefinition{
                                .id = "eff_0",
                                .type = EffectType::Quick,
                                .description = "Own monsters gain 500 ATK this turn",
                                .actions = {BoostAttack{LiteralAmount{500}, BoostDuration::Turn}},
                            }}));
        out.push_back(Spell("letter_jacket", "Letter Jacket", SpellType::Equip,
                            {EffectDefinition{
                                .id = "eff_0",
                                .type = EffectType::Continuous,
                                .description = "Equipped monster gains 400 ATK",
                                .actions = {BoostAttack{LiteralAmount{400}, BoostDuration::Permanent}},
                            }}));
        out.push_back(Spell("cafeteria", "Cafeteria", SpellType::Field,
                            {EffectDefinition{
                                .id = "eff_0",
                                .type = EffectType::Continuous,
                                .description = "Own monsters gain 200 DEF while this is face-up",
                                .actions = {BoostDefense{LiteralAmount{200}, BoostDuration::Permanent}},
                            }}));
        out.push_back(Spell("graduation_rite", "Graduation Rite", SpellType::Ritual, {}));

        out.push_back(Trap("hall_pass_revoked", "Hall Pass Revoked", EffectDefinition{
            .id = "eff_0",
            .type = EffectType::Quick,
            .description = "Negate the activation below",
            .actions = {Negate{}},
        }));
        out.push_back(Trap("fire_drill", "Fire Drill", EffectDefinition{
            .id = "eff_0",
            .type = EffectType::Trigger,
            .description = "Destroy one opposing monster",
            .target_count = 1,
            .target_filter = TargetFilter{.owner = Owner::Opponent, .zone = ZoneKind::Board},
            .actions = {Destroy{DestroyTarget::Selected}},
        }));
        return out;
    }

    auto Registry() -> RegistryCSP
    {
        return std::make_shared<CardRegistry const>(Cards());
    }

    auto Deck(std::size_t const size) -> std::vector<DefinitionId>
    {
        std::vector<CardDefinition> const pool = Cards();
        std::vector<DefinitionId> out;
        out.reserve(size);
        for (std::size_t i{}; i < size; ++i)
        {
            out.push_back(pool[i % pool.size()].id);
        }
        return out;
    }
}
