//
// Created on 09/10/2025.
//

#include "AbilityExecutor.hpp"

#include <array>
#include <optional>

#include <fmt/format.h>

namespace daddeck::core
{
    namespace
    {
        struct Keyword
        {
            std::string_view word;
            Stat stat;
        };

        constexpr std::array<Keyword, 8> Keywords{{
            {"Grill", Stat::GrillSkill},
            {"Fix", Stat::FixIt},
            {"Nap", Stat::NapPower},
            {"Remote", Stat::RemoteControl},
            {"Thermostat", Stat::Thermostat},
            {"Sock", Stat::SockSandal},
            {"Beer", Stat::BeerSnob},
            {"Joke", Stat::DadJoke},
        }};

        struct StatusRoll
        {
            Category category;
            StatusKind kind;
            uint32_t duration;
        };

        constexpr std::array<StatusRoll, 5> StatusRolls{{
            {Category::BbqDicktator, StatusKind::Grilled, 2},
            {Category::CouchCummander, StatusKind::Lectured, 2},
            {Category::HolidayHorndogs, StatusKind::Drunk, 2},
            {Category::TechTwats, StatusKind::Wired, 2},
            {Category::CoachCumsters, StatusKind::Inspired, 3},
        }};

        auto RollStatus(Category const category, SeededRandom& rng, double const chance) -> std::vector<StatusEffect>
        {
            std::vector<StatusEffect> out;
            for (auto const& roll : StatusRolls)
            {
                if (roll.category != category) continue;
                if (rng.Chance(chance))
                    out.push_back(StatusEffect{.kind = roll.kind, .duration = roll.duration, .stacks = 1});
            }
            // a couch dad who did not lecture may still bore the target
            if (category == Category::CouchCummander && out.empty() && rng.Chance(chance))
                out.push_back(StatusEffect{.kind = StatusKind::Bored, .duration = 2, .stacks = 1});
            return out;
        }

        auto Flavor(Card const& card, Ability const& ability, Card const& target, SeededRandom& rng) -> std::string
        {
            switch (rng.PickIndex(4))
            {
            case 0: return fmt::format("{} uses {}! {}", card.name, ability.name, ability.description);
            case 1: return fmt::format("{}: \"{}\"", card.name, ability.description);
            case 2: return fmt::format("{} hits {} with {}!", card.name, target.name, ability.name);
            default:
                return fmt::format("{} activates! {} looks confused.", ability.name,
                                   target.subtitle.empty() ? target.name : target.subtitle);
            }
        }
    }

    auto AbilityExecutor::StatForAbility(std::string_view const ability_name) noexcept -> Stat
    {
        for (auto const& [word, stat] : Keywords)
        {
            if (ability_name.find(word) != std::string_view::npos) return stat;
        }
        return Stat::DadJoke;
    }

    auto AbilityExecutor::Execute(Card const& card, Card const& target, std::size_t const ability_index,
                                  SeededRandom& rng, double const status_chance) -> AbilityResult
    {
        return Execute(card, card.stats, target, target.stats, ability_index, rng, status_chance);
    }

    auto AbilityExecutor::Execute(Card const& card, StatSet const& card_stats, Card const& target,
                                  StatSet const& target_stats, std::size_t const ability_index, SeededRandom& rng,
                                  double const status_chance) -> AbilityResult
    {
        if (ability_index >= card.abilities.size())
        {
            return AbilityResult{
                .success = false,
                .damage = 0,
                .flavor_text = fmt::format("{} forgot what he was doing.", card.name),
            };
        }

        auto const& ability = card.abilities[ability_index];
        auto const stat = StatForAbility(ability.name);
        auto const roll = DamageCalculator::Calculate(card_stats, target_stats, stat, stat, rng);
        auto effects = RollStatus(card.category, rng, status_chance);
        auto flavor = Flavor(card, ability, target, rng);

        return AbilityResult{
            .success = true,
            .damage = roll.damage,
            .flavor_text = std::move(flavor),
            .status_effects = std::move(effects),
            .hit = roll.kind,
            .attack_stat = stat,
            .roll_log = roll.log,
        };
    }
}
