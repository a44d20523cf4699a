//
// Created on 09/10/2025.
//

#ifndef DADDECK_ABILITYEXECUTOR_HPP
#define DADDECK_ABILITYEXECUTOR_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "Card.hpp"
#include "Damage.hpp"
#include "SeededRandom.hpp"
#include "Types.hpp"

namespace daddeck::core
{
    struct AbilityResult
    {
        bool success{false};
        int damage{0};
        std::string flavor_text;
        std::vector<StatusEffect> status_effects; // to attach to the target
        HitKind hit{HitKind::Normal};
        Stat attack_stat{Stat::DadJoke};
        std::string roll_log;
    };

    class AbilityExecutor final
    {
    public:
        // First keyword found in the ability name picks the stat; dadJoke otherwise.
        static auto StatForAbility(std::string_view ability_name) noexcept -> Stat;

        // Stats come from the cards themselves.
        static auto Execute(Card const& card, Card const& target, std::size_t ability_index, SeededRandom& rng,
                            double status_chance = constants::StatusChance) -> AbilityResult;

        // Stats are the caller's status-modified snapshots.
        static auto Execute(Card const& card, StatSet const& card_stats, Card const& target,
                            StatSet const& target_stats, std::size_t ability_index, SeededRandom& rng,
                            double status_chance = constants::StatusChance) -> AbilityResult;
    };
}

#endif //DADDECK_ABILITYEXECUTOR_HPP
