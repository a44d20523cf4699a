//
// Created on 08/10/2025.
//

#include "Damage.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace daddeck::core
{
    auto ToString(HitKind const k) -> std::string_view
    {
        switch (k)
        {
        case HitKind::Normal: return "Normal hit";
        case HitKind::Critical: return "CRITICAL ×1.5";
        case HitKind::Glancing: return "Glancing ×0.5";
        }
        return "?";
    }

    auto DamageCalculator::BaseDamage(double const attack, double const defense) noexcept -> double
    {
        return std::max(attack - defense * DefenseWeight, MinBaseDamage);
    }

    auto DamageCalculator::RollHit(double const base, SeededRandom& rng) -> DamageRoll
    {
        DamageRoll roll{.base = base};
        if (rng.Next() < GlancingChance)
        {
            roll.kind = HitKind::Glancing;
            roll.multiplier = GlancingMultiplier;
        }
        else if (rng.Next() < CriticalChance)
        {
            roll.kind = HitKind::Critical;
            roll.multiplier = CriticalMultiplier;
        }
        else
        {
            roll.kind = HitKind::Normal;
            roll.variance = VarianceFloor + rng.Next() * VarianceSpan;
            roll.multiplier = roll.variance;
        }

        roll.damage = std::max(1, static_cast<int>(std::lround(base * roll.multiplier)));
        roll.log = fmt::format("{} (variance {:+.1f}%)", ToString(roll.kind), (roll.variance - 1.0) * 100.0);
        return roll;
    }

    auto DamageCalculator::Calculate(StatSet const& attacker, StatSet const& defender, Stat const attack_stat,
                                     Stat const defense_stat, SeededRandom& rng) -> DamageRoll
    {
        return RollHit(BaseDamage(attacker[attack_stat], defender[defense_stat]), rng);
    }

    auto DamageCalculator::Calculate(Card const& attacker, Card const& defender, Stat const attack_stat,
                                     Stat const defense_stat, SeededRandom& rng) -> DamageRoll
    {
        return Calculate(attacker.stats, defender.stats, attack_stat, defense_stat, rng);
    }
}
