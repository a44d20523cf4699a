//
// Created on 08/10/2025.
//

#ifndef DADDECK_DAMAGE_HPP
#define DADDECK_DAMAGE_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "Card.hpp"
#include "SeededRandom.hpp"
#include "Types.hpp"

namespace daddeck::core
{
    inline constexpr double MinBaseDamage = 5.0;
    inline constexpr double DefenseWeight = 0.5;
    inline constexpr double GlancingChance = 0.10;
    inline constexpr double GlancingMultiplier = 0.5;
    inline constexpr double CriticalChance = 0.05;
    inline constexpr double CriticalMultiplier = 1.5;
    inline constexpr double VarianceFloor = 0.8;
    inline constexpr double VarianceSpan = 0.4;

    enum class HitKind : uint8_t
    {
        Normal = 0,
        Critical,
        Glancing
    };

    auto ToString(HitKind k) -> std::string_view;

    struct DamageRoll
    {
        double base{0.0};
        HitKind kind{HitKind::Normal};
        double multiplier{1.0}; // the variance factor on a normal hit
        double variance{1.0};   // 1.0 on critical and glancing hits
        int damage{1};          // >= 1
        std::string log;
    };

    class DamageCalculator final
    {
    public:
        // max(atk - def * 0.5, 5)
        static auto BaseDamage(double attack, double defense) noexcept -> double;

        // Glancing (10%) first, then critical (5%), otherwise +/-20% variance.
        static auto RollHit(double base, SeededRandom& rng) -> DamageRoll;

        static auto Calculate(StatSet const& attacker, StatSet const& defender, Stat attack_stat,
                              Stat defense_stat, SeededRandom& rng) -> DamageRoll;

        static auto Calculate(Card const& attacker, Card const& defender, Stat attack_stat, Stat defense_stat,
                              SeededRandom& rng) -> DamageRoll;
    };
}

#endif //DADDECK_DAMAGE_HPP
