//
// Created on 05/10/2025.
//

#include "CardPower.hpp"

#include <numeric>

namespace daddeck::core
{
    auto CardPowerCalculator::Power(StatSet const& stats) noexcept -> double
    {
        double const total = std::accumulate(stats.values.begin(), stats.values.end(), 0.0);
        return total / static_cast<double>(constants::StatCount);
    }

    auto CardPowerCalculator::Power(Card const& card) noexcept -> double
    {
        return Power(card.stats) * RarityMultiplier(card.rarity);
    }
}
