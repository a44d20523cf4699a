//
// Created on 05/10/2025.
//

#ifndef DADDECK_CARDPOWER_HPP
#define DADDECK_CARDPOWER_HPP

#include <array>

#include "Card.hpp"
#include "Types.hpp"

namespace daddeck::core
{
    inline constexpr std::array<double, constants::RarityCount> RarityMultipliers{
        1.0, // common
        1.2, // uncommon
        1.5, // rare
        1.8, // epic
        2.2, // legendary
        3.0  // mythic
    };

    class CardPowerCalculator final
    {
    public:
        static constexpr auto RarityMultiplier(Rarity const r) noexcept -> double
        {
            return RarityMultipliers[Idx(r)];
        }

        // Plain mean of the 8 stats; the normalized power used for decks.
        static auto Power(StatSet const& stats) noexcept -> double;

        // Mean stat times the rarity multiplier, unrounded.
        static auto Power(Card const& card) noexcept -> double;
    };
}

#endif //DADDECK_CARDPOWER_HPP
