//
// Created on 08/10/2025.
//

#ifndef DADDECK_SYNERGY_HPP
#define DADDECK_SYNERGY_HPP

#include <string>

#include "Card.hpp"
#include "Deck.hpp"

namespace daddeck::core
{
    inline constexpr double NoSynergy = 1.0;
    inline constexpr double SmallThemeBonus = 1.05;  // 3+ of a category
    inline constexpr double FullThemeBonus = 1.15;   // 5+ of a category
    inline constexpr double PairBonus = 1.3;
    inline constexpr double MythicAllianceBonus = 2.0;

    struct DeckSynergy
    {
        double multiplier{NoSynergy};
        std::string theme;       // e.g. BBQ_BROS, empty when none
        std::string description; // e.g. "BBQ BROS SYNERGY +15%"
    };

    struct PairSynergy
    {
        bool has_synergy{false};
        double bonus{NoSynergy};
        std::string name;
        std::string description;
    };

    class SynergyCalculator final
    {
    public:
        static auto DeckWide(Deck const& deck) -> DeckSynergy;

        // Ordered: the first matching rule wins.
        static auto CheckSynergy(Card const& a, Card const& b) -> PairSynergy;

        // Highest pairwise bonus of any card in `a` with any card in `b`.
        static auto BestCrossSynergy(Deck const& a, Deck const& b) -> PairSynergy;

        // BBQ_DICKTATOR -> BBQ, FIX_IT_FUCKBOY -> FIX_IT
        static auto ThemePrefix(Category c) -> std::string;
    };
}

#endif //DADDECK_SYNERGY_HPP
