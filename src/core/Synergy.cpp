//
// Created on 08/10/2025.
//

#include "Synergy.hpp"

#include <algorithm>
#include <array>

#include <fmt/format.h>

namespace daddeck::core
{
    namespace
    {
        struct PairRule
        {
            std::string_view name;
            std::string_view description;
            double bonus;
            bool (*matches)(Card const&, Card const&);
        };

        template <std::size_t N>
        auto BothIn(std::array<Category, N> const& set, Card const& a, Card const& b) -> bool
        {
            return std::ranges::find(set, a.category) != set.end() && std::ranges::find(set, b.category) != set.end();
        }

        constexpr std::array<Category, 2> Cookout{Category::BbqDicktator, Category::ChefCumsters};
        constexpr std::array<Category, 3> Hoa{Category::LawnLunatic, Category::CarCock, Category::WarehouseWankers};

        constexpr std::array<PairRule, 4> PairRules{{
            {"Mythic Alliance", "Two mythic dads unite", MythicAllianceBonus,
             [](Card const& a, Card const& b) { return a.rarity == Rarity::Mythic && b.rarity == Rarity::Mythic; }},
            {"Ultimate Cookout", "Grill and kitchen work the same backyard", PairBonus,
             [](Card const& a, Card const& b) { return BothIn(Cookout, a, b); }},
            {"HOA Nightmares", "Lawn, garage and warehouse dads file complaints together", PairBonus,
             [](Card const& a, Card const& b) { return BothIn(Hoa, a, b); }},
            {"Infinite Nap", "Two couches, zero productivity", PairBonus,
             [](Card const& a, Card const& b)
             {
                 return a.category == Category::CouchCummander && b.category == Category::CouchCummander;
             }},
        }};
    }

    auto SynergyCalculator::ThemePrefix(Category const c) -> std::string
    {
        std::string_view const name = ToString(c);
        auto const cut = name.rfind('_');
        return std::string{cut == std::string_view::npos ? name : name.substr(0, cut)};
    }

    auto SynergyCalculator::DeckWide(Deck const& deck) -> DeckSynergy
    {
        auto const& stats = deck.Stats();
        auto const main = stats.MainType();
        auto const count = stats.CountOf(main);

        double multiplier = NoSynergy;
        std::string_view percent;
        if (count >= 5)
        {
            multiplier = FullThemeBonus;
            percent = "+15%";
        }
        else if (count >= 3)
        {
            multiplier = SmallThemeBonus;
            percent = "+5%";
        }
        else
        {
            return DeckSynergy{};
        }

        auto const prefix = ThemePrefix(main);
        std::string spaced = prefix;
        std::ranges::replace(spaced, '_', ' ');
        return DeckSynergy{
            .multiplier = multiplier,
            .theme = fmt::format("{}_BROS", prefix),
            .description = fmt::format("{} BROS SYNERGY {}", spaced, percent),
        };
    }

    auto SynergyCalculator::CheckSynergy(Card const& a, Card const& b) -> PairSynergy
    {
        for (auto const& rule : PairRules)
        {
            if (rule.matches(a, b))
            {
                return PairSynergy{
                    .has_synergy = true,
                    .bonus = rule.bonus,
                    .name = std::string{rule.name},
                    .description = std::string{rule.description},
                };
            }
        }
        return PairSynergy{};
    }

    auto SynergyCalculator::BestCrossSynergy(Deck const& a, Deck const& b) -> PairSynergy
    {
        PairSynergy best{};
        for (auto const& ea : a.Entries())
        {
            for (auto const& eb : b.Entries())
            {
                auto s = CheckSynergy(*ea.card, *eb.card);
                if (s.bonus > best.bonus) best = std::move(s);
            }
        }
        return best;
    }
}
