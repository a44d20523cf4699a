//
// Created on 04/10/2025.
//

#ifndef DADDECK_CARD_HPP
#define DADDECK_CARD_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "Types.hpp"

namespace daddeck::core
{
    struct Ability
    {
        std::string name;
        std::string description;
    };

    // Immutable once built; share it, never copy it.
    struct Card
    {
        Card(std::string id_, std::string name_, Category category_, Rarity rarity_, StatSet stats_,
             std::vector<Ability> abilities_ = {}, std::string subtitle_ = {});

        Card(Card const&) = delete;
        auto operator=(Card const&) -> Card& = delete;

        std::string const id;
        std::string const name;
        std::string const subtitle;
        Category const category;
        Rarity const rarity;
        StatSet const stats;
        std::vector<Ability> const abilities;
    };

    using CCardSP = std::shared_ptr<Card const>;

    inline auto MakeCard(std::string id, std::string name, Category category, Rarity rarity, StatSet stats,
                         std::vector<Ability> abilities = {}, std::string subtitle = {}) -> CCardSP
    {
        return std::make_shared<Card const>(std::move(id), std::move(name), category, rarity, stats,
                                            std::move(abilities), std::move(subtitle));
    }
}

#endif //DADDECK_CARD_HPP
