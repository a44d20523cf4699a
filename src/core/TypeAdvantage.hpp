//
// Created on 05/10/2025.
//

#ifndef DADDECK_TYPEADVANTAGE_HPP
#define DADDECK_TYPEADVANTAGE_HPP

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "Types.hpp"

namespace daddeck::core
{
    inline constexpr double AdvantageMultiplier = 1.2;
    inline constexpr double DisadvantageMultiplier = 0.8;
    inline constexpr double NeutralMultiplier = 1.0;

    class TypeAdvantageMatrix final
    {
    public:
        // 1.2 when the attacker beats the defender, 0.8 when it is the other way round.
        static auto Advantage(Category attacker, Category defender) noexcept -> double;

        // Unknown names are neutral.
        static auto Advantage(std::string_view attacker, std::string_view defender) noexcept -> double;

        static auto Beats(Category attacker, Category defender) noexcept -> bool;

        static auto AdvantagesOf(Category c) -> std::vector<Category>;
        static auto DisadvantagesOf(Category c) -> std::vector<Category>;
        static auto NeutralsOf(Category c) -> std::vector<Category>;

        // Empty when every category has 2 wins, 2 losses, 10 neutrals and no pair is mutual.
        static auto Validate() -> std::vector<std::string>;
    };
}

#endif //DADDECK_TYPEADVANTAGE_HPP
