//
// Created on 05/10/2025.
//

#include "TypeAdvantage.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace daddeck::core
{
    namespace
    {
        using C = Category;

        // Row i lists the two categories that category i beats.
        constexpr std::array<std::array<Category, 2>, constants::CategoryCount> BeatsTable{{
            {C::GolfGonad, C::CouchCummander},          // BBQ_DICKTATOR
            {C::TechTwats, C::CarCock},                 // FIX_IT_FUCKBOY
            {C::CoachCumsters, C::CoolCucks},           // GOLF_GONAD
            {C::OfficeOrgasms, C::ChefCumsters},        // COUCH_CUMMANDER
            {C::WarehouseWankers, C::ChefCumsters},     // LAWN_LUNATIC
            {C::FashionFuck, C::HolidayHorndogs},       // CAR_COCK
            {C::CarCock, C::LawnLunatic},               // OFFICE_ORGASMS
            {C::FashionFuck, C::CoachCumsters},         // COOL_CUCKS
            {C::TechTwats, C::FixItFuckboy},            // COACH_CUMSTERS
            {C::BbqDicktator, C::HolidayHorndogs},      // CHEF_CUMSTERS
            {C::LawnLunatic, C::CouchCummander},        // HOLIDAY_HORNDOGS
            {C::VintageVagabonds, C::BbqDicktator},     // WAREHOUSE_WANKERS
            {C::CoolCucks, C::FixItFuckboy},            // VINTAGE_VAGABONDS
            {C::WarehouseWankers, C::OfficeOrgasms},    // FASHION_FUCK
            {C::GolfGonad, C::VintageVagabonds},        // TECH_TWATS
        }};

        constexpr auto BeatsImpl(Category const a, Category const d) -> bool
        {
            auto const& row = BeatsTable[Idx(a)];
            return row[0] == d || row[1] == d;
        }

        constexpr auto LossCount(Category const c) -> size_t
        {
            size_t n = 0;
            for (auto const other : AllCategories)
            {
                if (BeatsImpl(other, c)) ++n;
            }
            return n;
        }

        constexpr auto IsBalanced() -> bool
        {
            for (auto const c : AllCategories)
            {
                auto const& row = BeatsTable[Idx(c)];
                if (row[0] == row[1] || row[0] == c || row[1] == c) return false;
                if (BeatsImpl(row[0], c) || BeatsImpl(row[1], c)) return false;
                if (LossCount(c) != 2) return false;
            }
            return true;
        }

        static_assert(IsBalanced(), "type advantage table must give every category 2 wins and 2 losses");

        template <typename Pred>
        auto Collect(Pred pred) -> std::vector<Category>
        {
            std::vector<Category> out;
            for (auto const c : AllCategories)
            {
                if (pred(c)) out.push_back(c);
            }
            return out;
        }
    }

    auto TypeAdvantageMatrix::Beats(Category const attacker, Category const defender) noexcept -> bool
    {
        return BeatsImpl(attacker, defender);
    }

    auto TypeAdvantageMatrix::Advantage(Category const attacker, Category const defender) noexcept -> double
    {
        if (BeatsImpl(attacker, defender)) return AdvantageMultiplier;
        if (BeatsImpl(defender, attacker)) return DisadvantageMultiplier;
        return NeutralMultiplier;
    }

    auto TypeAdvantageMatrix::Advantage(std::string_view const attacker, std::string_view const defender) noexcept
        -> double
    {
        auto const a = CategoryFromName(attacker);
        auto const d = CategoryFromName(defender);
        if (!a || !d) return NeutralMultiplier;
        return Advantage(*a, *d);
    }

    auto TypeAdvantageMatrix::AdvantagesOf(Category const c) -> std::vector<Category>
    {
        return Collect([c](Category const o) { return BeatsImpl(c, o); });
    }

    auto TypeAdvantageMatrix::DisadvantagesOf(Category const c) -> std::vector<Category>
    {
        return Collect([c](Category const o) { return BeatsImpl(o, c); });
    }

    auto TypeAdvantageMatrix::NeutralsOf(Category const c) -> std::vector<Category>
    {
        return Collect([c](Category const o) { return o != c && !BeatsImpl(c, o) && !BeatsImpl(o, c); });
    }

    auto TypeAdvantageMatrix::Validate() -> std::vector<std::string>
    {
        std::vector<std::string> problems;
        for (auto const c : AllCategories)
        {
            auto const wins = AdvantagesOf(c).size();
            auto const losses = DisadvantagesOf(c).size();
            auto const neutral = NeutralsOf(c).size();
            if (wins != 2 || losses != 2 || neutral != constants::CategoryCount - 5)
            {
                problems.push_back(fmt::format("{}: {} advantages, {} disadvantages, {} neutrals",
                                               ToString(c), wins, losses, neutral));
            }
            if (BeatsImpl(c, c))
            {
                problems.push_back(fmt::format("{} beats itself", ToString(c)));
            }
            for (auto const o : AllCategories)
            {
                // report each mutual pair once
                if (Idx(c) < Idx(o) && BeatsImpl(c, o) && BeatsImpl(o, c))
                {
                    problems.push_back(fmt::format("{} and {} beat each other", ToString(c), ToString(o)));
                }
            }
        }
        return problems;
    }
}
