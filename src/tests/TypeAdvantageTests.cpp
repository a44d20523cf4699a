//
// Created on 05/10/2025.
//

#include <gtest/gtest.h>

#include <algorithm>

#include "../core/TypeAdvantage.hpp"
#include "../debug/Invariants.hpp"

using namespace daddeck::core;

TEST(TypeAdvantage, Bbq_Beats_Golf)
{
    EXPECT_DOUBLE_EQ(TypeAdvantageMatrix::Advantage(Category::BbqDicktator, Category::GolfGonad), 1.2);
    EXPECT_DOUBLE_EQ(TypeAdvantageMatrix::Advantage(Category::GolfGonad, Category::BbqDicktator), 0.8);
}

TEST(TypeAdvantage, Name_Lookup_Matches_Enum_Lookup)
{
    EXPECT_DOUBLE_EQ(TypeAdvantageMatrix::Advantage("BBQ_DICKTATOR", "GOLF_GONAD"), 1.2);
    EXPECT_DOUBLE_EQ(TypeAdvantageMatrix::Advantage("GOLF_GONAD", "BBQ_DICKTATOR"), 0.8);
}

TEST(TypeAdvantage, Unknown_Names_Are_Neutral)
{
    EXPECT_DOUBLE_EQ(TypeAdvantageMatrix::Advantage("BBQ_DAD", "GOLF_GONAD"), 1.0);
    EXPECT_DOUBLE_EQ(TypeAdvantageMatrix::Advantage("BBQ_DICKTATOR", ""), 1.0);
}

TEST(TypeAdvantage, Every_Pair_Is_Symmetric)
{
    for (auto const a : AllCategories)
    {
        for (auto const d : AllCategories)
        {
            double const fwd = TypeAdvantageMatrix::Advantage(a, d);
            double const back = TypeAdvantageMatrix::Advantage(d, a);
            if (fwd == 1.2) EXPECT_DOUBLE_EQ(back, 0.8) << ToString(a) << " vs " << ToString(d);
            else if (fwd == 0.8) EXPECT_DOUBLE_EQ(back, 1.2) << ToString(a) << " vs " << ToString(d);
            else EXPECT_DOUBLE_EQ(back, 1.0) << ToString(a) << " vs " << ToString(d);
        }
    }
}

TEST(TypeAdvantage, Every_Category_Has_Two_Two_Ten)
{
    for (auto const c : AllCategories)
    {
        auto const wins = TypeAdvantageMatrix::AdvantagesOf(c);
        auto const losses = TypeAdvantageMatrix::DisadvantagesOf(c);
        auto const neutral = TypeAdvantageMatrix::NeutralsOf(c);
        EXPECT_EQ(wins.size(), 2u) << ToString(c);
        EXPECT_EQ(losses.size(), 2u) << ToString(c);
        EXPECT_EQ(neutral.size(), 10u) << ToString(c);
        EXPECT_EQ(std::ranges::count(neutral, c), 0) << ToString(c);
    }
}

TEST(TypeAdvantage, Self_Matchup_Is_Neutral)
{
    for (auto const c : AllCategories)
    {
        EXPECT_DOUBLE_EQ(TypeAdvantageMatrix::Advantage(c, c), 1.0);
        EXPECT_FALSE(TypeAdvantageMatrix::Beats(c, c));
    }
}

TEST(TypeAdvantage, Canonical_Rows)
{
    auto const bbq = TypeAdvantageMatrix::AdvantagesOf(Category::BbqDicktator);
    EXPECT_EQ(bbq, (std::vector{Category::GolfGonad, Category::CouchCummander}));

    auto const tech_losses = TypeAdvantageMatrix::DisadvantagesOf(Category::TechTwats);
    EXPECT_EQ(tech_losses, (std::vector{Category::FixItFuckboy, Category::CoachCumsters}));
}

TEST(TypeAdvantage, Matrix_Validates_Clean)
{
    EXPECT_TRUE(TypeAdvantageMatrix::Validate().empty());
    EXPECT_NO_THROW(daddeck::core::debug::CheckMatrix());
}
