//
// Created on 07/10/2025.
//

#include <gtest/gtest.h>

#include <vector>

#include "../core/StatusEffects.hpp"
#include "TestCards.hpp"

using namespace daddeck::core;

namespace
{
    auto Effect(StatusKind const k, uint32_t const duration, uint8_t const stacks = 1) -> StatusEffect
    {
        return StatusEffect{.kind = k, .duration = duration, .stacks = stacks};
    }
}

TEST(StatusEffects, Grilled_Cuts_Grill_And_FixIt_Only)
{
    StatSet base = StatSet::Uniform(50.0);
    base[Stat::GrillSkill] = 90.0;
    std::vector const effects{Effect(StatusKind::Grilled, 2)};

    auto const out = StatusEffectEngine::ApplyEffects(base, effects);
    EXPECT_NEAR(out[Stat::GrillSkill], 72.0, 1e-9);
    EXPECT_NEAR(out[Stat::FixIt], 40.0, 1e-9);
    EXPECT_DOUBLE_EQ(out[Stat::DadJoke], 50.0);
    EXPECT_DOUBLE_EQ(out[Stat::BeerSnob], 50.0);
}

TEST(StatusEffects, Lectured_Cuts_Joke_And_Remote)
{
    std::vector const effects{Effect(StatusKind::Lectured, 2)};
    auto const out = StatusEffectEngine::ApplyEffects(StatSet::Uniform(50.0), effects);
    EXPECT_NEAR(out[Stat::DadJoke], 40.0, 1e-9);
    EXPECT_NEAR(out[Stat::RemoteControl], 40.0, 1e-9);
    EXPECT_DOUBLE_EQ(out[Stat::GrillSkill], 50.0);
}

TEST(StatusEffects, Second_Stack_Is_Half_As_Strong)
{
    EXPECT_DOUBLE_EQ(StatusEffectEngine::StackScale(1), 1.0);
    EXPECT_DOUBLE_EQ(StatusEffectEngine::StackScale(2), 1.5);
    EXPECT_DOUBLE_EQ(StatusEffectEngine::StackScale(9), 1.5);

    StatSet base{};
    base[Stat::GrillSkill] = 90.0;
    std::vector const effects{Effect(StatusKind::Grilled, 2, 2)};
    EXPECT_NEAR(StatusEffectEngine::ApplyEffects(base, effects)[Stat::GrillSkill], 63.0, 1e-9);
}

TEST(StatusEffects, Wired_Boost_Is_Clamped)
{
    std::vector const effects{Effect(StatusKind::Wired, 2, 2)};
    auto const out = StatusEffectEngine::ApplyEffects(StatSet::Uniform(80.0), effects);
    for (auto const s : AllStats) EXPECT_DOUBLE_EQ(out[s], 100.0) << ToString(s);

    std::vector const single{Effect(StatusKind::Wired, 2)};
    EXPECT_NEAR(StatusEffectEngine::ApplyEffects(StatSet::Uniform(60.0), single)[Stat::NapPower], 78.0, 1e-9);
}

TEST(StatusEffects, Legacy_Kinds_Change_Nothing)
{
    std::vector const effects{Effect(StatusKind::Drunk, 2), Effect(StatusKind::Awkward, 2),
                              Effect(StatusKind::Bored, 2), Effect(StatusKind::Inspired, 3)};
    StatSet const base{{10, 20, 30, 40, 50, 60, 70, 80}};
    EXPECT_EQ(StatusEffectEngine::ApplyEffects(base, effects), base);
}

TEST(StatusEffects, Card_Overload_Leaves_The_Card_Alone)
{
    auto const card = daddeck::test::Uniform("g", Category::BbqDicktator, Rarity::Common, 90.0);
    std::vector const effects{Effect(StatusKind::Grilled, 2)};
    auto const out = StatusEffectEngine::ApplyEffects(*card, effects);
    EXPECT_NEAR(out[Stat::GrillSkill], 72.0, 1e-9);
    EXPECT_DOUBLE_EQ(card->stats[Stat::GrillSkill], 90.0);
}

TEST(StatusEffects, Tick_Decrements_And_Drops_Expired)
{
    std::vector const effects{Effect(StatusKind::Grilled, 1), Effect(StatusKind::Wired, 3, 2)};
    auto const out = StatusEffectEngine::Tick(effects);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], Effect(StatusKind::Wired, 2, 2));
    EXPECT_EQ(effects[0].duration, 1u);
    EXPECT_TRUE(StatusEffectEngine::Tick(std::vector<StatusEffect>{}).empty());
}

TEST(StatusEffects, Add_Stacks_Up_To_Two_And_Refreshes)
{
    std::vector<StatusEffect> list;
    list = StatusEffectEngine::AddEffect(list, Effect(StatusKind::Grilled, 2));
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].stacks, 1);

    list = StatusEffectEngine::Tick(list);
    list = StatusEffectEngine::AddEffect(list, Effect(StatusKind::Grilled, 2));
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].stacks, 2);
    EXPECT_EQ(list[0].duration, 2u);

    list = StatusEffectEngine::AddEffect(list, Effect(StatusKind::Grilled, 3));
    EXPECT_EQ(list[0].stacks, 2);
    EXPECT_EQ(list[0].duration, 3u);

    list = StatusEffectEngine::AddEffect(list, Effect(StatusKind::Drunk, 2));
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[1].kind, StatusKind::Drunk);
}

TEST(StatusEffects, Find_And_FromName)
{
    std::vector const effects{Effect(StatusKind::Lectured, 2)};
    EXPECT_TRUE(StatusEffectEngine::Find(effects, StatusKind::Lectured).has_value());
    EXPECT_FALSE(StatusEffectEngine::Find(effects, StatusKind::Grilled).has_value());

    auto const e = StatusEffectEngine::FromName("drunk", 4);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(*e, Effect(StatusKind::Drunk, 4));
    EXPECT_FALSE(StatusEffectEngine::FromName("hungover", 2).has_value());
}
