//
// Created on 15/10/2025.
//

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../core/DeckBattle.hpp"
#include "TestCards.hpp"

using namespace daddeck::core;
using daddeck::test::SingleCardDeck;
using daddeck::test::Uniform;

namespace
{
    auto Garage() -> CDeckSP
    {
        return SingleCardDeck("a", Uniform("car", Category::CarCock, Rarity::Common, 70.0), 3);
    }

    auto Kitchen() -> CDeckSP
    {
        return SingleCardDeck("d", Uniform("chef", Category::ChefCumsters, Rarity::Common, 50.0), 5);
    }
}

TEST(DeckBattle, Stronger_Themed_Deck_Wins)
{
    auto const a = Garage();
    auto const d = Kitchen();
    auto const r = DeckBattleResolver::Resolve(a, d, 12345);

    EXPECT_EQ(r.winner, a);
    EXPECT_EQ(r.loser, d);
    EXPECT_EQ(r.winner_side, Side::Attacker);
    EXPECT_DOUBLE_EQ(r.type_advantage, 1.0);
    EXPECT_DOUBLE_EQ(r.synergy_bonus, 1.05);
    EXPECT_DOUBLE_EQ(r.attacker_stats.total_power, 70.0);
    EXPECT_DOUBLE_EQ(r.defender_stats.total_power, 50.0);
    EXPECT_NEAR(r.attacker_stats.final_power, 73.5, 1e-9);
    EXPECT_EQ(r.hit, HitKind::Normal);
    EXPECT_EQ(r.damage, 48);
    EXPECT_EQ(r.seed, 12345u);
}

TEST(DeckBattle, Log_Tells_The_Whole_Story)
{
    auto const r = DeckBattleResolver::Resolve(Garage(), Kitchen(), 12345);
    std::vector<std::string> const expected{
        "BATTLE: Deck a (3 cards) vs Deck d (5 cards)",
        "Attacker normalized power: 70.0",
        "Defender normalized power: 50.0",
        "No type advantage",
        "CAR BROS SYNERGY +5%",
        "Final attacker power: 73.5",
        "RNG System:",
        "  Normal hit",
        "  Variance: -0.6%",
        "  Base damage: 48",
        "  Final damage: 48",
        "Winner: Deck a",
    };
    EXPECT_EQ(r.log, expected);
}

TEST(DeckBattle, Same_Seed_Same_Verdict)
{
    auto const a = Garage();
    auto const d = Kitchen();
    auto const first = DeckBattleResolver::Resolve(a, d, 12345);
    auto const second = DeckBattleResolver::Resolve(a, d, 12345);
    EXPECT_EQ(first.winner, second.winner);
    EXPECT_EQ(first.damage, second.damage);
    EXPECT_EQ(first.log, second.log);

    auto const unseeded = DeckBattleResolver::Resolve(a, d);
    auto const replay = DeckBattleResolver::Resolve(a, d, unseeded.seed);
    EXPECT_EQ(unseeded.log, replay.log);
}

TEST(DeckBattle, Roll_Never_Flips_The_Winner)
{
    auto const a = Garage();
    auto const d = Kitchen();
    for (uint64_t seed = 0; seed < 100; ++seed)
    {
        auto const r = DeckBattleResolver::Resolve(a, d, seed);
        ASSERT_EQ(r.winner_side, Side::Attacker) << "seed " << seed;
        ASSERT_GE(r.damage, 1);
    }
}

TEST(DeckBattle, Ties_Go_To_The_Defender)
{
    auto const a = SingleCardDeck("a", Uniform("g1", Category::GolfGonad, Rarity::Common, 50.0), 1);
    auto const d = SingleCardDeck("d", Uniform("g2", Category::GolfGonad, Rarity::Common, 50.0), 1);
    auto const r = DeckBattleResolver::Resolve(a, d, 1);
    EXPECT_EQ(r.winner_side, Side::Defender);
    EXPECT_EQ(r.winner, d);
    EXPECT_EQ(r.log.back(), "Winner: Deck d");
}

TEST(DeckBattle, Type_Advantage_Lifts_The_Attacker)
{
    auto const a = SingleCardDeck("a", Uniform("b", Category::BbqDicktator, Rarity::Common, 50.0), 1);
    auto const d = SingleCardDeck("d", Uniform("g", Category::GolfGonad, Rarity::Common, 50.0), 1);
    auto const r = DeckBattleResolver::Resolve(a, d, 3);
    EXPECT_DOUBLE_EQ(r.type_advantage, 1.2);
    EXPECT_EQ(r.winner_side, Side::Attacker);
    EXPECT_EQ(r.log[3], "BBQ_DICKTATOR has advantage over GOLF_GONAD! (+20% damage)");
}

TEST(DeckBattle, Rarity_Does_Not_Count)
{
    auto const a = SingleCardDeck("a", Uniform("m", Category::GolfGonad, Rarity::Mythic, 50.0), 1);
    auto const d = SingleCardDeck("d", Uniform("c", Category::GolfGonad, Rarity::Common, 50.0), 1);
    auto const r = DeckBattleResolver::Resolve(a, d, 3);
    EXPECT_DOUBLE_EQ(r.attacker_stats.total_power, 50.0);
    EXPECT_EQ(r.winner_side, Side::Defender);
}
