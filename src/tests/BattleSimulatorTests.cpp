//
// Created on 12/10/2025.
//

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <memory>
#include <string>

#include "../core/BattleSimulator.hpp"
#include "../core/CardPower.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingTactic.hpp"
#include "TestCards.hpp"

using namespace daddeck::core;
using daddeck::test::Uniform;

namespace
{
    auto Seeded(uint64_t const seed, uint32_t const max_turns = constants::MaxTurns) -> Config
    {
        Config cfg{};
        cfg.seed = seed;
        cfg.max_turns = max_turns;
        return cfg;
    }

    auto Contains(std::vector<std::string> const& log, std::string const& needle) -> bool
    {
        return std::ranges::any_of(log, [&](std::string const& l) { return l.find(needle) != std::string::npos; });
    }

    auto TwoMoves() -> std::vector<Ability>
    {
        return {{"Dad Joke", "Knock knock."}, {"Sock Tan", "Blinding."}};
    }

    // Always reaches for an ability nobody has.
    class FumbleTactic final : public Tactic
    {
    public:
        auto ChooseAbility(std::shared_ptr<CombatSnapshot const>) -> std::size_t override { return 99; }
    };
}

TEST(BattleSimulator, Same_Seed_Same_Battle)
{
    auto const a = Uniform("a", Category::BbqDicktator, Rarity::Rare, 60.0);
    auto const b = Uniform("b", Category::HolidayHorndogs, Rarity::Rare, 60.0);

    BattleSimulator first{Seeded(99), a, b};
    BattleSimulator second{Seeded(99), a, b};
    auto const r1 = first.Run();
    auto const r2 = second.Run();
    EXPECT_EQ(r1.log, r2.log);
    EXPECT_EQ(r1.turns, r2.turns);
    EXPECT_EQ(r1.winner, r2.winner);
}

TEST(BattleSimulator, Header_Lines)
{
    auto const a = Uniform("a", Category::BbqDicktator, Rarity::Legendary, 100.0);
    auto const b = Uniform("b", Category::GolfGonad, Rarity::Legendary, 100.0);
    BattleSimulator sim{Seeded(5), a, b};

    EXPECT_EQ(sim.Step(), TurnOutcome::Started);
    auto const& log = sim.Log();
    ASSERT_EQ(log.size(), 4u);
    EXPECT_EQ(log[0], "BATTLE: Card a vs Card b!");
    EXPECT_EQ(log[1], "Card a HP: 2200.0");
    EXPECT_EQ(log[2], "Card b HP: 2200.0");
    EXPECT_EQ(log[3], "BBQ_DICKTATOR has advantage over GOLF_GONAD! (+20% damage)");
    EXPECT_EQ(sim.TurnsTaken(), 0u);
}

TEST(BattleSimulator, Knockout_In_One_Turn)
{
    auto const big = Uniform("big", Category::GolfGonad, Rarity::Legendary, 100.0);
    auto const tiny = Uniform("tiny", Category::GolfGonad, Rarity::Common, 1.0);

    auto const r = BattleSimulator{Seeded(11), big, tiny}.Run();
    EXPECT_EQ(r.winner, big);
    EXPECT_EQ(r.loser, tiny);
    EXPECT_EQ(r.winner_side, Side::Attacker);
    EXPECT_EQ(r.turns, 1u);
    EXPECT_LE(r.remaining_hp[Idx(Side::Defender)], 0.0);
    EXPECT_EQ(r.log.back(), "Card big wins in 1 turns!");
}

TEST(BattleSimulator, Powerless_Card_Loses_Before_A_Swing)
{
    auto const zero = Uniform("zero", Category::GolfGonad, Rarity::Common, 0.0);
    auto const b = Uniform("b", Category::GolfGonad, Rarity::Common, 40.0);

    auto const r = BattleSimulator{Seeded(1), zero, b}.Run();
    EXPECT_EQ(r.winner, b);
    EXPECT_EQ(r.winner_side, Side::Defender);
    EXPECT_EQ(r.turns, 0u);
    EXPECT_EQ(r.log.back(), "Time's up! Card b wins by HP!");
}

TEST(BattleSimulator, Turn_Cap_Ends_By_Hp)
{
    auto const a = Uniform("a", Category::GolfGonad, Rarity::Legendary, 100.0);
    auto const b = Uniform("b", Category::GolfGonad, Rarity::Legendary, 100.0);

    BattleSimulator sim{Seeded(21, 3), a, b};
    EXPECT_EQ(sim.TurnCap(), 3u);
    auto const r = sim.Run();
    EXPECT_EQ(r.turns, 3u);
    EXPECT_EQ(r.log.back().rfind("Time's up! ", 0), 0u);

    double const hp_a = r.remaining_hp[Idx(Side::Attacker)];
    double const hp_b = r.remaining_hp[Idx(Side::Defender)];
    EXPECT_EQ(r.winner_side, hp_a >= hp_b ? Side::Attacker : Side::Defender);
}

TEST(BattleSimulator, Config_Can_Only_Lower_The_Cap)
{
    auto const a = Uniform("a", Category::GolfGonad, Rarity::Common, 50.0);
    auto const b = Uniform("b", Category::GolfGonad, Rarity::Common, 50.0);
    BattleSimulator sim{Seeded(1, 50), a, b};
    EXPECT_EQ(sim.TurnCap(), constants::MaxTurns);
    EXPECT_LE(sim.Run().turns, constants::MaxTurns);
}

TEST(BattleSimulator, Stepping_A_Finished_Battle_Throws)
{
    auto const a = Uniform("a", Category::GolfGonad, Rarity::Common, 50.0);
    auto const b = Uniform("b", Category::GolfGonad, Rarity::Common, 50.0);
    BattleSimulator sim{Seeded(3), a, b};

    EXPECT_THROW((void)sim.Result(), error::StateError);
    (void)sim.Run();
    EXPECT_EQ(sim.PhaseNow(), BattlePhase::Ended);
    EXPECT_THROW((void)sim.Step(), error::StateError);
}

TEST(BattleSimulator, Roles_Swap_Every_Turn)
{
    auto const a = Uniform("a", Category::GolfGonad, Rarity::Legendary, 100.0);
    auto const b = Uniform("b", Category::GolfGonad, Rarity::Legendary, 100.0);
    BattleSimulator sim{Seeded(8), a, b};

    sim.Step();
    EXPECT_EQ(sim.Active(), Side::Attacker);
    sim.Step();
    EXPECT_EQ(sim.Active(), Side::Defender);
    sim.Step();
    EXPECT_EQ(sim.Active(), Side::Attacker);
    EXPECT_EQ(sim.TurnsTaken(), 2u);
}

TEST(BattleSimulator, Tactics_See_Their_Own_Side)
{
    auto const a = Uniform("a", Category::GolfGonad, Rarity::Legendary, 100.0, TwoMoves());
    auto const b = Uniform("b", Category::GolfGonad, Rarity::Legendary, 100.0, TwoMoves());

    std::array<std::unique_ptr<Tactic>, 2> tactics{
        std::make_unique<debug::RecordingTactic>(std::make_unique<RotatingTactic>()),
        std::make_unique<debug::RecordingTactic>(std::make_unique<RotatingTactic>()),
    };
    BattleSimulator sim{Seeded(13, 4), a, b, std::move(tactics)};
    (void)sim.Run();

    auto* atk = debug::AsRecording(sim.TacticOf(Side::Attacker));
    auto* def = debug::AsRecording(sim.TacticOf(Side::Defender));
    ASSERT_NE(atk, nullptr);
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(atk->Picks(), (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(def->Picks(), (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(atk->LastTurn(), 3u);
    EXPECT_EQ(def->LastTurn(), 4u);

    auto const snap = sim.SnapshotFor(Side::Defender);
    EXPECT_EQ(snap->me, Side::Defender);
    EXPECT_EQ(snap->self, b);
    EXPECT_EQ(snap->opponent, a);
}

TEST(BattleSimulator, Unknown_Ability_Wastes_The_Turn)
{
    auto const a = Uniform("a", Category::GolfGonad, Rarity::Common, 50.0);
    auto const b = Uniform("b", Category::GolfGonad, Rarity::Common, 50.0);

    std::array<std::unique_ptr<Tactic>, 2> tactics{std::make_unique<FumbleTactic>(), nullptr};
    BattleSimulator sim{Seeded(2), a, b, std::move(tactics)};
    sim.Step();
    sim.Step();

    EXPECT_TRUE(Contains(sim.Log(), "Card a forgot what he was doing."));
    EXPECT_DOUBLE_EQ(sim.HpOf(Side::Defender), CardPowerCalculator::Power(*b) * constants::HpPerPower);
}

TEST(BattleSimulator, Pair_Synergy_Is_Logged)
{
    auto const a = Uniform("a", Category::CouchCummander, Rarity::Legendary, 100.0);
    auto const b = Uniform("b", Category::CouchCummander, Rarity::Legendary, 100.0);
    BattleSimulator sim{Seeded(4, 1), a, b};
    auto const r = sim.Run();
    EXPECT_TRUE(Contains(r.log, "  SYNERGY: Infinite Nap!"));
}

TEST(BattleSimulator, Grilled_Actor_Hits_Softer_Then_Recovers)
{
    auto const bbq = Uniform("bbq", Category::BbqDicktator, Rarity::Common, 80.0,
                             {{"Grill Flare", "Sizzle."}});
    auto const office = Uniform("office", Category::OfficeOrgasms, Rarity::Common, 80.0,
                                {{"Grill Marks", "Perfect crosshatch."}});

    Config cfg = Seeded(2);
    cfg.status_chance = 1.0;
    BattleSimulator sim{cfg, bbq, office};
    sim.Step();

    // grill 80 vs 80: base 40, normal hit at -8.6%
    EXPECT_EQ(sim.Step(), TurnOutcome::Applied);
    EXPECT_DOUBLE_EQ(sim.HpOf(Side::Defender), 800.0 - 37.0);
    EXPECT_TRUE(Contains(sim.Log(), "  -> Card office is grilled"));
    ASSERT_EQ(sim.EffectsOn(Side::Defender).size(), 1u);
    EXPECT_EQ(sim.EffectsOn(Side::Defender)[0].kind, StatusKind::Grilled);
    EXPECT_EQ(sim.EffectsOn(Side::Defender)[0].duration, 1u);
    EXPECT_EQ(sim.EffectsOn(Side::Defender)[0].stacks, 1);

    // grilled grill 64 vs 80: base 24, normal hit at -5.7%; ungrilled would land 38
    EXPECT_EQ(sim.Step(), TurnOutcome::Applied);
    EXPECT_DOUBLE_EQ(sim.HpOf(Side::Attacker), 800.0 - 23.0);
    EXPECT_EQ(sim.Log().back(), "  HP: 777.0 vs 763.0");
    EXPECT_TRUE(Contains(sim.Log(), "  -> 23 damage! Normal hit (variance -5.7%)"));
    EXPECT_TRUE(sim.EffectsOn(Side::Defender).empty());
    EXPECT_TRUE(sim.EffectsOn(Side::Attacker).empty());
}

TEST(BattleSimulator, Drunk_Cards_Sometimes_Miss)
{
    auto const holiday = Uniform("h", Category::HolidayHorndogs, Rarity::Legendary, 100.0);
    auto const golf = Uniform("g", Category::GolfGonad, Rarity::Legendary, 100.0);

    int misses = 0;
    for (uint64_t seed = 1; seed <= 100; ++seed)
    {
        Config cfg = Seeded(seed);
        cfg.status_chance = 1.0;
        BattleSimulator sim{cfg, holiday, golf};
        while (sim.PhaseNow() != BattlePhase::Ended)
        {
            misses += sim.Step() == TurnOutcome::Missed;
        }
        EXPECT_TRUE(Contains(sim.Log(), "  -> Card g is drunk"));
    }
    EXPECT_GT(misses, 0);
}

TEST(BattleSimulator, Invariants_Hold_Every_Step)
{
    std::array const pool{
        Uniform("bbq", Category::BbqDicktator, Rarity::Rare, 70.0),
        Uniform("couch", Category::CouchCummander, Rarity::Uncommon, 65.0),
        Uniform("tech", Category::TechTwats, Rarity::Epic, 55.0),
        Uniform("xmas", Category::HolidayHorndogs, Rarity::Legendary, 45.0),
        Uniform("coach", Category::CoachCumsters, Rarity::Common, 80.0),
    };

    for (uint64_t seed = 1; seed <= 40; ++seed)
    {
        auto const& a = pool[seed % pool.size()];
        auto const& b = pool[(seed / pool.size() + seed + 1) % pool.size()];
        BattleSimulator sim{Seeded(seed), a, b};
        ASSERT_NO_THROW(debug::CheckInvariants(sim));
        while (sim.PhaseNow() != BattlePhase::Ended)
        {
            sim.Step();
            ASSERT_NO_THROW(debug::CheckInvariants(sim)) << "seed " << seed;
        }

        auto const view = debug::Inspector::Gather(sim);
        EXPECT_EQ(view.log_lines, sim.Log().size());
        EXPECT_LE(view.turns, constants::MaxTurns);
    }
}
