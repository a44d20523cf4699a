//
// Created on 02/10/2025.
//

#include <array>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "core/BattleSimulator.hpp"
#include "core/Card.hpp"
#include "core/DeckBattle.hpp"
#include "core/Exception.hpp"
#include "core/SeededRandom.hpp"
#include "core/TeamBattle.hpp"
#include "core/Types.hpp"
#include "core/WinnerPredictor.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"

namespace
{
    using namespace daddeck::core;

    struct CliConfig
    {
        std::string   mode{"deck"};
        std::optional<std::uint64_t> seed{};
        std::string   seed_text{};
        std::uint32_t turns{constants::MaxTurns};
        std::size_t   card_a{0};
        std::size_t   card_b{1};
        std::string   log_path{};
        bool          rotate{false};
    };

    auto ParseArgs(int argc, char** argv) -> CliConfig
    {
        CliConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };
            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            if (arg == "--mode")
            {
                next_str(cfg.mode);
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--seed-text")
            {
                next_str(cfg.seed_text);
            }
            else if (arg == "--turns")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.turns = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--a")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.card_a = static_cast<std::size_t>(v); }
            }
            else if (arg == "--b")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.card_b = static_cast<std::size_t>(v); }
            }
            else if (arg == "--log")
            {
                next_str(cfg.log_path);
            }
            else if (arg == "--rotate")
            {
                cfg.rotate = true;
            }
        }
        return cfg;
    }

    auto DemoRoster() -> std::vector<CCardSP>
    {
        auto stats = [](double dj, double gs, double fi, double np, double rc, double th, double ss, double bs)
        {
            return StatSet{{dj, gs, fi, np, rc, th, ss, bs}};
        };

        return {
            MakeCard("bbq-001", "Grillmaster Gary", Category::BbqDicktator, Rarity::Rare,
                     stats(62, 95, 40, 30, 45, 50, 70, 80),
                     {{"Grill Flare", "Flips a burger straight into your soul."},
                      {"Beer Can Chicken", "Cracks one open mid-fight."}},
                     "The Propane Prophet"),
            MakeCard("couch-001", "Recliner Rick", Category::CouchCummander, Rarity::Uncommon,
                     stats(55, 20, 15, 98, 90, 60, 65, 40),
                     {{"Power Nap", "Zzz..."}, {"Remote Hog", "Nobody touches the clicker."}},
                     "Lord of the La-Z-Boy"),
            MakeCard("golf-001", "Bogey Bob", Category::GolfGonad, Rarity::Common,
                     stats(60, 35, 30, 40, 35, 45, 80, 55),
                     {{"Sock Tan", "Blinds you with calf lines."}},
                     "Four Over Par"),
            MakeCard("chef-001", "Chef Chad", Category::ChefCumsters, Rarity::Epic,
                     stats(50, 85, 35, 25, 30, 55, 45, 75),
                     {{"Grill Marks", "Perfect crosshatch."}},
                     "Sous-Vide Sensei"),
            MakeCard("tech-001", "Firmware Frank", Category::TechTwats, Rarity::Rare,
                     stats(45, 20, 80, 30, 70, 85, 40, 35),
                     {{"Thermostat Lock", "Set to 68. Forever."}, {"Fix The Wifi", "Have you tried turning it off?"}},
                     "Have You Tried Rebooting"),
            MakeCard("holiday-001", "Eggnog Ed", Category::HolidayHorndogs, Rarity::Legendary,
                     stats(80, 50, 40, 60, 50, 45, 55, 90),
                     {{"Spiked Punchline", "The joke has rum in it."}},
                     "Twelve Beers of Christmas"),
            MakeCard("coach-001", "Coach Carl", Category::CoachCumsters, Rarity::Uncommon,
                     stats(70, 40, 45, 30, 50, 40, 60, 50),
                     {{"Halftime Joke", "Walk it off, champ."}},
                     "Whistle Blower"),
            MakeCard("lawn-001", "Mower Mike", Category::LawnLunatic, Rarity::Mythic,
                     stats(65, 55, 70, 35, 40, 60, 75, 60),
                     {{"Edge Trim", "Perfect lines, zero mercy."}},
                     "HOA Enforcer"),
        };
    }

    auto At(std::vector<CCardSP> const& roster, std::size_t const i) -> CCardSP const&
    {
        if (i >= roster.size())
            DDK_THROW(error::Code::InvalidInput, fmt::format("card index {} out of range (roster has {})", i,
                                                             roster.size()));
        return roster[i];
    }
}

int main(int argc, char** argv)
{
    using namespace daddeck::core;

    CliConfig const cc = ParseArgs(argc, argv);

    try
    {
        debug::CheckMatrix();

        Config cfg{};
        cfg.max_turns = cc.turns;
        if (!cc.seed_text.empty()) cfg.seed = HashSeed(cc.seed_text);
        else if (cc.seed) cfg.seed = *cc.seed;

        std::unique_ptr<debug::AuditLogger> audit;
        if (!cc.log_path.empty())
        {
            audit = std::make_unique<debug::AuditLogger>(cc.log_path);
            audit->start(cc.mode, cfg.seed);
        }

        auto const roster = DemoRoster();
        fmt::print("[daddeck] mode={} seed={}\n", cc.mode, cfg.seed);

        if (cc.mode == "deck")
        {
            auto const home = MakeDeck("home", "Backyard Legends",
                                       {{roster[0], 3}, {roster[3], 2}, {roster[2], 1}});
            auto const away = MakeDeck("away", "Weekend Warriors",
                                       {{roster[1], 2}, {roster[4], 2}, {roster[6], 2}});
            for (auto const& d : {home, away})
            {
                if (auto const ok = ValidateDeck(*d); !ok)
                {
                    fmt::print(stderr, "[daddeck] deck {} rejected: {}\n", d->Id(), error::describe(ok.error()));
                    return 1;
                }
            }

            auto const r = DeckBattleResolver::Resolve(home, away, cfg.seed);
            for (auto const& l : r.log) fmt::print("{}\n", l);
            if (audit) audit->result(r);
        }
        else if (cc.mode == "card")
        {
            std::array<std::unique_ptr<Tactic>, 2> tactics{};
            if (cc.rotate)
            {
                tactics[0] = std::make_unique<RotatingTactic>();
                tactics[1] = std::make_unique<RotatingTactic>();
            }
            BattleSimulator sim{cfg, At(roster, cc.card_a), At(roster, cc.card_b), std::move(tactics)};
            while (sim.PhaseNow() != BattlePhase::Ended)
            {
                sim.Step();
                debug::CheckInvariants(sim);
            }
            auto const r = sim.Result();
            for (auto const& l : r.log) fmt::print("{}\n", l);
            if (audit) audit->card_battle(r);
        }
        else if (cc.mode == "team")
        {
            std::vector<CCardSP> const player{roster[0], roster[1], roster[2]};
            SeededRandom picker{cfg.seed};
            auto const opponent = PickOpponentTeam(player, roster, picker, cfg);

            TeamBattle battle{cfg, MakeTeam(player, "Your Dad Squad", true, cfg), opponent};
            while (battle.PhaseNow() != BattlePhase::Ended)
            {
                battle.Step();
                debug::CheckInvariants(battle);
            }
            auto const r = battle.Result();
            for (auto const& e : r.log) fmt::print("[{}] {}\n", e.turn, e.description);
            fmt::print("{}\n", BattleSummary(r));
            if (audit) audit->team_battle(r);
        }
        else if (cc.mode == "predict")
        {
            auto const p = WinnerPredictor::Predict(At(roster, cc.card_a), At(roster, cc.card_b));
            fmt::print("Predicted winner: {} ({}%)\n{}\n", p.winner->name, p.confidence, p.reason);
            if (audit) audit->line(fmt::format("Predicted={} confidence={} reason={}", p.winner->id, p.confidence,
                                               p.reason));
        }
        else
        {
            fmt::print(stderr, "[daddeck] unknown mode '{}' (deck|card|team|predict)\n", cc.mode);
            return 2;
        }

        if (audit) audit->flush();
    }
    catch (OmegaException<error::Code> const& e)
    {
        fmt::print(stderr, "{}", e);
        return 1;
    }

    fmt::print("[daddeck] done\n");
    return 0;
}
