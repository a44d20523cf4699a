//
// Created on 15/10/2025.
//

#include "DeckBattle.hpp"

#include <cmath>
#include <random>

#include <fmt/format.h>

#include "CardPower.hpp"
#include "Exception.hpp"
#include "SeededRandom.hpp"
#include "Synergy.hpp"
#include "TypeAdvantage.hpp"

namespace daddeck::core
{
    namespace
    {
        auto Breakdown(Deck const& deck) -> DeckPowerBreakdown
        {
            auto const& stats = deck.Stats();
            double const power = CardPowerCalculator::Power(stats.average_stats);
            return DeckPowerBreakdown{
                .total_power = power,
                .effective_power = power,
                .final_power = power,
                .normalized_stats = stats.average_stats,
                .main_type = stats.MainType(),
            };
        }

        auto TypeLine(Category const a, Category const d, double const adv) -> std::string
        {
            if (adv > 1.0)
                return fmt::format("{} has advantage over {}! (+{}% damage)", ToString(a), ToString(d),
                                   std::lround((adv - 1.0) * 100.0));
            if (adv < 1.0)
                return fmt::format("{} at disadvantage against {}! ({}% damage)", ToString(a), ToString(d),
                                   std::lround(adv * 100.0));
            return "No type advantage";
        }
    }

    auto DeckBattleResolver::Resolve(CDeckSP const& attacker, CDeckSP const& defender,
                                     std::optional<uint64_t> const seed) -> BattleResult
    {
        DDK_ASSERT(attacker && defender, "Resolve needs two decks");

        BattleResult r{};
        r.seed = seed ? *seed : std::random_device{}();
        r.attacker_stats = Breakdown(*attacker);
        r.defender_stats = Breakdown(*defender);

        r.type_advantage = TypeAdvantageMatrix::Advantage(r.attacker_stats.main_type, r.defender_stats.main_type);
        auto const synergy = SynergyCalculator::DeckWide(*attacker);
        r.synergy_bonus = synergy.multiplier;

        r.attacker_stats.effective_power = r.attacker_stats.total_power * r.type_advantage;
        r.attacker_stats.final_power = r.attacker_stats.effective_power * r.synergy_bonus;

        double const final_a = r.attacker_stats.final_power;
        double const total_d = r.defender_stats.total_power;

        SeededRandom rng{r.seed};
        double const base = DamageCalculator::BaseDamage(final_a, total_d);
        auto const roll = DamageCalculator::RollHit(base, rng);
        r.damage = roll.damage;
        r.hit = roll.kind;
        r.variance = roll.variance;

        // the roll scales damage only
        bool const attacker_wins = final_a > total_d;
        r.winner_side = attacker_wins ? Side::Attacker : Side::Defender;
        r.winner = attacker_wins ? attacker : defender;
        r.loser = attacker_wins ? defender : attacker;

        auto& log = r.log;
        log.push_back(fmt::format("BATTLE: {} ({} cards) vs {} ({} cards)", attacker->Name(),
                                  attacker->Stats().total_cards, defender->Name(), defender->Stats().total_cards));
        log.push_back(fmt::format("Attacker normalized power: {:.1f}", r.attacker_stats.total_power));
        log.push_back(fmt::format("Defender normalized power: {:.1f}", total_d));
        log.push_back(TypeLine(r.attacker_stats.main_type, r.defender_stats.main_type, r.type_advantage));
        if (r.synergy_bonus > 1.0) log.push_back(synergy.description);
        log.push_back(fmt::format("Final attacker power: {:.1f}", final_a));
        log.push_back("RNG System:");
        log.push_back(fmt::format("  {}", ToString(roll.kind)));
        log.push_back(fmt::format("  Variance: {:+.1f}%", (roll.variance - 1.0) * 100.0));
        log.push_back(fmt::format("  Base damage: {}", static_cast<long>(std::floor(base))));
        log.push_back(fmt::format("  Final damage: {}", r.damage));
        log.push_back(fmt::format("Winner: {}", r.winner->Name()));
        return r;
    }
}
