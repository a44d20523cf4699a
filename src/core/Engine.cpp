//
// Created on 22/10/2025.
//

#include "Engine.hpp"

#include <random>

#include "CardPower.hpp"
#include "SeededRandom.hpp"
#include "StatusEffects.hpp"
#include "TypeAdvantage.hpp"

namespace daddeck::core::engine
{
    auto SeedOrRandom(std::optional<uint64_t> const seed) -> uint64_t
    {
        return seed ? *seed : std::random_device{}();
    }

    auto CalculatePower(Card const& card) -> double
    {
        return CardPowerCalculator::Power(card);
    }

    auto GetTypeAdvantage(Category const attacker, Category const defender) -> double
    {
        return TypeAdvantageMatrix::Advantage(attacker, defender);
    }

    auto GetTypeAdvantage(std::string_view const attacker, std::string_view const defender) -> double
    {
        return TypeAdvantageMatrix::Advantage(attacker, defender);
    }

    auto ApplyStatusEffectsToCard(Card const& card, std::span<StatusEffect const> effects) -> StatSet
    {
        return StatusEffectEngine::ApplyEffects(card, effects);
    }

    auto TickStatusEffects(std::span<StatusEffect const> effects) -> std::vector<StatusEffect>
    {
        return StatusEffectEngine::Tick(effects);
    }

    auto AddStatusEffect(std::span<StatusEffect const> effects, StatusEffect const& effect)
        -> std::vector<StatusEffect>
    {
        return StatusEffectEngine::AddEffect(effects, effect);
    }

    auto CheckSynergy(Card const& a, Card const& b) -> PairSynergy
    {
        return SynergyCalculator::CheckSynergy(a, b);
    }

    auto CalculateSynergyBonus(Deck const& deck) -> DeckSynergy
    {
        return SynergyCalculator::DeckWide(deck);
    }

    auto CalculateDamage(Card const& attacker, Card const& defender, Stat const attack_stat, Stat const defense_stat,
                         std::optional<uint64_t> const seed) -> DamageRoll
    {
        SeededRandom rng{SeedOrRandom(seed)};
        return DamageCalculator::Calculate(attacker, defender, attack_stat, defense_stat, rng);
    }

    auto ExecuteAbility(Card const& card, Card const& target, std::size_t const ability_index,
                        std::optional<uint64_t> const seed) -> AbilityResult
    {
        SeededRandom rng{SeedOrRandom(seed)};
        return AbilityExecutor::Execute(card, target, ability_index, rng);
    }

    auto SimulateBattle(CCardSP const& a, CCardSP const& b, std::optional<uint64_t> const seed) -> CardBattleResult
    {
        Config cfg{};
        cfg.seed = SeedOrRandom(seed);
        return SimulateBattle(a, b, cfg);
    }

    auto SimulateBattle(CCardSP const& a, CCardSP const& b, Config const& cfg) -> CardBattleResult
    {
        BattleSimulator sim{cfg, a, b};
        return sim.Run();
    }

    auto CalculateBattleResult(CDeckSP const& attacker, CDeckSP const& defender, std::optional<uint64_t> const seed)
        -> BattleResult
    {
        return DeckBattleResolver::Resolve(attacker, defender, SeedOrRandom(seed));
    }

    auto PredictWinner(CCardSP const& a, CCardSP const& b) -> Prediction
    {
        return WinnerPredictor::Predict(a, b);
    }

    auto SimulateTeamBattle(std::span<CCardSP const> player, std::span<CCardSP const> opponent,
                            std::optional<uint64_t> const seed) -> TeamBattleResult
    {
        Config cfg{};
        cfg.seed = SeedOrRandom(seed);
        return TeamBattle::Simulate(MakeTeam(player, "Your Dad Squad", true, cfg),
                                    MakeTeam(opponent, "Opponent's Dad Squad", false, cfg), cfg);
    }
}
