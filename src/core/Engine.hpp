//
// Created on 22/10/2025.
//

#ifndef DADDECK_ENGINE_HPP
#define DADDECK_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "AbilityExecutor.hpp"
#include "BattleSimulator.hpp"
#include "Card.hpp"
#include "Damage.hpp"
#include "Deck.hpp"
#include "DeckBattle.hpp"
#include "Rewards.hpp"
#include "Synergy.hpp"
#include "TeamBattle.hpp"
#include "Types.hpp"
#include "WinnerPredictor.hpp"

// Entry points for callers outside the engine. Every call is independent;
// a missing seed is drawn from std::random_device.
namespace daddeck::core::engine
{
    auto SeedOrRandom(std::optional<uint64_t> seed) -> uint64_t;

    auto CalculatePower(Card const& card) -> double;

    auto GetTypeAdvantage(Category attacker, Category defender) -> double;
    auto GetTypeAdvantage(std::string_view attacker, std::string_view defender) -> double;

    auto ApplyStatusEffectsToCard(Card const& card, std::span<StatusEffect const> effects) -> StatSet;
    auto TickStatusEffects(std::span<StatusEffect const> effects) -> std::vector<StatusEffect>;
    auto AddStatusEffect(std::span<StatusEffect const> effects, StatusEffect const& effect)
        -> std::vector<StatusEffect>;

    auto CheckSynergy(Card const& a, Card const& b) -> PairSynergy;
    auto CalculateSynergyBonus(Deck const& deck) -> DeckSynergy;

    auto CalculateDamage(Card const& attacker, Card const& defender, Stat attack_stat, Stat defense_stat,
                         std::optional<uint64_t> seed = std::nullopt) -> DamageRoll;

    auto ExecuteAbility(Card const& card, Card const& target, std::size_t ability_index = 0,
                        std::optional<uint64_t> seed = std::nullopt) -> AbilityResult;

    auto SimulateBattle(CCardSP const& a, CCardSP const& b, std::optional<uint64_t> seed = std::nullopt)
        -> CardBattleResult;
    // cfg.seed is used as given
    auto SimulateBattle(CCardSP const& a, CCardSP const& b, Config const& cfg) -> CardBattleResult;

    auto CalculateBattleResult(CDeckSP const& attacker, CDeckSP const& defender,
                               std::optional<uint64_t> seed = std::nullopt) -> BattleResult;

    auto PredictWinner(CCardSP const& a, CCardSP const& b) -> Prediction;

    auto SimulateTeamBattle(std::span<CCardSP const> player, std::span<CCardSP const> opponent,
                            std::optional<uint64_t> seed = std::nullopt) -> TeamBattleResult;

    using core::CalculateRank;
    using core::CalculateRewards;
    using core::CalculateWinRate;
    using core::TierFromRankPoints;
}

#endif //DADDECK_ENGINE_HPP
