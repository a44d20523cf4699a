//
// Created on 11/10/2025.
//

#ifndef DADDECK_BATTLESIMULATOR_HPP
#define DADDECK_BATTLESIMULATOR_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Card.hpp"
#include "SeededRandom.hpp"
#include "State.hpp"
#include "Tactic.hpp"
#include "Types.hpp"

namespace daddeck::core::debug {struct Inspector;}
namespace daddeck::core
{
    struct CardBattleResult
    {
        CCardSP winner;
        CCardSP loser;
        Side winner_side{Side::Attacker};
        uint32_t turns{0};
        std::array<double, 2> remaining_hp{}; // by Side
        std::vector<std::string> log;
    };

    // Card vs card, one action per turn, roles swap after every turn.
    class BattleSimulator
    {
    public:
        BattleSimulator() = delete;
        // Null tactics fall back to FirstAbilityTactic.
        BattleSimulator(Config const& config, CCardSP first, CCardSP second,
                        std::array<std::unique_ptr<Tactic>, 2> tactics = {});

        // One state-machine step. Throws StateError once the battle is over.
        auto Step() -> TurnOutcome;

        // Steps to the end and returns the result.
        auto Run() -> CardBattleResult;

        auto SnapshotFor(Side side) const -> std::shared_ptr<CombatSnapshot const>;

        // Throws StateError before the battle ended.
        auto Result() const -> CardBattleResult;

        auto PhaseNow() const noexcept -> BattlePhase { return phase_; }
        auto Active() const noexcept -> Side { return active_; }
        auto TurnsTaken() const noexcept -> uint32_t { return turns_; }
        auto TurnCap() const noexcept -> uint32_t { return turn_cap_; }
        auto HpOf(Side const s) const noexcept -> double { return sides_[Idx(s)].hp; }
        auto EffectsOn(Side const s) const noexcept -> std::vector<StatusEffect> const& { return sides_[Idx(s)].effects; }
        auto Log() const noexcept -> std::vector<std::string> const& { return log_; }
        auto TacticOf(Side const s) -> Tactic* { return sides_[Idx(s)].tactic.get(); }

        friend struct debug::Inspector;

    private:
        struct Combatant
        {
            CCardSP card;
            double power{};
            double hp{};
            double max_hp{};
            std::vector<StatusEffect> effects;
            std::unique_ptr<Tactic> tactic;
        };

        auto WriteHeader() -> void;
        auto TakeTurn() -> TurnOutcome;
        auto Finish(Side winner, std::string line) -> void;
        auto DecideOnPools() -> Side;

    private:
        Config cfg_;
        SeededRandom rng_;
        uint32_t turn_cap_;
        std::array<Combatant, 2> sides_;

        BattlePhase phase_{BattlePhase::Start};
        Side active_{Side::Attacker};
        uint32_t turns_{0};
        std::vector<std::string> log_;
        Side winner_{Side::Attacker};
    };
}

#endif //DADDECK_BATTLESIMULATOR_HPP
