//
// Created on 19/10/2025.
//

#ifndef DADDECK_TEAMBATTLE_HPP
#define DADDECK_TEAMBATTLE_HPP

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "Card.hpp"
#include "Exception.hpp"
#include "SeededRandom.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace daddeck::core::debug {struct Inspector;}
namespace daddeck::core
{
    enum class TeamAction : uint8_t
    {
        Start,
        Attack,
        Knockout,
        Victory
    };

    auto ToString(TeamAction a) -> std::string_view;

    struct BattleCard
    {
        CCardSP card;
        double current_hp{};
        double max_hp{};
        bool alive{true};
        uint8_t position{}; // 1-based slot in the team
    };

    struct BattleTeam
    {
        std::string name;
        std::vector<BattleCard> cards;
        bool is_player{false};

        [[nodiscard]]
        auto AliveCount() const -> std::size_t;
    };

    struct TeamLogEntry
    {
        uint32_t turn{};
        TeamAction action{TeamAction::Attack};
        std::string description;
        int damage{0};
        bool critical{false};
    };

    struct TeamBattleResult
    {
        TeamWinner winner{TeamWinner::Draw};
        BattleTeam player;
        BattleTeam opponent;
        uint32_t turns{0};
        std::vector<TeamLogEntry> log;
    };

    // Exactly team_size cards, none missing, no card twice.
    auto ValidateTeam(std::span<CCardSP const> cards, std::size_t team_size = constants::TeamSize)
        -> error::ValidateResult;

    // Throws InvalidInputError when ValidateTeam fails.
    auto MakeTeam(std::span<CCardSP const> cards, std::string name, bool is_player, Config const& cfg) -> BattleTeam;

    // Prefers pool cards within 20% of the player's average power, topping up from the whole pool.
    auto PickOpponentTeam(std::span<CCardSP const> player_cards, std::span<CCardSP const> pool,
                          SeededRandom& rng, Config const& cfg) -> BattleTeam;

    // Verdict, length and survivors as a few human-readable lines.
    auto BattleSummary(TeamBattleResult const& result) -> std::string;

    // Round based team fight: every living player card attacks, then every living opponent card.
    class TeamBattle
    {
    public:
        TeamBattle() = delete;
        TeamBattle(Config const& config, BattleTeam player, BattleTeam opponent);

        static auto Simulate(BattleTeam player, BattleTeam opponent, Config const& config) -> TeamBattleResult;

        // One round per step. Throws StateError once the battle is over.
        auto Step() -> TurnOutcome;
        auto Run() -> TeamBattleResult;
        auto Result() const -> TeamBattleResult;

        auto PhaseNow() const noexcept -> BattlePhase { return phase_; }
        auto Rounds() const noexcept -> uint32_t { return turns_; }
        auto Player() const noexcept -> BattleTeam const& { return teams_[0]; }
        auto Opponent() const noexcept -> BattleTeam const& { return teams_[1]; }

        friend struct debug::Inspector;

    private:
        // true when the defending team has nobody left standing
        auto AttackWith(BattleTeam& attackers, BattleTeam& defenders) -> bool;
        auto Finish() -> void;

    private:
        Config cfg_;
        SeededRandom rng_;
        uint32_t turn_cap_;
        std::array<BattleTeam, 2> teams_;

        BattlePhase phase_{BattlePhase::Start};
        uint32_t turns_{0};
        std::vector<TeamLogEntry> log_;
        TeamWinner winner_{TeamWinner::Draw};
    };
}

#endif //DADDECK_TEAMBATTLE_HPP
