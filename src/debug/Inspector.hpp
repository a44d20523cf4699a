//
// Created on 12/10/2025.
//

#ifndef DADDECK_INSPECTOR_HPP
#define DADDECK_INSPECTOR_HPP

#include <array>
#include <cstdint>
#include <vector>

#include "../core/BattleSimulator.hpp"
#include "../core/TeamBattle.hpp"
#include "../core/Types.hpp"

namespace daddeck::core::debug
{
    struct Inspector
    {
        struct CombatantView
        {
            Card const* card{};
            double hp{};
            double max_hp{};
            std::vector<StatusEffect> effects;
        };

        struct DuelView
        {
            std::array<CombatantView, 2> sides{};
            BattlePhase phase{};
            Side active{};
            uint32_t turns{};
            uint32_t turn_cap{};
            std::size_t log_lines{};
        };

        struct TeamView
        {
            std::array<BattleTeam const*, 2> teams{};
            BattlePhase phase{};
            uint32_t turns{};
            uint32_t turn_cap{};
            std::size_t team_size{};
        };

        static inline auto Gather(BattleSimulator const& b) -> DuelView
        {
            DuelView ret{};
            ret.phase = b.phase_;
            ret.active = b.active_;
            ret.turns = b.turns_;
            ret.turn_cap = b.turn_cap_;
            ret.log_lines = b.log_.size();
            for (std::size_t i{}; i < b.sides_.size(); ++i)
            {
                auto const& src = b.sides_[i];
                ret.sides[i] = CombatantView{src.card.get(), src.hp, src.max_hp, src.effects};
            }
            return ret;
        }

        static inline auto Gather(TeamBattle const& t) -> TeamView
        {
            TeamView ret{};
            ret.teams = {&t.teams_[0], &t.teams_[1]};
            ret.phase = t.phase_;
            ret.turns = t.turns_;
            ret.turn_cap = t.turn_cap_;
            ret.team_size = t.cfg_.team_size;
            return ret;
        }
    };
}

#endif //DADDECK_INSPECTOR_HPP
