//
// Created on 12/10/2025.
//

#ifndef DADDECK_INVARIANTS_HPP
#define DADDECK_INVARIANTS_HPP

#include <algorithm>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "../core/BattleSimulator.hpp"
#include "../core/Exception.hpp"
#include "../core/TeamBattle.hpp"
#include "../core/TypeAdvantage.hpp"
#include "Inspector.hpp"

namespace daddeck::core::debug
{
    // Startup check of the category relation.
    inline auto CheckMatrix() -> void
    {
        auto const problems = TypeAdvantageMatrix::Validate();
        std::string joined;
        for (auto const& p : problems) joined += p + "; ";
        DDK_ASSERT(problems.empty(), fmt::format("type advantage matrix unbalanced: {}", joined));
    }

    inline auto CheckEffects(std::vector<StatusEffect> const& effects) -> void
    {
        for (std::size_t i{}; i < effects.size(); ++i)
        {
            auto const& e = effects[i];
            DDK_ASSERT(e.stacks >= 1 && e.stacks <= constants::MaxStacks, "effect stacks outside 1..2");
            DDK_ASSERT(e.duration > 0, "expired effect still listed");
            for (std::size_t j{i + 1}; j < effects.size(); ++j)
                DDK_ASSERT(effects[j].kind != e.kind, "same effect kind listed twice");
        }
    }

    inline auto CheckInvariants(BattleSimulator const& b) -> void
    {
#if DDK_ENABLE_TEST_HOOKS == false
        (void)b;
#else
        Inspector::DuelView const s = Inspector::Gather(b);

        // 1) turn counter never passes the cap, the cap never passes the hard limit
        DDK_ASSERT(s.turn_cap <= constants::MaxTurns, "turn cap above hard limit");
        DDK_ASSERT(s.turns <= s.turn_cap, "more turns than the cap allows");

        // 2) nothing happens before the header
        if (s.phase == BattlePhase::Start)
            DDK_ASSERT(s.turns == 0 && s.log_lines == 0, "turns played before the battle started");

        // 3) pools only shrink and both sides stand while the battle runs
        for (auto const& side : s.sides)
        {
            DDK_ASSERT(side.card != nullptr, "combatant without a card");
            DDK_ASSERT(side.hp <= side.max_hp, "hp above its starting pool");
            CheckEffects(side.effects);
        }
        if (s.phase == BattlePhase::Turn && s.turns > 0)
            DDK_ASSERT(std::ranges::all_of(s.sides, [](auto const& c) { return c.hp > 0.0; }),
                       "battle still running with a knocked out card");
#endif
    }

    inline auto CheckInvariants(TeamBattle const& t) -> void
    {
#if DDK_ENABLE_TEST_HOOKS == false
        (void)t;
#else
        Inspector::TeamView const s = Inspector::Gather(t);

        DDK_ASSERT(s.turns <= s.turn_cap, "more rounds than the cap allows");
        for (BattleTeam const* team : s.teams)
        {
            DDK_ASSERT(team->cards.size() == s.team_size, "team size changed mid battle");
            for (auto const& bc : team->cards)
            {
                DDK_ASSERT(bc.current_hp >= 0.0 && bc.current_hp <= bc.max_hp, "hp outside [0, max]");
                DDK_ASSERT(bc.alive == (bc.current_hp > 0.0), "alive flag disagrees with hp");
            }
            if (s.phase == BattlePhase::Turn && s.turns > 0)
                DDK_ASSERT(team->AliveCount() > 0, "battle still running with a wiped team");
        }
#endif
    }
}

#endif //DADDECK_INVARIANTS_HPP
