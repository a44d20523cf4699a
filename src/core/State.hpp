//
// Created on 11/10/2025.
//

#ifndef DADDECK_STATE_HPP
#define DADDECK_STATE_HPP

#include <cstdint>
#include <vector>

#include "Card.hpp"
#include "Types.hpp"

namespace daddeck::core
{
    enum class BattlePhase : uint8_t
    {
        Start,
        Turn,
        Ended
    };

    enum class TurnOutcome : uint8_t
    {
        Started,  // header written, no action yet
        Applied,  // an action resolved, battle goes on
        Missed,   // actor was too drunk to land anything
        BattleEnded
    };

    // What one side can see when choosing its next ability.
    struct CombatSnapshot
    {
        uint32_t turn{};         // 1-based number of the turn being played
        uint32_t turn_cap{};
        Side me{Side::Attacker};

        CCardSP self;
        CCardSP opponent;
        double self_hp{};
        double opponent_hp{};

        std::vector<StatusEffect> self_effects;
        std::vector<StatusEffect> opponent_effects;
    };
}

#endif //DADDECK_STATE_HPP
