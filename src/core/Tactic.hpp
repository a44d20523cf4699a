//
// Created on 11/10/2025.
//

#ifndef DADDECK_TACTIC_HPP
#define DADDECK_TACTIC_HPP

#include <cstddef>
#include <memory>

#include "State.hpp"

namespace daddeck::core
{
    // Picks which ability a card uses on its turn.
    class Tactic
    {
    public:
        virtual ~Tactic() = default;

        // An index past the card's abilities makes the card fumble the turn.
        virtual auto ChooseAbility(std::shared_ptr<CombatSnapshot const> snapshot) -> std::size_t = 0;
    };

    class FirstAbilityTactic final : public Tactic
    {
    public:
        auto ChooseAbility(std::shared_ptr<CombatSnapshot const>) -> std::size_t override { return 0; }
    };

    // Cycles through the card's abilities in order.
    class RotatingTactic final : public Tactic
    {
    public:
        auto ChooseAbility(std::shared_ptr<CombatSnapshot const> snapshot) -> std::size_t override
        {
            auto const n = snapshot->self->abilities.size();
            if (n == 0) return 0;
            return used_++ % n;
        }

    private:
        std::size_t used_{0};
    };
}

#endif //DADDECK_TACTIC_HPP
