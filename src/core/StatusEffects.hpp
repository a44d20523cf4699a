//
// Created on 07/10/2025.
//

#ifndef DADDECK_STATUSEFFECTS_HPP
#define DADDECK_STATUSEFFECTS_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "Card.hpp"
#include "Types.hpp"

namespace daddeck::core
{
    struct EffectModifier
    {
        double percent{0.0}; // per stack, -0.2 == -20%
        std::array<bool, constants::StatCount> affects{};
    };

    // Effect lists are values: every operation returns a new list.
    class StatusEffectEngine final
    {
    public:
        static auto Modifier(StatusKind kind) noexcept -> EffectModifier const&;

        // 1 stack = 1.0, 2 stacks = 1.5
        static auto StackScale(uint8_t stacks) noexcept -> double;

        // Applies each effect in order, then clamps to [0, 100].
        static auto ApplyEffects(StatSet const& base, std::span<StatusEffect const> effects) -> StatSet;
        static auto ApplyEffects(Card const& card, std::span<StatusEffect const> effects) -> StatSet;

        static auto Tick(std::span<StatusEffect const> effects) -> std::vector<StatusEffect>;

        // Same kind present: stack (capped) and refresh duration. Otherwise append.
        static auto AddEffect(std::span<StatusEffect const> effects, StatusEffect const& effect)
            -> std::vector<StatusEffect>;

        static auto Find(std::span<StatusEffect const> effects, StatusKind kind) -> std::optional<StatusEffect>;

        // nullopt for unknown names
        static auto FromName(std::string_view name, uint32_t duration) -> std::optional<StatusEffect>;
    };
}

#endif //DADDECK_STATUSEFFECTS_HPP
