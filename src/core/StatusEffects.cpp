//
// Created on 07/10/2025.
//

#include "StatusEffects.hpp"

#include <algorithm>

namespace daddeck::core
{
    namespace
    {
        constexpr auto Only(std::initializer_list<Stat> stats) -> std::array<bool, constants::StatCount>
        {
            std::array<bool, constants::StatCount> mask{};
            for (auto const s : stats) mask[Idx(s)] = true;
            return mask;
        }

        constexpr auto Every() -> std::array<bool, constants::StatCount>
        {
            std::array<bool, constants::StatCount> mask{};
            mask.fill(true);
            return mask;
        }

        constexpr std::array<EffectModifier, constants::StatusKindCount> Modifiers{{
            {-0.2, Only({Stat::GrillSkill, Stat::FixIt})},        // grilled
            {-0.2, Only({Stat::DadJoke, Stat::RemoteControl})},   // lectured
            {0.0, {}},                                             // drunk: accuracy only
            {0.3, Every()},                                        // wired
            {0.0, {}},                                             // awkward
            {0.0, {}},                                             // bored
            {0.0, {}},                                             // inspired
        }};
    }

    auto StatusEffectEngine::Modifier(StatusKind const kind) noexcept -> EffectModifier const&
    {
        return Modifiers[Idx(kind)];
    }

    auto StatusEffectEngine::StackScale(uint8_t const stacks) noexcept -> double
    {
        auto const n = std::clamp<uint8_t>(stacks, 1, constants::MaxStacks);
        return 1.0 + static_cast<double>(n - 1) * 0.5;
    }

    auto StatusEffectEngine::ApplyEffects(StatSet const& base, std::span<StatusEffect const> effects) -> StatSet
    {
        StatSet out = base;
        for (auto const& e : effects)
        {
            auto const& mod = Modifier(e.kind);
            if (mod.percent == 0.0) continue;
            double const factor = 1.0 + mod.percent * StackScale(e.stacks);
            for (auto const s : AllStats)
            {
                if (mod.affects[Idx(s)]) out[s] *= factor;
            }
        }
        for (auto& v : out.values)
        {
            v = std::clamp(v, constants::StatMin, constants::StatMax);
        }
        return out;
    }

    auto StatusEffectEngine::ApplyEffects(Card const& card, std::span<StatusEffect const> effects) -> StatSet
    {
        return ApplyEffects(card.stats, effects);
    }

    auto StatusEffectEngine::Tick(std::span<StatusEffect const> effects) -> std::vector<StatusEffect>
    {
        std::vector<StatusEffect> out;
        out.reserve(effects.size());
        for (auto const& e : effects)
        {
            if (e.duration <= 1) continue;
            StatusEffect next = e;
            --next.duration;
            out.push_back(next);
        }
        return out;
    }

    auto StatusEffectEngine::AddEffect(std::span<StatusEffect const> effects, StatusEffect const& effect)
        -> std::vector<StatusEffect>
    {
        std::vector<StatusEffect> out(effects.begin(), effects.end());
        auto const it = std::ranges::find(out, effect.kind, &StatusEffect::kind);
        if (it == out.end())
        {
            out.push_back(effect);
            return out;
        }
        it->stacks = static_cast<uint8_t>(std::min<int>(it->stacks + 1, constants::MaxStacks));
        it->duration = effect.duration;
        return out;
    }

    auto StatusEffectEngine::Find(std::span<StatusEffect const> effects, StatusKind const kind)
        -> std::optional<StatusEffect>
    {
        auto const it = std::ranges::find(effects, kind, &StatusEffect::kind);
        if (it == effects.end()) return std::nullopt;
        return *it;
    }

    auto StatusEffectEngine::FromName(std::string_view const name, uint32_t const duration)
        -> std::optional<StatusEffect>
    {
        auto const kind = StatusKindFromName(name);
        if (!kind) return std::nullopt;
        return StatusEffect{.kind = *kind, .duration = duration, .stacks = 1};
    }
}
