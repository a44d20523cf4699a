//
// Created on 12/10/2025.
//

#include "BattleSimulator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "AbilityExecutor.hpp"
#include "CardPower.hpp"
#include "Exception.hpp"
#include "StatusEffects.hpp"
#include "Synergy.hpp"
#include "TypeAdvantage.hpp"

namespace daddeck::core
{
    namespace
    {
        constexpr double DrunkMissChance = 0.3;
    }

    BattleSimulator::BattleSimulator(Config const& config, CCardSP first, CCardSP second,
                                     std::array<std::unique_ptr<Tactic>, 2> tactics) :
        cfg_(config),
        rng_{cfg_.seed},
        turn_cap_{std::min(cfg_.max_turns, constants::MaxTurns)}
    {
        DDK_ASSERT(first && second, "BattleSimulator needs two cards");
        DDK_ASSERT(cfg_.hp_per_power > 0.0, "hp_per_power must be positive");

        std::array<CCardSP, 2> cards{std::move(first), std::move(second)};
        for (size_t i{}; i < sides_.size(); ++i)
        {
            Combatant& c = sides_[i];
            c.card = std::move(cards[i]);
            c.power = CardPowerCalculator::Power(*c.card);
            c.max_hp = c.power * cfg_.hp_per_power;
            c.hp = c.max_hp;
            c.tactic = tactics[i] ? std::move(tactics[i]) : std::make_unique<FirstAbilityTactic>();
        }
    }

    auto BattleSimulator::Step() -> TurnOutcome
    {
        switch (phase_)
        {
        case BattlePhase::Start:
            WriteHeader();
            phase_ = BattlePhase::Turn;
            return TurnOutcome::Started;
        case BattlePhase::Turn:
            return TakeTurn();
        case BattlePhase::Ended:
            break;
        }
        DDK_THROW(error::Code::State, "Step called on a finished battle");
    }

    auto BattleSimulator::Run() -> CardBattleResult
    {
        while (phase_ != BattlePhase::Ended)
        {
            Step();
        }
        return Result();
    }

    auto BattleSimulator::WriteHeader() -> void
    {
        Combatant const& a = sides_[Idx(Side::Attacker)];
        Combatant const& d = sides_[Idx(Side::Defender)];

        log_.push_back(fmt::format("BATTLE: {} vs {}!", a.card->name, d.card->name));
        log_.push_back(fmt::format("{} HP: {:.1f}", a.card->name, a.hp));
        log_.push_back(fmt::format("{} HP: {:.1f}", d.card->name, d.hp));

        double const adv = TypeAdvantageMatrix::Advantage(a.card->category, d.card->category);
        if (adv > 1.0)
            log_.push_back(fmt::format("{} has advantage over {}! (+20% damage)",
                                       ToString(a.card->category), ToString(d.card->category)));
        else if (adv < 1.0)
            log_.push_back(fmt::format("{} at disadvantage against {}! (-20% damage)",
                                       ToString(a.card->category), ToString(d.card->category)));
    }

    auto BattleSimulator::TakeTurn() -> TurnOutcome
    {
        auto const dead = [](Combatant const& c) { return c.hp <= 0.0; };
        if (turns_ >= turn_cap_ || std::ranges::any_of(sides_, dead))
        {
            Side const w = DecideOnPools();
            Finish(w, fmt::format("Time's up! {} wins by HP!", sides_[Idx(w)].card->name));
            return TurnOutcome::BattleEnded;
        }

        ++turns_;
        Combatant& actor = sides_[Idx(active_)];
        Combatant& target = sides_[Idx(Other(active_))];

        TurnOutcome outcome = TurnOutcome::Applied;
        auto const drunk = StatusEffectEngine::Find(actor.effects, StatusKind::Drunk);
        if (drunk && rng_.Chance(DrunkMissChance * StatusEffectEngine::StackScale(drunk->stacks)))
        {
            log_.push_back(fmt::format("Turn {}: {} is too drunk and misses!", turns_, actor.card->name));
            outcome = TurnOutcome::Missed;
        }
        else
        {
            StatSet const actor_stats = StatusEffectEngine::ApplyEffects(*actor.card, actor.effects);
            StatSet const target_stats = StatusEffectEngine::ApplyEffects(*target.card, target.effects);
            std::size_t const ability = actor.tactic->ChooseAbility(SnapshotFor(active_));

            AbilityResult const res = AbilityExecutor::Execute(*actor.card, actor_stats, *target.card,
                                                               target_stats, ability, rng_, cfg_.status_chance);
            log_.push_back(fmt::format("Turn {}: {}", turns_, res.flavor_text));

            if (res.success)
            {
                double const adv = TypeAdvantageMatrix::Advantage(actor.card->category, target.card->category);
                auto const synergy = SynergyCalculator::CheckSynergy(*actor.card, *target.card);
                int const dmg = std::max(1, static_cast<int>(std::floor(res.damage * adv * synergy.bonus)));

                if (synergy.has_synergy)
                    log_.push_back(fmt::format("  SYNERGY: {}! {}", synergy.name, synergy.description));

                target.hp -= dmg;
                log_.push_back(fmt::format("  -> {} damage! {}", dmg, res.roll_log));

                for (auto const& e : res.status_effects)
                {
                    target.effects = StatusEffectEngine::AddEffect(target.effects, e);
                    log_.push_back(fmt::format("  -> {} is {}", target.card->name, ToString(e.kind)));
                }

                if (dead(target))
                {
                    Finish(active_, fmt::format("{} wins in {} turns!", actor.card->name, turns_));
                    return TurnOutcome::BattleEnded;
                }
            }
        }

        for (auto& c : sides_)
        {
            c.effects = StatusEffectEngine::Tick(c.effects);
        }
        log_.push_back(fmt::format("  HP: {:.1f} vs {:.1f}", sides_[0].hp, sides_[1].hp));
        active_ = Other(active_);

        if (turns_ >= turn_cap_)
        {
            Side const w = DecideOnPools();
            Finish(w, fmt::format("Time's up! {} wins by HP!", sides_[Idx(w)].card->name));
            return TurnOutcome::BattleEnded;
        }
        return outcome;
    }

    auto BattleSimulator::DecideOnPools() -> Side
    {
        Combatant const& a = sides_[Idx(Side::Attacker)];
        Combatant const& d = sides_[Idx(Side::Defender)];
        if (a.hp != d.hp) return a.hp > d.hp ? Side::Attacker : Side::Defender;
        if (a.power != d.power) return a.power > d.power ? Side::Attacker : Side::Defender;
        return Side::Attacker;
    }

    auto BattleSimulator::Finish(Side const winner, std::string line) -> void
    {
        winner_ = winner;
        phase_ = BattlePhase::Ended;
        log_.push_back(std::move(line));
    }

    auto BattleSimulator::Result() const -> CardBattleResult
    {
        if (phase_ != BattlePhase::Ended)
            DDK_THROW(error::Code::State, "Result requested before the battle ended");

        return CardBattleResult{
            .winner = sides_[Idx(winner_)].card,
            .loser = sides_[Idx(Other(winner_))].card,
            .winner_side = winner_,
            .turns = turns_,
            .remaining_hp = {sides_[0].hp, sides_[1].hp},
            .log = log_,
        };
    }

    auto BattleSimulator::SnapshotFor(Side const side) const -> std::shared_ptr<CombatSnapshot const>
    {
        auto snap = std::make_shared<CombatSnapshot>();
        Combatant const& me = sides_[Idx(side)];
        Combatant const& them = sides_[Idx(Other(side))];

        snap->turn = turns_;
        snap->turn_cap = turn_cap_;
        snap->me = side;
        snap->self = me.card;
        snap->opponent = them.card;
        snap->self_hp = me.hp;
        snap->opponent_hp = them.hp;
        snap->self_effects = me.effects;
        snap->opponent_effects = them.effects;
        return snap;
    }
}
