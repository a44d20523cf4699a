//
// Created on 19/10/2025.
//

#include "TeamBattle.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "CardPower.hpp"
#include "Damage.hpp"
#include "TypeAdvantage.hpp"
#include "Util.hpp"

namespace daddeck::core
{
    namespace
    {
        auto Viol(error::ViolationCode const code) -> error::Violation
        {
            return error::Violation{.code = code};
        }

        auto CardsOf(BattleTeam const& t) -> std::vector<CCardSP>
        {
            std::vector<CCardSP> out;
            out.reserve(t.cards.size());
            for (auto const& bc : t.cards) out.push_back(bc.card);
            return out;
        }

        auto LivingIndices(BattleTeam const& t) -> std::vector<std::size_t>
        {
            std::vector<std::size_t> out;
            for (std::size_t i{}; i < t.cards.size(); ++i)
            {
                if (t.cards[i].alive) out.push_back(i);
            }
            return out;
        }

        auto AdvantageNote(double const adv) -> std::string_view
        {
            if (adv > 1.0) return " (Type advantage!)";
            if (adv < 1.0) return " (Type disadvantage...)";
            return "";
        }
    }

    auto ToString(TeamAction const a) -> std::string_view
    {
        switch (a)
        {
        case TeamAction::Start: return "start";
        case TeamAction::Attack: return "attack";
        case TeamAction::Knockout: return "knockout";
        case TeamAction::Victory: return "victory";
        }
        return "?";
    }

    auto BattleTeam::AliveCount() const -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(cards, &BattleCard::alive));
    }

    auto ValidateTeam(std::span<CCardSP const> cards, std::size_t const team_size) -> error::ValidateResult
    {
        using VC = error::ViolationCode;

        if (cards.size() != team_size)
            return std::unexpected(Viol(VC::Team_WrongSize)
                                   .with_expected(static_cast<uint32_t>(team_size))
                                   .with_actual(static_cast<uint32_t>(cards.size())));

        if (auto const missing = util::first_missing(cards))
            return std::unexpected(Viol(VC::Team_NullCard).with_entry(*missing));

        util::CardIdUniqueChecker checker{};
        for (std::size_t i{}; i < cards.size(); ++i)
        {
            if (!checker.Add(cards[i]->id))
                return std::unexpected(Viol(VC::Team_DuplicateCards).with_entry(i).with_card(cards[i]->id));
        }
        return {};
    }

    auto MakeTeam(std::span<CCardSP const> cards, std::string name, bool const is_player, Config const& cfg)
        -> BattleTeam
    {
        if (auto const ok = ValidateTeam(cards, cfg.team_size); !ok)
            DDK_THROW(error::Code::InvalidInput, fmt::format("team '{}': {}", name, error::describe(ok.error())));

        BattleTeam team{.name = std::move(name), .cards = {}, .is_player = is_player};
        team.cards.reserve(cards.size());
        for (std::size_t i{}; i < cards.size(); ++i)
        {
            double const hp = CardPowerCalculator::Power(*cards[i]) * cfg.hp_per_power;
            team.cards.push_back(BattleCard{
                .card = cards[i],
                .current_hp = hp,
                .max_hp = hp,
                .alive = hp > 0.0,
                .position = static_cast<uint8_t>(i + 1),
            });
        }
        return team;
    }

    auto PickOpponentTeam(std::span<CCardSP const> player_cards, std::span<CCardSP const> pool,
                          SeededRandom& rng, Config const& cfg) -> BattleTeam
    {
        DDK_ASSERT(!player_cards.empty(), "PickOpponentTeam needs the player's cards");
        DDK_ASSERT(!util::first_missing(pool), "PickOpponentTeam pool holds a missing card");

        double total = 0.0;
        for (auto const& c : player_cards) total += CardPowerCalculator::Power(*c);
        double const avg = total / static_cast<double>(player_cards.size());

        std::vector<CCardSP> eligible;
        std::ranges::copy_if(pool, std::back_inserter(eligible), [avg](CCardSP const& c)
        {
            double const p = CardPowerCalculator::Power(*c);
            return p >= avg * 0.8 && p <= avg * 1.2;
        });

        std::vector<CCardSP> picked;
        util::CardIdUniqueChecker used{};
        auto draw_from = [&](std::vector<CCardSP>& candidates)
        {
            while (picked.size() < cfg.team_size && !candidates.empty())
            {
                auto const idx = rng.PickIndex(candidates.size());
                if (used.Add(candidates[idx]->id)) picked.push_back(candidates[idx]);
                candidates.erase(candidates.begin() + static_cast<std::ptrdiff_t>(idx));
            }
        };

        draw_from(eligible);
        std::vector<CCardSP> rest(pool.begin(), pool.end());
        draw_from(rest);

        if (picked.size() < cfg.team_size)
            DDK_THROW(error::Code::InvalidInput,
                      fmt::format("pool has {} distinct cards, a team needs {}", picked.size(), cfg.team_size));

        return MakeTeam(picked, "Opponent's Dad Squad", false, cfg);
    }

    auto BattleSummary(TeamBattleResult const& result) -> std::string
    {
        std::string_view verdict;
        switch (result.winner)
        {
        case TeamWinner::Player: verdict = "VICTORY! Your dads dominated!"; break;
        case TeamWinner::Opponent: verdict = "DEFEAT! Your dads were out-dad-ed!"; break;
        case TeamWinner::Draw: verdict = "DRAW! An evenly matched battle!"; break;
        }
        return fmt::format("{}\nBattle lasted {} turns.\nYour team: {}/{} alive\nOpponent: {}/{} alive", verdict,
                           result.turns, result.player.AliveCount(), result.player.cards.size(),
                           result.opponent.AliveCount(), result.opponent.cards.size());
    }

    TeamBattle::TeamBattle(Config const& config, BattleTeam player, BattleTeam opponent) :
        cfg_(config),
        rng_{cfg_.seed},
        turn_cap_{std::min(cfg_.max_turns, constants::MaxTurns)},
        teams_{std::move(player), std::move(opponent)}
    {
        for (auto const& t : teams_)
        {
            auto const cards = CardsOf(t);
            if (auto const ok = ValidateTeam(cards, cfg_.team_size); !ok)
                DDK_THROW(error::Code::InvalidInput,
                          fmt::format("team '{}': {}", t.name, error::describe(ok.error())));
        }
    }

    auto TeamBattle::Simulate(BattleTeam player, BattleTeam opponent, Config const& config) -> TeamBattleResult
    {
        TeamBattle battle{config, std::move(player), std::move(opponent)};
        return battle.Run();
    }

    auto TeamBattle::Step() -> TurnOutcome
    {
        switch (phase_)
        {
        case BattlePhase::Start:
            log_.push_back(TeamLogEntry{
                .turn = 0,
                .action = TeamAction::Start,
                .description = fmt::format("BATTLE START: {} vs {}!", teams_[0].name, teams_[1].name),
            });
            phase_ = BattlePhase::Turn;
            return TurnOutcome::Started;
        case BattlePhase::Turn:
            break;
        case BattlePhase::Ended:
            DDK_THROW(error::Code::State, "Step called on a finished team battle");
        }

        if (turns_ >= turn_cap_ || teams_[0].AliveCount() == 0 || teams_[1].AliveCount() == 0)
        {
            Finish();
            return TurnOutcome::BattleEnded;
        }

        ++turns_;
        if (AttackWith(teams_[0], teams_[1]) || AttackWith(teams_[1], teams_[0]) || turns_ >= turn_cap_)
        {
            Finish();
            return TurnOutcome::BattleEnded;
        }
        return TurnOutcome::Applied;
    }

    auto TeamBattle::AttackWith(BattleTeam& attackers, BattleTeam& defenders) -> bool
    {
        for (auto& attacker : attackers.cards)
        {
            if (!attacker.alive) continue;

            auto const targets = LivingIndices(defenders);
            if (targets.empty()) return true;
            BattleCard& target = defenders.cards[targets[rng_.PickIndex(targets.size())]];

            Card const& a = *attacker.card;
            Card const& d = *target.card;
            double const adv = TypeAdvantageMatrix::Advantage(a.category, d.category);
            auto const roll = DamageCalculator::Calculate(a, d, Stat::DadJoke, Stat::DadJoke, rng_);
            int const dmg = std::max(1, static_cast<int>(std::floor(roll.damage * adv)));
            target.current_hp = std::max(0.0, target.current_hp - dmg);

            std::string const opener = a.abilities.empty()
                                           ? fmt::format("{} attacks!", a.name)
                                           : fmt::format("{} uses {}!", a.name, a.abilities.front().name);
            log_.push_back(TeamLogEntry{
                .turn = turns_,
                .action = TeamAction::Attack,
                .description = fmt::format("{} Hits {} for {} damage!{}", opener, d.name, dmg, AdvantageNote(adv)),
                .damage = dmg,
                .critical = roll.kind == HitKind::Critical,
            });

            if (target.current_hp <= 0.0)
            {
                target.alive = false;
                log_.push_back(TeamLogEntry{
                    .turn = turns_,
                    .action = TeamAction::Knockout,
                    .description = fmt::format("{} has been knocked out!", d.name),
                });
                if (defenders.AliveCount() == 0) return true;
            }
        }
        return false;
    }

    auto TeamBattle::Finish() -> void
    {
        auto const a = teams_[0].AliveCount();
        auto const b = teams_[1].AliveCount();
        std::string description;
        if (a > b)
        {
            winner_ = TeamWinner::Player;
            description = fmt::format("{} WINS!", teams_[0].name);
        }
        else if (b > a)
        {
            winner_ = TeamWinner::Opponent;
            description = fmt::format("{} WINS!", teams_[1].name);
        }
        else
        {
            winner_ = TeamWinner::Draw;
            description = "It's a DRAW!";
        }
        log_.push_back(TeamLogEntry{.turn = turns_, .action = TeamAction::Victory, .description = std::move(description)});
        phase_ = BattlePhase::Ended;
    }

    auto TeamBattle::Run() -> TeamBattleResult
    {
        while (phase_ != BattlePhase::Ended)
        {
            Step();
        }
        return Result();
    }

    auto TeamBattle::Result() const -> TeamBattleResult
    {
        if (phase_ != BattlePhase::Ended)
            DDK_THROW(error::Code::State, "Result requested before the team battle ended");

        return TeamBattleResult{
            .winner = winner_,
            .player = teams_[0],
            .opponent = teams_[1],
            .turns = turns_,
            .log = log_,
        };
    }
}
