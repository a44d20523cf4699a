#include "AuditLogger.hpp"

#include <fmt/format.h>

using namespace daddeck::core;

namespace
{

auto s_side(Side const s) -> std::string_view
{
    return s == Side::Attacker ? "A" : "D";
}

auto s_winner(TeamWinner const w) -> std::string_view
{
    switch (w)
    {
        case TeamWinner::Player:   return "player";
        case TeamWinner::Opponent: return "opponent";
        case TeamWinner::Draw:     return "draw";
    }
    return "?";
}

auto s_breakdown(DeckPowerBreakdown const& b) -> std::string
{
    return fmt::format("type={} total={:.2f} effective={:.2f} final={:.2f}",
                       ToString(b.main_type), b.total_power, b.effective_power, b.final_power);
}

auto s_team(BattleTeam const& t) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < t.cards.size(); ++i)
    {
        auto const& bc = t.cards[i];
        body += fmt::format("{}{}:{:.0f}/{:.0f}{}", (i ? "," : ""), bc.card->id, bc.current_hp, bc.max_hp,
                            bc.alive ? "" : "(KO)");
    }
    return body;
}

} // anonymous namespace

namespace daddeck::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(std::string_view const mode, std::uint64_t const seed) -> void
{
    out_ << fmt::format("Mode={}\n", mode);
    out_ << fmt::format("Seed={}\n", seed);
    out_.flush();
}

auto AuditLogger::line(std::string_view const text) -> void
{
    out_ << text << '\n';
}

auto AuditLogger::result(BattleResult const& r) -> void
{
    out_ << fmt::format("Attacker: {}\n", s_breakdown(r.attacker_stats));
    out_ << fmt::format("Defender: {}\n", s_breakdown(r.defender_stats));
    for (auto const& l : r.log)
    {
        line(l);
    }
    out_ << fmt::format("Winner={} side={} damage={} hit={} advantage={:.2f} synergy={:.2f}\n",
                        r.winner->Id(), s_side(r.winner_side), r.damage, ToString(r.hit), r.type_advantage,
                        r.synergy_bonus);
    out_.flush();
}

auto AuditLogger::card_battle(CardBattleResult const& r) -> void
{
    for (auto const& l : r.log)
    {
        line(l);
    }
    out_ << fmt::format("Winner={} side={} turns={} hp=[{:.1f},{:.1f}]\n", r.winner->id, s_side(r.winner_side),
                        r.turns, r.remaining_hp[0], r.remaining_hp[1]);
    out_.flush();
}

auto AuditLogger::team_battle(TeamBattleResult const& r) -> void
{
    for (auto const& e : r.log)
    {
        out_ << fmt::format("[{}] {}: {}{}\n", e.turn, ToString(e.action), e.description,
                            e.critical ? " (critical)" : "");
    }
    out_ << fmt::format("Player=[{}]\n", s_team(r.player));
    out_ << fmt::format("Opponent=[{}]\n", s_team(r.opponent));
    out_ << fmt::format("Winner={} turns={}\n", s_winner(r.winner), r.turns);
    out_ << BattleSummary(r) << '\n';
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace daddeck::core::debug
