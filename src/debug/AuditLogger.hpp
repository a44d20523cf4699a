//
// Created on 13/10/2025.
//

#ifndef DADDECK_AUDITLOGGER_HPP
#define DADDECK_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>

#include "../core/BattleSimulator.hpp"
#include "../core/DeckBattle.hpp"
#include "../core/TeamBattle.hpp"

namespace daddeck::core::debug
{
    // Plain-text battle transcript, one file per session.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

        // Session header (mode, seed)
        auto start(std::string_view mode, std::uint64_t seed) -> void;

        // Free-form note
        auto line(std::string_view text) -> void;

        // Deck vs deck: breakdown, the resolver's log, verdict footer
        auto result(BattleResult const& r) -> void;

        // Card vs card: the simulator's log and verdict footer
        auto card_battle(CardBattleResult const& r) -> void;

        // Team vs team: every log entry, then the summary
        auto team_battle(TeamBattleResult const& r) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //DADDECK_AUDITLOGGER_HPP
