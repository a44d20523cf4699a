//
// Created on 14/10/2025.
//

#ifndef DADDECK_DECKBATTLE_HPP
#define DADDECK_DECKBATTLE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Damage.hpp"
#include "Deck.hpp"
#include "Types.hpp"

namespace daddeck::core
{
    struct DeckPowerBreakdown
    {
        double total_power{};     // mean of the deck's average stats
        double effective_power{}; // after type advantage
        double final_power{};     // after deck-wide synergy
        StatSet normalized_stats{};
        Category main_type{Category::BbqDicktator};
    };

    struct BattleResult
    {
        CDeckSP winner;
        CDeckSP loser;
        Side winner_side{Side::Attacker};
        int damage{1};
        double type_advantage{1.0};
        double synergy_bonus{1.0};
        HitKind hit{HitKind::Normal};
        double variance{1.0};
        uint64_t seed{};
        DeckPowerBreakdown attacker_stats;
        DeckPowerBreakdown defender_stats;
        std::vector<std::string> log;
    };

    class DeckBattleResolver final
    {
    public:
        // Single-exchange verdict. Without a seed one is drawn from std::random_device.
        static auto Resolve(CDeckSP const& attacker, CDeckSP const& defender,
                            std::optional<uint64_t> seed = std::nullopt) -> BattleResult;
    };
}

#endif //DADDECK_DECKBATTLE_HPP
