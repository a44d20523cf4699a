//
// Created on 21/10/2025.
//

#include "Rewards.hpp"

#include <algorithm>
#include <cmath>

namespace daddeck::core
{
    namespace
    {
        struct TierBand
        {
            int floor_points; // rank points where the tier starts
            int best_rank;
            int worst_rank;
        };

        constexpr std::array<TierBand, 6> Bands{{
            {0, 1001, 999999},  // bronze
            {1000, 501, 1000},  // silver
            {2000, 201, 500},   // gold
            {3000, 51, 200},    // platinum
            {4000, 11, 50},     // diamond
            {5000, 1, 10},      // champion
        }};

        constexpr int PointsPerRankStep = 50;
    }

    auto ToString(RankedTier const t) -> std::string_view
    {
        switch (t)
        {
        case RankedTier::Bronze: return "bronze";
        case RankedTier::Silver: return "silver";
        case RankedTier::Gold: return "gold";
        case RankedTier::Platinum: return "platinum";
        case RankedTier::Diamond: return "diamond";
        case RankedTier::Champion: return "champion";
        }
        return "?";
    }

    auto CalculateRewards(TeamWinner const winner, bool const ranked, RankedTier const tier) -> BattleRewards
    {
        if (!ranked) return BattleRewards{.xp = 10, .rank_points = 0};

        double const m = TierMultipliers[Idx(tier)];
        switch (winner)
        {
        case TeamWinner::Player:
            return BattleRewards{.xp = static_cast<int>(std::floor(50.0 * m)),
                                 .rank_points = static_cast<int>(std::floor(25.0 * m))};
        case TeamWinner::Opponent:
            return BattleRewards{.xp = 10, .rank_points = static_cast<int>(std::floor(-10.0 * m))};
        case TeamWinner::Draw:
            break;
        }
        return BattleRewards{.xp = 25, .rank_points = 0};
    }

    auto TierFromRankPoints(int const rank_points) -> RankedTier
    {
        if (rank_points >= 5000) return RankedTier::Champion;
        if (rank_points >= 4000) return RankedTier::Diamond;
        if (rank_points >= 3000) return RankedTier::Platinum;
        if (rank_points >= 2000) return RankedTier::Gold;
        if (rank_points >= 1000) return RankedTier::Silver;
        return RankedTier::Bronze;
    }

    auto CalculateRank(int const rank_points, RankedTier const tier) -> int
    {
        if (tier == RankedTier::Bronze)
        {
            auto const climbed = static_cast<int>(std::floor((rank_points - 999) / 2.0));
            return std::max(1001, 1001 - climbed);
        }

        auto const& band = Bands[Idx(tier)];
        int const tier_points = rank_points - band.floor_points;
        int const tier_size = band.worst_rank - band.best_rank + 1;
        int const position = tier_size - static_cast<int>(std::floor(tier_points / static_cast<double>(PointsPerRankStep)));
        return std::clamp(position, band.best_rank, band.worst_rank);
    }

    auto CalculateWinRate(uint32_t const wins, uint32_t const losses) -> int
    {
        uint64_t const total = static_cast<uint64_t>(wins) + losses;
        if (total == 0) return 0;
        return static_cast<int>(std::lround(static_cast<double>(wins) / static_cast<double>(total) * 100.0));
    }
}
