//
// Created on 21/10/2025.
//

#ifndef DADDECK_REWARDS_HPP
#define DADDECK_REWARDS_HPP

#include <array>
#include <cstdint>
#include <string_view>

#include "Types.hpp"

namespace daddeck::core
{
    enum class RankedTier : uint8_t
    {
        Bronze = 0,
        Silver,
        Gold,
        Platinum,
        Diamond,
        Champion
    };

    inline constexpr std::array<double, 6> TierMultipliers{1.0, 1.2, 1.5, 2.0, 2.5, 3.0};

    struct BattleRewards
    {
        int xp{0};
        int rank_points{0};

        auto operator==(BattleRewards const&) const -> bool = default;
    };

    auto ToString(RankedTier t) -> std::string_view;

    // Unranked games pay a flat 10 XP whatever the result.
    auto CalculateRewards(TeamWinner winner, bool ranked, RankedTier tier) -> BattleRewards;

    auto TierFromRankPoints(int rank_points) -> RankedTier;

    // Leaderboard position band for the points within a tier (1 is best).
    auto CalculateRank(int rank_points, RankedTier tier) -> int;

    // Rounded percentage, 0 with no games.
    auto CalculateWinRate(uint32_t wins, uint32_t losses) -> int;
}

#endif //DADDECK_REWARDS_HPP
