//
// Created on 04/10/2025.
//

#include "Card.hpp"

#include <cmath>

#include <fmt/format.h>

#include "Exception.hpp"

namespace daddeck::core
{
    namespace
    {
        auto CheckedStats(std::string const& id, StatSet const& stats) -> StatSet
        {
            for (auto const s : AllStats)
            {
                auto const v = stats[s];
                if (!std::isfinite(v) || v < constants::StatMin || v > constants::StatMax)
                {
                    DDK_THROW(error::Code::InvalidInput,
                              fmt::format("card '{}': stat {} = {} outside [{}, {}]", id, ToString(s), v,
                                          constants::StatMin, constants::StatMax));
                }
            }
            return stats;
        }
    }

    Card::Card(std::string id_, std::string name_, Category const category_, Rarity const rarity_,
               StatSet stats_, std::vector<Ability> abilities_, std::string subtitle_) :
        id{std::move(id_)},
        name{std::move(name_)},
        subtitle{std::move(subtitle_)},
        category{category_},
        rarity{rarity_},
        stats{CheckedStats(id, stats_)},
        abilities{std::move(abilities_)}
    {
    }
}
