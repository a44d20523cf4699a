//
// Created on 14/10/2025.
//

#ifndef DADDECK_DECK_HPP
#define DADDECK_DECK_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Card.hpp"
#include "Exception.hpp"
#include "Types.hpp"

namespace daddeck::core
{
    struct DeckEntry
    {
        CCardSP card;
        uint32_t count{1};
    };

    // Histograms count duplicates.
    struct DeckStats
    {
        uint32_t total_cards{0};
        uint32_t unique_cards{0};
        StatSet stat_totals{};
        StatSet average_stats{}; // all zeros for an empty deck
        std::array<uint32_t, constants::CategoryCount> category_counts{};
        std::array<uint32_t, constants::RarityCount> rarity_counts{};

        auto CountOf(Category const c) const noexcept -> uint32_t { return category_counts[Idx(c)]; }
        auto CountOf(Rarity const r) const noexcept -> uint32_t { return rarity_counts[Idx(r)]; }

        // Highest count; the earliest category wins ties.
        [[nodiscard]]
        auto MainType() const noexcept -> Category;
    };

    class Deck
    {
    public:
        // Throws InvalidInputError on a missing card or a zero count.
        Deck(std::string id, std::string name, std::vector<DeckEntry> entries);

        Deck(Deck const&) = delete;
        auto operator=(Deck const&) -> Deck& = delete;

        auto Id() const noexcept -> std::string const& { return id_; }
        auto Name() const noexcept -> std::string const& { return name_; }
        auto Entries() const noexcept -> std::vector<DeckEntry> const& { return entries_; }
        auto Stats() const noexcept -> DeckStats const& { return stats_; }

    private:
        std::string id_;
        std::string name_;
        std::vector<DeckEntry> entries_;
        DeckStats stats_;
    };

    using CDeckSP = std::shared_ptr<Deck const>;

    inline auto MakeDeck(std::string id, std::string name, std::vector<DeckEntry> entries) -> CDeckSP
    {
        return std::make_shared<Deck const>(std::move(id), std::move(name), std::move(entries));
    }

    // Non-empty and each card listed in a single entry.
    auto ValidateDeck(Deck const& deck) -> error::ValidateResult;
}

#endif //DADDECK_DECK_HPP
