//
// Created on 14/10/2025.
//

#include "Deck.hpp"

#include <fmt/format.h>

#include "Util.hpp"

namespace daddeck::core
{
    namespace
    {
        auto Viol(error::ViolationCode const code) -> error::Violation
        {
            return error::Violation{.code = code};
        }

        auto Aggregate(std::vector<DeckEntry> const& entries) -> DeckStats
        {
            DeckStats s{};
            for (auto const& [card, count] : entries)
            {
                s.total_cards += count;
                ++s.unique_cards;
                s.category_counts[Idx(card->category)] += count;
                s.rarity_counts[Idx(card->rarity)] += count;
                for (auto const st : AllStats)
                {
                    s.stat_totals[st] += card->stats[st] * count;
                }
            }
            if (s.total_cards > 0)
            {
                for (auto const st : AllStats)
                {
                    s.average_stats[st] = s.stat_totals[st] / s.total_cards;
                }
            }
            return s;
        }
    }

    auto DeckStats::MainType() const noexcept -> Category
    {
        Category best = AllCategories.front();
        for (auto const c : AllCategories)
        {
            if (CountOf(c) > CountOf(best)) best = c;
        }
        return best;
    }

    Deck::Deck(std::string id, std::string name, std::vector<DeckEntry> entries) :
        id_{std::move(id)},
        name_{std::move(name)},
        entries_{std::move(entries)}
    {
        for (std::size_t i = 0; i < entries_.size(); ++i)
        {
            if (!entries_[i].card)
                DDK_THROW(error::Code::InvalidInput, fmt::format("deck '{}': entry {} has no card", id_, i));
            if (entries_[i].count == 0)
                DDK_THROW(error::Code::InvalidInput,
                          fmt::format("deck '{}': entry {} ({}) has count 0", id_, i, entries_[i].card->id));
        }
        stats_ = Aggregate(entries_);
    }

    auto ValidateDeck(Deck const& deck) -> error::ValidateResult
    {
        using VC = error::ViolationCode;

        auto const& entries = deck.Entries();
        if (entries.empty())
            return std::unexpected(Viol(VC::Deck_Empty).with_actual(0));

        util::CardIdUniqueChecker checker{};
        for (std::size_t i = 0; i < entries.size(); ++i)
        {
            auto const& e = entries[i];
            if (!e.card)
                return std::unexpected(Viol(VC::Deck_NullCard).with_entry(i));
            if (e.count == 0)
                return std::unexpected(Viol(VC::Deck_ZeroCount).with_entry(i).with_card(e.card->id));
            if (!checker.Add(e.card->id))
                return std::unexpected(Viol(VC::Deck_DuplicateEntry).with_entry(i).with_card(e.card->id));
        }
        return {};
    }
}
