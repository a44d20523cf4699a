//
// Created on 03/10/2025.
//

#ifndef DADDECK_EXCEPTION_HPP
#define DADDECK_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "Types.hpp"

namespace daddeck::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rule table misuse (unbalanced matrix, bad lookup)
        State, // battle state machine misuse (stepping a finished battle)
        InvalidInput, // caller handed us data that breaks a model invariant
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidInputError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Rules: throw RulesError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::InvalidInput: throw InvalidInputError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define DDK_THROW(code_enum, msg) ::daddeck::core::error::fail((code_enum), (msg))
#define DDK_ASSERT(cond, msg) do { if(!(cond)) ::daddeck::core::error::fail(::daddeck::core::error::Code::Assertion, (msg)); } while(0)

    // Recoverable problems with caller-assembled decks and teams.
    enum class ViolationCode : std::uint16_t
    {
        // Deck
        Deck_Empty,
        Deck_NullCard,
        Deck_ZeroCount,
        Deck_DuplicateEntry,

        // Team
        Team_WrongSize,
        Team_NullCard,
        Team_DuplicateCards
    };

    struct Violation
    {
        ViolationCode code{};
        std::optional<std::size_t> entry{}; // position in the deck/team
        std::optional<std::string> card_id{};
        std::optional<std::uint32_t> expected{};
        std::optional<std::uint32_t> actual{};

        auto with_entry(std::size_t i) -> Violation&
        {
            entry = i;
            return *this;
        }

        auto with_card(std::string id) -> Violation&
        {
            card_id = std::move(id);
            return *this;
        }

        auto with_expected(std::uint32_t v) -> Violation&
        {
            expected = v;
            return *this;
        }

        auto with_actual(std::uint32_t v) -> Violation&
        {
            actual = v;
            return *this;
        }
    };

    inline auto to_string(ViolationCode c) -> std::string_view
    {
        using E = ViolationCode;
        switch (c)
        {
        case E::Deck_Empty: return "Deck: no cards";
        case E::Deck_NullCard: return "Deck: entry without a card";
        case E::Deck_ZeroCount: return "Deck: entry count must be positive";
        case E::Deck_DuplicateEntry: return "Deck: card listed in more than one entry";

        case E::Team_WrongSize: return "Team: wrong number of cards";
        case E::Team_NullCard: return "Team: slot without a card";
        case E::Team_DuplicateCards: return "Team: same card picked twice";
        }
        return "Unknown";
    }

    inline auto describe(Violation const& v) -> std::string
    {
        auto s = fmt::format("{}", to_string(v.code));
        if (v.entry) s += fmt::format(" | entry={}", *v.entry);
        if (v.card_id) s += fmt::format(" | card={}", *v.card_id);
        if (v.expected) s += fmt::format(" | expected={}", *v.expected);
        if (v.actual) s += fmt::format(" | actual={}", *v.actual);
        return s;
    }

    using ValidateResult = std::expected<void, Violation>;
}

#endif //DADDECK_EXCEPTION_HPP
