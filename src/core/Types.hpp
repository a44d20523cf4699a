//
// Created on 03/10/2025.
//

#ifndef DADDECK_TYPES_HPP
#define DADDECK_TYPES_HPP

#define DDK_ENABLE_TEST_HOOKS true

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>
#include <utility>

namespace daddeck::core::constants
{
    inline constexpr size_t StatCount = 8;
    inline constexpr size_t CategoryCount = 15;
    inline constexpr size_t RarityCount = 6;
    inline constexpr size_t StatusKindCount = 7;

    inline constexpr double StatMin = 0.0;
    inline constexpr double StatMax = 100.0;

    // Hard cap; Config::max_turns may only lower it.
    inline constexpr uint32_t MaxTurns = 10;
    inline constexpr uint8_t MaxStacks = 2;
    inline constexpr double StatusChance = 0.3;
    inline constexpr double HpPerPower = 10.0;
    inline constexpr size_t TeamSize = 3;
}

namespace daddeck::core
{
    enum class Stat : uint8_t
    {
        DadJoke = 0,
        GrillSkill,
        FixIt,
        NapPower,
        RemoteControl,
        Thermostat,
        SockSandal,
        BeerSnob
    };

    enum class Category : uint8_t
    {
        BbqDicktator = 0,
        FixItFuckboy,
        GolfGonad,
        CouchCummander,
        LawnLunatic,
        CarCock,
        OfficeOrgasms,
        CoolCucks,
        CoachCumsters,
        ChefCumsters,
        HolidayHorndogs,
        WarehouseWankers,
        VintageVagabonds,
        FashionFuck,
        TechTwats
    };

    // Declaration order is the tier order.
    enum class Rarity : uint8_t
    {
        Common = 0,
        Uncommon,
        Rare,
        Epic,
        Legendary,
        Mythic
    };

    enum class StatusKind : uint8_t
    {
        Grilled = 0,
        Lectured,
        Drunk,
        Wired,
        // legacy kinds, no stat modifier
        Awkward,
        Bored,
        Inspired
    };

    enum class Side : uint8_t
    {
        Attacker = 0,
        Defender
    };

    // Team battles are told from the player's (team A's) point of view.
    enum class TeamWinner : uint8_t
    {
        Player = 0,
        Opponent,
        Draw
    };

    inline auto Other(Side const s) -> Side
    {
        return s == Side::Attacker ? Side::Defender : Side::Attacker;
    }

    template <typename E>
    inline constexpr auto Idx(E const e) -> size_t
    {
        return static_cast<size_t>(std::to_underlying(e));
    }

    inline constexpr std::array<Stat, constants::StatCount> AllStats{
        Stat::DadJoke, Stat::GrillSkill, Stat::FixIt, Stat::NapPower,
        Stat::RemoteControl, Stat::Thermostat, Stat::SockSandal, Stat::BeerSnob
    };

    inline constexpr std::array<Category, constants::CategoryCount> AllCategories{
        Category::BbqDicktator, Category::FixItFuckboy, Category::GolfGonad,
        Category::CouchCummander, Category::LawnLunatic, Category::CarCock,
        Category::OfficeOrgasms, Category::CoolCucks, Category::CoachCumsters,
        Category::ChefCumsters, Category::HolidayHorndogs, Category::WarehouseWankers,
        Category::VintageVagabonds, Category::FashionFuck, Category::TechTwats
    };

    inline constexpr std::array<Rarity, constants::RarityCount> AllRarities{
        Rarity::Common, Rarity::Uncommon, Rarity::Rare,
        Rarity::Epic, Rarity::Legendary, Rarity::Mythic
    };

    inline constexpr std::array<StatusKind, constants::StatusKindCount> AllStatusKinds{
        StatusKind::Grilled, StatusKind::Lectured, StatusKind::Drunk, StatusKind::Wired,
        StatusKind::Awkward, StatusKind::Bored, StatusKind::Inspired
    };

    // Fixed vocabulary of 8 stats, indexed by Stat.
    struct StatSet
    {
        std::array<double, constants::StatCount> values{};

        static constexpr auto Uniform(double const v) -> StatSet
        {
            StatSet s{};
            s.values.fill(v);
            return s;
        }

        constexpr auto operator[](Stat const s) -> double& { return values[Idx(s)]; }
        constexpr auto operator[](Stat const s) const -> double { return values[Idx(s)]; }

        auto operator==(StatSet const&) const -> bool = default;
    };

    struct StatusEffect
    {
        StatusKind kind{StatusKind::Grilled};
        uint32_t duration{0}; // turns remaining
        uint8_t stacks{1};    // 1..MaxStacks

        auto operator==(StatusEffect const&) const -> bool = default;
    };

    struct Config
    {
        uint32_t max_turns{constants::MaxTurns};
        double   hp_per_power{constants::HpPerPower};
        double   status_chance{constants::StatusChance};
        size_t   team_size{constants::TeamSize};
        uint64_t seed{std::random_device{}()};
    };

    auto ToString(Stat s) -> std::string_view;
    auto ToString(Category c) -> std::string_view;
    auto ToString(Rarity r) -> std::string_view;
    auto ToString(StatusKind k) -> std::string_view;

    // nullopt for unknown names
    auto StatFromName(std::string_view name) -> std::optional<Stat>;
    auto CategoryFromName(std::string_view name) -> std::optional<Category>;
    auto RarityFromName(std::string_view name) -> std::optional<Rarity>;
    auto StatusKindFromName(std::string_view name) -> std::optional<StatusKind>;
}

#endif //DADDECK_TYPES_HPP
