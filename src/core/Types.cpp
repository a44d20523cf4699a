//
// Created on 03/10/2025.
//

#include "Types.hpp"

namespace daddeck::core
{
    namespace
    {
        template <typename E, std::size_t N>
        auto FromName(std::array<E, N> const& all, std::string_view const name) -> std::optional<E>
        {
            for (auto const e : all)
            {
                if (ToString(e) == name) return e;
            }
            return std::nullopt;
        }
    }

    auto ToString(Stat const s) -> std::string_view
    {
        switch (s)
        {
        case Stat::DadJoke: return "dadJoke";
        case Stat::GrillSkill: return "grillSkill";
        case Stat::FixIt: return "fixIt";
        case Stat::NapPower: return "napPower";
        case Stat::RemoteControl: return "remoteControl";
        case Stat::Thermostat: return "thermostat";
        case Stat::SockSandal: return "sockSandal";
        case Stat::BeerSnob: return "beerSnob";
        }
        return "?";
    }

    auto ToString(Category const c) -> std::string_view
    {
        switch (c)
        {
        case Category::BbqDicktator: return "BBQ_DICKTATOR";
        case Category::FixItFuckboy: return "FIX_IT_FUCKBOY";
        case Category::GolfGonad: return "GOLF_GONAD";
        case Category::CouchCummander: return "COUCH_CUMMANDER";
        case Category::LawnLunatic: return "LAWN_LUNATIC";
        case Category::CarCock: return "CAR_COCK";
        case Category::OfficeOrgasms: return "OFFICE_ORGASMS";
        case Category::CoolCucks: return "COOL_CUCKS";
        case Category::CoachCumsters: return "COACH_CUMSTERS";
        case Category::ChefCumsters: return "CHEF_CUMSTERS";
        case Category::HolidayHorndogs: return "HOLIDAY_HORNDOGS";
        case Category::WarehouseWankers: return "WAREHOUSE_WANKERS";
        case Category::VintageVagabonds: return "VINTAGE_VAGABONDS";
        case Category::FashionFuck: return "FASHION_FUCK";
        case Category::TechTwats: return "TECH_TWATS";
        }
        return "?";
    }

    auto ToString(Rarity const r) -> std::string_view
    {
        switch (r)
        {
        case Rarity::Common: return "common";
        case Rarity::Uncommon: return "uncommon";
        case Rarity::Rare: return "rare";
        case Rarity::Epic: return "epic";
        case Rarity::Legendary: return "legendary";
        case Rarity::Mythic: return "mythic";
        }
        return "?";
    }

    auto ToString(StatusKind const k) -> std::string_view
    {
        switch (k)
        {
        case StatusKind::Grilled: return "grilled";
        case StatusKind::Lectured: return "lectured";
        case StatusKind::Drunk: return "drunk";
        case StatusKind::Wired: return "wired";
        case StatusKind::Awkward: return "awkward";
        case StatusKind::Bored: return "bored";
        case StatusKind::Inspired: return "inspired";
        }
        return "?";
    }

    auto StatFromName(std::string_view const name) -> std::optional<Stat>
    {
        return FromName(AllStats, name);
    }

    auto CategoryFromName(std::string_view const name) -> std::optional<Category>
    {
        return FromName(AllCategories, name);
    }

    auto RarityFromName(std::string_view const name) -> std::optional<Rarity>
    {
        return FromName(AllRarities, name);
    }

    auto StatusKindFromName(std::string_view const name) -> std::optional<StatusKind>
    {
        return FromName(AllStatusKinds, name);
    }
}
