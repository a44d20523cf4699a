//
// Created on 04/10/2025.
//

#include "SeededRandom.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace daddeck::core
{
    SeededRandom::SeededRandom(uint64_t const seed) noexcept :
        state_{static_cast<uint32_t>(seed)}
    {
    }

    auto SeededRandom::Next() noexcept -> double
    {
        state_ += 0x6D2B79F5u;
        uint32_t t = state_;
        t = (t ^ (t >> 15)) * (t | 1u);
        t ^= t + (t ^ (t >> 7)) * (t | 61u);
        return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
    }

    auto SeededRandom::Range(int64_t const min, int64_t const max) noexcept -> int64_t
    {
        return static_cast<int64_t>(std::floor(Next() * static_cast<double>(max - min))) + min;
    }

    auto SeededRandom::Normal(double const mean, double const std_dev) noexcept -> double
    {
        // log(0) would blow up
        double const u1 = std::max(Next(), std::numeric_limits<double>::min());
        double const u2 = Next();
        double const z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
        return z0 * std_dev + mean;
    }

    auto HashSeed(std::string_view const text) noexcept -> uint32_t
    {
        uint32_t hash = 5381;
        for (char const c : text)
        {
            hash = (hash << 5) + hash + static_cast<unsigned char>(c);
        }
        return hash;
    }
}
