//
// Created on 04/10/2025.
//

#ifndef DADDECK_SEEDEDRANDOM_HPP
#define DADDECK_SEEDEDRANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "Exception.hpp"

namespace daddeck::core
{
    // Mulberry32. Same seed, same sequence, on every platform.
    class SeededRandom
    {
    public:
        // Only the low 32 bits of the seed take part.
        explicit SeededRandom(uint64_t seed) noexcept;

        // [0, 1)
        auto Next() noexcept -> double;

        // integer in [min, max)
        auto Range(int64_t min, int64_t max) noexcept -> int64_t;

        // Box-Muller, one draw pair per call
        auto Normal(double mean = 0.0, double std_dev = 1.0) noexcept -> double;

        auto Chance(double p) noexcept -> bool { return Next() < p; }

        auto PickIndex(std::size_t size) -> std::size_t
        {
            DDK_ASSERT(size > 0, "PickIndex on an empty range");
            return static_cast<std::size_t>(Next() * static_cast<double>(size));
        }

        template <typename T>
        auto Pick(std::span<T const> items) -> T const&
        {
            return items[PickIndex(items.size())];
        }

        [[nodiscard]]
        auto State() const noexcept -> uint32_t { return state_; }

    private:
        uint32_t state_;
    };

    // DJB2 over the bytes of the text, kept to 32 bits.
    auto HashSeed(std::string_view text) noexcept -> uint32_t;
}

#endif //DADDECK_SEEDEDRANDOM_HPP
