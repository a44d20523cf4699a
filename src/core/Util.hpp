//
// Created on 03/10/2025.
//

#ifndef DADDECK_UTIL_HPP
#define DADDECK_UTIL_HPP

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>

namespace daddeck::core::util
{
    // Index of the first empty pointer, if any.
    template <typename Ptr>
    inline auto first_missing(std::span<Ptr const> ptrs) -> std::optional<std::size_t>
    {
        auto const it = std::ranges::find_if(ptrs, [](Ptr const& p) { return p == nullptr; });
        if (it == ptrs.end()) return std::nullopt;
        return static_cast<std::size_t>(it - ptrs.begin());
    }

    class CardIdUniqueChecker
    {
    public:
        // false when the id was already seen
        auto Add(std::string_view const id) -> bool
        {
            return seen_.emplace(id).second;
        }

    private:
        std::unordered_set<std::string> seen_;
    };
}

#endif //DADDECK_UTIL_HPP
