//
// Created on 13/10/2025.
//

#ifndef DADDECK_RECORDINGTACTIC_HPP
#define DADDECK_RECORDINGTACTIC_HPP

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "../core/Tactic.hpp"

namespace daddeck::core::debug
{
    // Wraps a tactic and remembers every ability it picked.
    class RecordingTactic final : public Tactic
    {
    public:
        explicit RecordingTactic(std::unique_ptr<Tactic> inner)
            : inner_{std::move(inner)}
        {
        }

        auto ChooseAbility(std::shared_ptr<CombatSnapshot const> s) -> std::size_t override
        {
            last_turn_ = s->turn;
            picks_.push_back(inner_->ChooseAbility(std::move(s)));
            return picks_.back();
        }

        auto Picks() const -> std::vector<std::size_t> const&
        {
            return picks_;
        }

        auto LastTurn() const -> uint32_t
        {
            return last_turn_;
        }

    private:
        std::unique_ptr<Tactic> inner_;
        std::vector<std::size_t> picks_;
        uint32_t last_turn_{0};
    };

    // Only safe on tactics built as RecordingTactic
    inline auto AsRecording(Tactic* t) -> RecordingTactic*
    {
        return dynamic_cast<RecordingTactic*>(t);
    }
}

#endif //DADDECK_RECORDINGTACTIC_HPP
