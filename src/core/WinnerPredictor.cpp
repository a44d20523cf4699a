//
// Created on 16/10/2025.
//

#include "WinnerPredictor.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "CardPower.hpp"
#include "Exception.hpp"
#include "Synergy.hpp"
#include "TypeAdvantage.hpp"

namespace daddeck::core
{
    namespace
    {
        constexpr int SynergyConfidence = 85;
        constexpr double DominanceRatio = 1.2;
    }

    auto WinnerPredictor::Predict(CCardSP const& a, CCardSP const& b) -> Prediction
    {
        DDK_ASSERT(a && b, "Predict needs two cards");

        if (auto const s = SynergyCalculator::CheckSynergy(*a, *b); s.has_synergy)
            return Prediction{a, SynergyConfidence, fmt::format("Has synergy: {}", s.name)};
        if (auto const s = SynergyCalculator::CheckSynergy(*b, *a); s.has_synergy)
            return Prediction{b, SynergyConfidence, fmt::format("Has synergy: {}", s.name)};

        double const eff_a = CardPowerCalculator::Power(*a) * TypeAdvantageMatrix::Advantage(a->category, b->category);
        double const eff_b = CardPowerCalculator::Power(*b) * TypeAdvantageMatrix::Advantage(b->category, a->category);

        bool const a_leads = eff_a >= eff_b;
        double const hi = a_leads ? eff_a : eff_b;
        double const lo = a_leads ? eff_b : eff_a;
        CCardSP const& leader = a_leads ? a : b;

        // two powerless cards are an even match
        double const ratio = lo > 0.0 ? hi / lo : (hi > 0.0 ? DominanceRatio * 2.0 : 1.0);

        if (ratio > DominanceRatio)
        {
            int const confidence = std::min(95, 75 + static_cast<int>(std::lround((ratio - DominanceRatio) * 50.0)));
            return Prediction{leader, confidence,
                              fmt::format("Significantly higher power ({:.1f} vs {:.1f})", hi, lo)};
        }

        int const confidence = std::min(75, 50 + static_cast<int>(std::lround((ratio - 1.0) * 125.0)));
        return Prediction{leader, confidence, "Close match! Could go either way."};
    }
}
