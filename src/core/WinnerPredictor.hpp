//
// Created on 16/10/2025.
//

#ifndef DADDECK_WINNERPREDICTOR_HPP
#define DADDECK_WINNERPREDICTOR_HPP

#include <string>

#include "Card.hpp"

namespace daddeck::core
{
    struct Prediction
    {
        CCardSP winner;
        int confidence{50}; // percent
        std::string reason;
    };

    // Heuristic only; never runs a battle.
    class WinnerPredictor final
    {
    public:
        static auto Predict(CCardSP const& a, CCardSP const& b) -> Prediction;
    };
}

#endif //DADDECK_WINNERPREDICTOR_HPP
