#pragma once

#include "Option.hpp"

// Vanille sur le prix final : max(S_T - K, 0) ou max(K - S_T, 0)
class EuropeanOption : public Option
{
public:
    CallPut kind;

    EuropeanOption(double T_, int nbTimeSteps_, double strike_, CallPut kind_);
    ~EuropeanOption();
    void payoff(const PnlMat *path, PnlVect *payoffs) const override;
    std::string name() const override;
};
