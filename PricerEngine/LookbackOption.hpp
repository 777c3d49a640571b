#pragma once

#include "Option.hpp"

// Lookback a strike fixe :
//   call : max(max(S) - K, 0)
//   put  : max(K - min(S), 0)
class LookbackOption : public Option
{
public:
    CallPut kind;

    LookbackOption(double T_, int nbTimeSteps_, double strike_, CallPut kind_);
    ~LookbackOption();
    void payoff(const PnlMat *path, PnlVect *payoffs) const override;
    std::string name() const override;
};
