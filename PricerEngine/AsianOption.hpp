#pragma once

#include "Option.hpp"

// Call asiatique arithmetique : max(moyenne(S_t1..S_tM) - K, 0)
class AsianOption : public Option
{
public:
    AsianOption(double T_, int nbTimeSteps_, double strike_);
    ~AsianOption();
    void payoff(const PnlMat *path, PnlVect *payoffs) const override;
    std::string name() const override;
};
