#pragma once

#include "Option.hpp"

enum class BinaryMonitoring
{
    PathAverage, /// compare la moyenne de la trajectoire au strike
    Terminal     /// compare le prix final au strike (digitale classique)
};

// Digitale cash-or-nothing call : paie 1 si le sous-jacent observe finit au-dessus du strike
class BinaryOption : public Option
{
public:
    BinaryMonitoring monitoring;

    BinaryOption(double T_, int nbTimeSteps_, double strike_,
                 BinaryMonitoring monitoring_ = BinaryMonitoring::PathAverage);
    ~BinaryOption();
    void payoff(const PnlMat *path, PnlVect *payoffs) const override;
    std::string name() const override;
};
