#include "EuropeanOption.hpp"
#include <algorithm>

EuropeanOption::EuropeanOption(double T_, int nbTimeSteps_, double strike_, CallPut kind_)
    : Option(T_, nbTimeSteps_, strike_), kind(kind_)
{
}

EuropeanOption::~EuropeanOption()
{
}

void EuropeanOption::payoff(const PnlMat *path, PnlVect *payoffs) const
{
    checkPath(path);

    pnl_mat_get_col(payoffs, path, path->n - 1);
    const double sign = (kind == CallPut::Call) ? 1.0 : -1.0;
    for (int i = 0; i < payoffs->size; i++)
    {
        LET(payoffs, i) = std::max(sign * (GET(payoffs, i) - strike), 0.0);
    }
}

std::string EuropeanOption::name() const
{
    return kind == CallPut::Call ? "EuropeanCall" : "EuropeanPut";
}
