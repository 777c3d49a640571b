#include "LookbackOption.hpp"
#include <algorithm>

LookbackOption::LookbackOption(double T_, int nbTimeSteps_, double strike_, CallPut kind_)
    : Option(T_, nbTimeSteps_, strike_), kind(kind_)
{
}

LookbackOption::~LookbackOption()
{
}

void LookbackOption::payoff(const PnlMat *path, PnlVect *payoffs) const
{
    checkPath(path);

    if (kind == CallPut::Call)
    {
        pnl_mat_max(payoffs, path, 'c');
        for (int i = 0; i < payoffs->size; i++)
        {
            LET(payoffs, i) = std::max(GET(payoffs, i) - strike, 0.0);
        }
    }
    else
    {
        pnl_mat_min(payoffs, path, 'c');
        for (int i = 0; i < payoffs->size; i++)
        {
            LET(payoffs, i) = std::max(strike - GET(payoffs, i), 0.0);
        }
    }
}

std::string LookbackOption::name() const
{
    return kind == CallPut::Call ? "LookbackCall" : "LookbackPut";
}
