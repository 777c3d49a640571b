#include "BinaryOption.hpp"

BinaryOption::BinaryOption(double T_, int nbTimeSteps_, double strike_, BinaryMonitoring monitoring_)
    : Option(T_, nbTimeSteps_, strike_), monitoring(monitoring_)
{
}

BinaryOption::~BinaryOption()
{
}

void BinaryOption::payoff(const PnlMat *path, PnlVect *payoffs) const
{
    checkPath(path);

    if (monitoring == BinaryMonitoring::PathAverage)
    {
        pnl_mat_sum_vect(payoffs, path, 'c');
        for (int i = 0; i < payoffs->size; i++)
        {
            LET(payoffs, i) = (GET(payoffs, i) / path->n > strike) ? 1.0 : 0.0;
        }
    }
    else
    {
        pnl_mat_get_col(payoffs, path, path->n - 1);
        for (int i = 0; i < payoffs->size; i++)
        {
            LET(payoffs, i) = (GET(payoffs, i) > strike) ? 1.0 : 0.0;
        }
    }
}

std::string BinaryOption::name() const
{
    return monitoring == BinaryMonitoring::PathAverage ? "Binary" : "BinaryTerminal";
}
