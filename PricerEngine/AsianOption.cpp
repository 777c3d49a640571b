#include "AsianOption.hpp"
#include <algorithm>

AsianOption::AsianOption(double T_, int nbTimeSteps_, double strike_)
    : Option(T_, nbTimeSteps_, strike_)
{
}

AsianOption::~AsianOption()
{
}

void AsianOption::payoff(const PnlMat *path, PnlVect *payoffs) const
{
    checkPath(path);

    // Somme de chaque ligne, puis moyenne sur les dates de constatation
    pnl_mat_sum_vect(payoffs, path, 'c');
    for (int i = 0; i < payoffs->size; i++)
    {
        LET(payoffs, i) = std::max(GET(payoffs, i) / path->n - strike, 0.0);
    }
}

std::string AsianOption::name() const
{
    return "Asian";
}
