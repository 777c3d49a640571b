#include "BlackScholesFormula.hpp"
#include <algorithm>
#include <cmath>

double normCdf(double x)
{
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double bsCall(const SimulationParameters &params)
{
    const double S = params.spot;
    const double K = params.strike;
    const double T = params.maturity;
    const double discountedK = K * std::exp(-params.interestRate * T);

    // Volatilite nulle : le prix final est deterministe
    if (params.volatility == 0.0) {
        return std::max(S - discountedK, 0.0);
    }

    const double volSqrtT = params.volatility * std::sqrt(T);
    const double d1 = (std::log(S / K) + (params.interestRate + 0.5 * params.volatility * params.volatility) * T) / volSqrtT;
    const double d2 = d1 - volSqrtT;
    return S * normCdf(d1) - discountedK * normCdf(d2);
}

double bsPut(const SimulationParameters &params)
{
    // Parite call-put
    return bsCall(params) - params.spot + params.strike * std::exp(-params.interestRate * params.maturity);
}
