#include "BlackScholesModel.hpp"
#include "PricingErrors.hpp"
#include <cmath>
#include <sstream>

BlackScholesModel::BlackScholesModel(const SimulationParameters &params)
{
    params.validate();
    spot = params.spot;
    interestRate = params.interestRate;
    volatility = params.volatility;
    nbTimeSteps = params.nbTimeSteps;
    dt = params.timeStep();
    G = pnl_vect_create_from_zero(nbTimeSteps);
}

BlackScholesModel::~BlackScholesModel()
{
    pnl_vect_free(&G);
}

void BlackScholesModel::asset(PnlMat *path, int nSamples, PnlRng *rng)
{
    pnl_mat_resize(path, nSamples, nbTimeSteps);

    // Transition exacte du GBM sur un pas : pas de biais de discretisation
    const double drift = (interestRate - 0.5 * volatility * volatility) * dt;
    const double volSqrtDt = volatility * std::sqrt(dt);

    for (int i = 0; i < nSamples; ++i) {
        pnl_vect_rng_normal(G, nbTimeSteps, rng);

        double S = spot;
        for (int j = 0; j < nbTimeSteps; ++j) {
            S *= std::exp(drift + volSqrtDt * GET(G, j));
            if (!std::isfinite(S) || S <= 0.0) {
                std::ostringstream err;
                err << "Simulated price is not a finite positive number at path " << i
                    << ", step " << j << " (value " << S << ")";
                throw NumericOverflowError(err.str());
            }
            MLET(path, i, j) = S;
        }
    }
}
