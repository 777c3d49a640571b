#ifndef BLACK_SCHOLES_MODEL_HPP
#define BLACK_SCHOLES_MODEL_HPP
#include "pnl/pnl_vector.h"
#include "pnl/pnl_matrix.h"
#include "pnl/pnl_random.h"
#include "SimulationParameters.hpp"

// Diffusion lognormale d'un sous-jacent : dS = r S dt + sigma S dW
class BlackScholesModel
{
public:
    double spot;
    double interestRate;
    double volatility;
    int nbTimeSteps;
    double dt;
    PnlVect *G;

public:
    explicit BlackScholesModel(const SimulationParameters &params);
    ~BlackScholesModel();
    BlackScholesModel(const BlackScholesModel &) = delete;
    BlackScholesModel &operator=(const BlackScholesModel &) = delete;

    // Simule nSamples trajectoires dans path (nSamples x nbTimeSteps).
    // La colonne j contient le prix apres j+1 pas ; le spot n'apparait pas.
    void asset(PnlMat *path, int nSamples, PnlRng *rng);
};
#endif
