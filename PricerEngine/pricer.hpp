#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include "pnl/pnl_vector.h"
#include "pnl/pnl_matrix.h"
#include "pnl/pnl_random.h"
#include "Option.hpp"
#include "BlackScholesModel.hpp"
#include "SimulationParameters.hpp"

struct PricingResult
{
    double price;         /// Moyenne actualisee des payoffs
    double variance;      /// Variance empirique (voir VarianceConvention)
    double standardError; /// sqrt(variance / N)
    double ciLow;         /// Intervalle de confiance a 95%
    double ciHigh;
    int nSamples;
};

class BlackScholesPricer {
public:
    const SimulationParameters params; /// Parametres figes pour toute la simulation
    BlackScholesModel *model;    /// Modele de diffusion
    PnlRng *rng;                 /// Generateur de nombres aleatoires, propre a ce pricer
    PnlMat *paths;               /// Trajectoires simulees (nSamples x nbTimeSteps)
    bool simulated;

    explicit BlackScholesPricer(const SimulationParameters &params_);
    explicit BlackScholesPricer(const nlohmann::json &jsonParams);
    ~BlackScholesPricer();
    BlackScholesPricer(const BlackScholesPricer &) = delete;
    BlackScholesPricer &operator=(const BlackScholesPricer &) = delete;

    // Resimule l'ensemble des trajectoires et les renvoie (lecture seule)
    const PnlMat *simulate();

    // Prix d'une option sur les trajectoires courantes (simulees au premier appel).
    // La maturite de l'option doit etre celle des parametres.
    PricingResult price(const Option &opt);

    // Actualisation et statistiques d'un vecteur de payoffs deja calcule
    PricingResult aggregate(const PnlVect *payoffs) const;

    void print() const;

private:
    void init();
};

std::ostream &operator<<(std::ostream &os, const PricingResult &res);
