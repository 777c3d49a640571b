#ifndef SIMULATION_PARAMETERS_HPP
#define SIMULATION_PARAMETERS_HPP

#include <nlohmann/json.hpp>
#include <string>

/// Centre utilise pour la variance empirique des payoffs
enum class VarianceConvention
{
    DiscountedCenter, /// payoffs non actualises centres sur le prix actualise (historique)
    Discounted        /// payoffs actualises centres sur le prix actualise
};

void from_json(const nlohmann::json &j, VarianceConvention &convention);
std::string toString(VarianceConvention convention);

class SimulationParameters
{
public:
    double spot;          /// Prix initial du sous-jacent
    double strike;        /// Prix d'exercice
    double maturity;      /// Maturite en annees
    double interestRate;  /// Taux sans risque
    double volatility;    /// Volatilite
    int nSamples;         /// Nombre de simulations Monte Carlo (N)
    int nbTimeSteps;      /// Nombre de pas de temps (M)
    unsigned long seed;   /// Graine du generateur, 0 => horloge
    VarianceConvention varianceConvention;

    SimulationParameters(double spot_, double strike_, double maturity_, double interestRate_,
                         double volatility_, int nSamples_, int nbTimeSteps_, unsigned long seed_ = 0,
                         VarianceConvention varianceConvention_ = VarianceConvention::DiscountedCenter);
    explicit SimulationParameters(const nlohmann::json &jsonParams);

    double timeStep() const;
    double discountFactor() const;

    // Leve ValidationError si un parametre est hors domaine
    void validate() const;
};
#endif
