#include "SimulationParameters.hpp"
#include "PricingErrors.hpp"
#include <cmath>
#include <sstream>

void from_json(const nlohmann::json &j, VarianceConvention &convention)
{
    std::string name = j.get<std::string>();
    if (name == "DiscountedCenter") {
        convention = VarianceConvention::DiscountedCenter;
    } else if (name == "Discounted") {
        convention = VarianceConvention::Discounted;
    } else {
        throw ValidationError("Unknown VarianceConvention: " + name);
    }
}

std::string toString(VarianceConvention convention)
{
    return convention == VarianceConvention::Discounted ? "Discounted" : "DiscountedCenter";
}

SimulationParameters::SimulationParameters(double spot_, double strike_, double maturity_, double interestRate_,
                                           double volatility_, int nSamples_, int nbTimeSteps_, unsigned long seed_,
                                           VarianceConvention varianceConvention_)
    : spot(spot_), strike(strike_), maturity(maturity_), interestRate(interestRate_),
      volatility(volatility_), nSamples(nSamples_), nbTimeSteps(nbTimeSteps_), seed(seed_),
      varianceConvention(varianceConvention_)
{
    validate();
}

SimulationParameters::SimulationParameters(const nlohmann::json &jsonParams)
    : seed(0), varianceConvention(VarianceConvention::DiscountedCenter)
{
    jsonParams.at("Spot").get_to(spot);
    jsonParams.at("Strike").get_to(strike);
    jsonParams.at("Maturity").get_to(maturity);
    jsonParams.at("InterestRate").get_to(interestRate);
    jsonParams.at("Volatility").get_to(volatility);
    jsonParams.at("SampleNb").get_to(nSamples);
    jsonParams.at("TimeStepNb").get_to(nbTimeSteps);
    if (jsonParams.contains("Seed")) {
        jsonParams.at("Seed").get_to(seed);
    }
    if (jsonParams.contains("VarianceConvention")) {
        jsonParams.at("VarianceConvention").get_to(varianceConvention);
    }
    validate();
}

double SimulationParameters::timeStep() const
{
    return maturity / nbTimeSteps;
}

double SimulationParameters::discountFactor() const
{
    return std::exp(-interestRate * maturity);
}

void SimulationParameters::validate() const
{
    std::ostringstream err;
    if (!(std::isfinite(spot) && spot > 0.0)) {
        err << "Spot must be > 0 (got " << spot << ")";
    } else if (!(std::isfinite(strike) && strike > 0.0)) {
        err << "Strike must be > 0 (got " << strike << ")";
    } else if (!(std::isfinite(maturity) && maturity > 0.0)) {
        err << "Maturity must be > 0 (got " << maturity << ")";
    } else if (!std::isfinite(interestRate)) {
        err << "InterestRate must be finite";
    } else if (!(std::isfinite(volatility) && volatility >= 0.0)) {
        err << "Volatility must be >= 0 (got " << volatility << ")";
    } else if (nSamples <= 0) {
        err << "SampleNb must be > 0 (got " << nSamples << ")";
    } else if (nbTimeSteps <= 0) {
        err << "TimeStepNb must be > 0 (got " << nbTimeSteps << ")";
    }
    if (!err.str().empty()) {
        throw ValidationError(err.str());
    }
}
