#include "OptionFactory.hpp"
#include "AsianOption.hpp"
#include "BarrierOption.hpp"
#include "BinaryOption.hpp"
#include "ChooserOption.hpp"
#include "EuropeanOption.hpp"
#include "LookbackOption.hpp"
#include "PricingErrors.hpp"

Option *createOption(const std::string &payoffType, const SimulationParameters &params,
                     const nlohmann::json &jsonParams)
{
    const double T = params.maturity;
    const int M = params.nbTimeSteps;
    const double K = params.strike;

    if (payoffType == "Asian") {
        return new AsianOption(T, M, K);
    } else if (payoffType == "LookbackCall") {
        return new LookbackOption(T, M, K, CallPut::Call);
    } else if (payoffType == "LookbackPut") {
        return new LookbackOption(T, M, K, CallPut::Put);
    } else if (payoffType == "Barrier") {
        if (!jsonParams.contains("Barrier")) {
            throw ValidationError("PayoffType Barrier needs a \"Barrier\" block with a Level");
        }
        BarrierSpec spec = jsonParams.at("Barrier").get<BarrierSpec>();
        return new BarrierOption(T, M, K, spec);
    } else if (payoffType == "Binary") {
        return new BinaryOption(T, M, K, BinaryMonitoring::PathAverage);
    } else if (payoffType == "BinaryTerminal") {
        return new BinaryOption(T, M, K, BinaryMonitoring::Terminal);
    } else if (payoffType == "Chooser") {
        return new ChooserOption(T, M, K);
    } else if (payoffType == "EuropeanCall") {
        return new EuropeanOption(T, M, K, CallPut::Call);
    } else if (payoffType == "EuropeanPut") {
        return new EuropeanOption(T, M, K, CallPut::Put);
    }
    throw ValidationError("Unknown PayoffType: " + payoffType);
}

std::vector<std::string> payoffTypes()
{
    return {"Asian", "LookbackCall", "LookbackPut", "Barrier", "Binary",
            "BinaryTerminal", "Chooser", "EuropeanCall", "EuropeanPut"};
}
