#include "PricingReport.hpp"
#include <memory>
#include "BasketOption.hpp"
#include "OptionFactory.hpp"
#include "PricingErrors.hpp"
#include "json_reader.hpp"

std::map<std::string, PricingResult> priceAll(BlackScholesPricer &pricer, const nlohmann::json &jsonParams)
{
    std::map<std::string, PricingResult> results;
    std::vector<std::string> types = payoffTypes();
    for (size_t i = 0; i < types.size(); i++) {
        if (types[i] == "Barrier" && !jsonParams.contains("Barrier")) {
            continue;
        }
        std::unique_ptr<Option> opt(createOption(types[i], pricer.params, jsonParams));
        results[types[i]] = pricer.price(*opt);
    }
    return results;
}

std::vector<std::string> basketComponents(const nlohmann::json &jsonParams,
                                          const std::map<std::string, PricingResult> &results)
{
    std::vector<std::string> components;
    if (jsonParams.contains("BasketComponents")) {
        components = jsonParams.at("BasketComponents").get<std::vector<std::string>>();
    } else if (results.count("Barrier")) {
        components = {"Asian", "Barrier"};
    }
    return components;
}

double priceBasket(const nlohmann::json &jsonParams, const std::vector<std::string> &components,
                   const std::map<std::string, PricingResult> &results)
{
    std::vector<PricingResult> priced;
    for (size_t i = 0; i < components.size(); i++) {
        std::map<std::string, PricingResult>::const_iterator it = results.find(components[i]);
        if (it == results.end()) {
            throw ValidationError("Basket component " + components[i] + " was not priced");
        }
        priced.push_back(it->second);
    }

    PnlVect *weights;
    if (jsonParams.contains("BasketWeights")) {
        jsonParams.at("BasketWeights").get_to(weights);
    } else {
        weights = pnl_vect_create_from_scalar(static_cast<int>(components.size()),
                                              1.0 / components.size());
    }

    double price;
    try {
        BasketOption basket(weights);
        price = basket.price(priced);
    } catch (...) {
        pnl_vect_free(&weights);
        throw;
    }
    pnl_vect_free(&weights);
    return price;
}

void rangeBounds(const nlohmann::json &jsonParams, const SimulationParameters &params,
                 double &low, double &high)
{
    low = params.spot * 0.95;
    high = params.spot * 1.15;
    if (jsonParams.contains("RangeBounds")) {
        std::vector<double> bounds = jsonParams.at("RangeBounds").get<std::vector<double>>();
        if (bounds.size() != 2) {
            throw ValidationError("RangeBounds must hold exactly 2 values");
        }
        low = bounds[0];
        high = bounds[1];
    }
}
