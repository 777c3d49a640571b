#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pricer.hpp"

// Prix de toutes les variantes connues sur les trajectoires du pricer.
// Barrier n'est price que si jsonParams contient un bloc "Barrier".
std::map<std::string, PricingResult> priceAll(BlackScholesPricer &pricer, const nlohmann::json &jsonParams);

// Composantes du panier : "BasketComponents", sinon Asian + Barrier si la barriere a ete pricee
std::vector<std::string> basketComponents(const nlohmann::json &jsonParams,
                                          const std::map<std::string, PricingResult> &results);

// Prix du panier ; poids "BasketWeights" ou equipondere
double priceBasket(const nlohmann::json &jsonParams, const std::vector<std::string> &components,
                   const std::map<std::string, PricingResult> &results);

// Bornes "RangeBounds", sinon [0.95 * spot, 1.15 * spot]
void rangeBounds(const nlohmann::json &jsonParams, const SimulationParameters &params,
                 double &low, double &high);
