#pragma once

#include "SimulationParameters.hpp"

// Fonction de repartition de la loi normale centree reduite
double normCdf(double x);

// Prix Black-Scholes fermes d'un call / put europeen (sans dividende)
double bsCall(const SimulationParameters &params);
double bsPut(const SimulationParameters &params);
