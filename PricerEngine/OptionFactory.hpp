#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "Option.hpp"
#include "SimulationParameters.hpp"

// Construit l'option decrite par payoffType ; l'appelant libere avec delete.
// Le type Barrier lit le bloc "Barrier" de jsonParams.
Option *createOption(const std::string &payoffType, const SimulationParameters &params,
                     const nlohmann::json &jsonParams);

// Types reconnus par createOption, dans l'ordre d'affichage
std::vector<std::string> payoffTypes();
