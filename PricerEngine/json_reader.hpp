#pragma once

#include <nlohmann/json.hpp>
#include "pnl/pnl_vector.h"

// Lecture d'un tableau JSON de reels dans un PnlVect alloue ici (a liberer par l'appelant)
void from_json(const nlohmann::json &j, PnlVect *&vect);
