#pragma once

#include <vector>
#include "pnl/pnl_vector.h"
#include "pricer.hpp"

// Panier : combinaison lineaire figee de prix deja calcules (pas de diffusion jointe)
class BasketOption
{
public:
    PnlVect *weights;

    explicit BasketOption(const PnlVect *weights_);
    ~BasketOption();
    BasketOption(const BasketOption &) = delete;
    BasketOption &operator=(const BasketOption &) = delete;

    double price(const std::vector<PricingResult> &components) const;
};
