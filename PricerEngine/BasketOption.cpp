#include "BasketOption.hpp"
#include "PricingErrors.hpp"
#include <cmath>
#include <sstream>

BasketOption::BasketOption(const PnlVect *weights_)
{
    if (weights_ == NULL || weights_->size < 2) {
        throw ValidationError("A basket needs at least 2 weighted components");
    }
    for (int i = 0; i < weights_->size; i++) {
        if (!std::isfinite(GET(weights_, i))) {
            std::ostringstream err;
            err << "Basket weight " << i << " is not finite";
            throw ValidationError(err.str());
        }
    }
    weights = pnl_vect_copy(weights_);
}

BasketOption::~BasketOption()
{
    pnl_vect_free(&weights);
}

double BasketOption::price(const std::vector<PricingResult> &components) const
{
    if (static_cast<int>(components.size()) != weights->size) {
        std::ostringstream err;
        err << "Basket expects " << weights->size << " component prices (got " << components.size() << ")";
        throw ValidationError(err.str());
    }

    double res = 0.0;
    for (int i = 0; i < weights->size; i++) {
        res += GET(weights, i) * components[i].price;
    }
    return res;
}
