#include "Option.hpp"
#include "PricingErrors.hpp"
#include <sstream>

Option::Option(double T_, int nbTimeSteps_, double strike_)
{
    T = T_;
    nbTimeSteps = nbTimeSteps_;
    strike = strike_;
}

Option::~Option()
{
}

void Option::checkPath(const PnlMat *path) const
{
    if (path == NULL || path->m < 1 || path->n != nbTimeSteps) {
        std::ostringstream err;
        err << name() << ": path matrix must have at least one row and " << nbTimeSteps << " columns";
        if (path != NULL) {
            err << " (got " << path->m << "x" << path->n << ")";
        }
        throw ValidationError(err.str());
    }
}
