#include "ChooserOption.hpp"
#include <algorithm>

ChooserOption::ChooserOption(double T_, int nbTimeSteps_, double strike_)
    : Option(T_, nbTimeSteps_, strike_),
      call(T_, nbTimeSteps_, strike_, CallPut::Call),
      put(T_, nbTimeSteps_, strike_, CallPut::Put)
{
}

ChooserOption::~ChooserOption()
{
}

CallPut ChooserOption::evaluateLegs(const PnlMat *path, PnlVect *callPayoffs, PnlVect *putPayoffs) const
{
    call.payoff(path, callPayoffs);
    put.payoff(path, putPayoffs);
    // En cas d'egalite on garde le call
    return (pnl_vect_sum(callPayoffs) >= pnl_vect_sum(putPayoffs)) ? CallPut::Call : CallPut::Put;
}

void ChooserOption::payoff(const PnlMat *path, PnlVect *payoffs) const
{
    checkPath(path);

    PnlVect *putPayoffs = pnl_vect_create(0);
    if (evaluateLegs(path, payoffs, putPayoffs) == CallPut::Put)
    {
        pnl_vect_clone(payoffs, putPayoffs);
    }
    pnl_vect_free(&putPayoffs);
}

CallPut ChooserOption::chosenLeg(const PnlMat *path) const
{
    checkPath(path);

    PnlVect *callPayoffs = pnl_vect_create(0);
    PnlVect *putPayoffs = pnl_vect_create(0);
    CallPut leg = evaluateLegs(path, callPayoffs, putPayoffs);
    pnl_vect_free(&callPayoffs);
    pnl_vect_free(&putPayoffs);
    return leg;
}

double ChooserOption::undiscountedPrice(const PnlMat *path) const
{
    checkPath(path);

    PnlVect *callPayoffs = pnl_vect_create(0);
    PnlVect *putPayoffs = pnl_vect_create(0);
    evaluateLegs(path, callPayoffs, putPayoffs);
    double price = std::max(pnl_vect_sum(callPayoffs), pnl_vect_sum(putPayoffs)) / path->m;
    pnl_vect_free(&callPayoffs);
    pnl_vect_free(&putPayoffs);
    return price;
}

std::string ChooserOption::name() const
{
    return "Chooser";
}
